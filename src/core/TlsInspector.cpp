#include "core/TlsInspector.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <poll.h>

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"
#include "core/TcpConnector.hpp"

namespace certmon::core {

namespace {

struct SslDeleter {
  void operator()(SSL* p) const { SSL_free(p); }
};

struct X509Deleter {
  void operator()(X509* p) const { X509_free(p); }
};

struct GeneralNamesDeleter {
  void operator()(GENERAL_NAMES* p) const { GENERAL_NAMES_free(p); }
};

std::string lastSslError() {
  const unsigned long ulErr = ERR_get_error();
  if (ulErr == 0) return "unknown error";
  char szBuf[256] = {};
  ERR_error_string_n(ulErr, szBuf, sizeof(szBuf));
  return szBuf;
}

std::string asn1ToUtf8(const ASN1_STRING* pValue) {
  unsigned char* pUtf8 = nullptr;
  const int iLen = ASN1_STRING_to_UTF8(&pUtf8, pValue);
  if (iLen < 0 || pUtf8 == nullptr) return {};
  std::string sOut(reinterpret_cast<const char*>(pUtf8), static_cast<size_t>(iLen));
  OPENSSL_free(pUtf8);
  return sOut;
}

std::string nameEntry(const X509_NAME* pName, int iNid) {
  const int iIndex = X509_NAME_get_index_by_NID(pName, iNid, -1);
  if (iIndex < 0) return {};
  const X509_NAME_ENTRY* pEntry = X509_NAME_get_entry(pName, iIndex);
  return asn1ToUtf8(X509_NAME_ENTRY_get_data(pEntry));
}

common::SysTime asn1TimeToSysTime(const ASN1_TIME* pTime) {
  std::tm tmValue{};
  if (pTime == nullptr || ASN1_TIME_to_tm(pTime, &tmValue) != 1) {
    throw common::ConnectionError("tls_bad_certificate",
                                  "tls: handshake failure: unreadable validity date");
  }
  return common::makeUtc(tmValue.tm_year + 1900, tmValue.tm_mon + 1, tmValue.tm_mday,
                         tmValue.tm_hour, tmValue.tm_min, tmValue.tm_sec);
}

}  // namespace

OpenSslTlsInspector::OpenSslTlsInspector(std::chrono::milliseconds durStepTimeout)
    : _durStepTimeout(durStepTimeout), _upCtx(SSL_CTX_new(TLS_client_method())) {
  if (!_upCtx) {
    throw std::runtime_error("Failed to create TLS client context: " + lastSslError());
  }
  SSL_CTX_set_verify(_upCtx.get(), SSL_VERIFY_NONE, nullptr);
  SSL_CTX_set_min_proto_version(_upCtx.get(), TLS1_VERSION);
}

OpenSslTlsInspector::~OpenSslTlsInspector() = default;

CertificateInfo OpenSslTlsInspector::inspect(const std::string& sHostname, int iPort,
                                             const common::RunContext& rcCtx) {
  Socket sock = connectTcp(sHostname, iPort, _durStepTimeout, rcCtx);

  ERR_clear_error();
  std::unique_ptr<SSL, SslDeleter> upSsl(SSL_new(_upCtx.get()));
  if (!upSsl) {
    throw common::ConnectionError("tls_setup_failed", "tls: " + lastSslError());
  }
  SSL_set_fd(upSsl.get(), sock.fd());
  SSL_set_tlsext_host_name(upSsl.get(), sHostname.c_str());
  SSL_set_connect_state(upSsl.get());

  const auto tpDeadline = common::RunContext::Clock::now() + _durStepTimeout;
  while (true) {
    const int iRc = SSL_connect(upSsl.get());
    if (iRc == 1) break;

    const int iErr = SSL_get_error(upSsl.get(), iRc);
    short iEvents = 0;
    if (iErr == SSL_ERROR_WANT_READ) {
      iEvents = POLLIN;
    } else if (iErr == SSL_ERROR_WANT_WRITE) {
      iEvents = POLLOUT;
    } else if (iErr == SSL_ERROR_SYSCALL && errno == ECONNRESET) {
      throw common::ConnectionError("tls_reset", "read: connection reset by peer");
    } else {
      throw common::ConnectionError("tls_handshake_failed",
                                    "remote error: tls: handshake failure: " + lastSslError());
    }

    if (!waitFd(sock.fd(), iEvents, tpDeadline, rcCtx)) {
      throw common::ConnectionError("tls_timeout", "tls: handshake i/o timeout");
    }
  }

  std::unique_ptr<X509, X509Deleter> upCert(SSL_get1_peer_certificate(upSsl.get()));
  if (!upCert) {
    throw common::ConnectionError("tls_no_certificate",
                                  "tls: handshake failure: no peer certificate");
  }

  CertificateInfo ci = parseCertificate(upCert.get(), sHostname);
  ci.sTlsVersion = tlsVersionName(SSL_version(upSsl.get()));
  return ci;
}

CertificateInfo OpenSslTlsInspector::parseCertificate(X509* pCert, const std::string& sHostname) {
  CertificateInfo ci;

  const X509_NAME* pIssuer = X509_get_issuer_name(pCert);
  ci.sIssuer = nameEntry(pIssuer, NID_commonName);
  if (ci.sIssuer.empty()) {
    ci.sIssuer = nameEntry(pIssuer, NID_organizationName);
  }

  ci.tpNotBefore = asn1TimeToSysTime(X509_get0_notBefore(pCert));
  ci.tpNotAfter = asn1TimeToSysTime(X509_get0_notAfter(pCert));

  std::unique_ptr<GENERAL_NAMES, GeneralNamesDeleter> upNames(static_cast<GENERAL_NAMES*>(
      X509_get_ext_d2i(pCert, NID_subject_alt_name, nullptr, nullptr)));
  if (upNames) {
    const int iCount = sk_GENERAL_NAME_num(upNames.get());
    for (int i = 0; i < iCount; ++i) {
      const GENERAL_NAME* pName = sk_GENERAL_NAME_value(upNames.get(), i);
      if (pName->type == GEN_DNS) {
        ci.vSans.push_back(asn1ToUtf8(pName->d.dNSName));
      }
    }
  }

  ci.bIsMatch = X509_check_host(pCert, sHostname.c_str(), sHostname.size(), 0, nullptr) == 1;
  return ci;
}

std::string OpenSslTlsInspector::tlsVersionName(int iVersion) {
  switch (iVersion) {
    case TLS1_VERSION:
      return "TLS 1.0";
    case TLS1_1_VERSION:
      return "TLS 1.1";
    case TLS1_2_VERSION:
      return "TLS 1.2";
    case TLS1_3_VERSION:
      return "TLS 1.3";
    default:
      return "Unknown";
  }
}

}  // namespace certmon::core
