#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <openssl/ssl.h>

#include "core/Prober.hpp"

namespace certmon::core {

/// OpenSSL client that completes a handshake with verification disabled and
/// SNI set to the probed host, then reads the leaf certificate.
/// The SSL_CTX is shared by all calls; each call owns its SSL and socket.
/// Class abbreviation: oti
class OpenSslTlsInspector : public ITlsInspector {
 public:
  explicit OpenSslTlsInspector(std::chrono::milliseconds durStepTimeout);
  ~OpenSslTlsInspector() override;

  OpenSslTlsInspector(const OpenSslTlsInspector&) = delete;
  OpenSslTlsInspector& operator=(const OpenSslTlsInspector&) = delete;

  CertificateInfo inspect(const std::string& sHostname, int iPort,
                          const common::RunContext& rcCtx) override;

  /// Issuer (CN, else first O), validity window, DNS SANs and the hostname
  /// match for sHostname. sTlsVersion is left empty.
  static CertificateInfo parseCertificate(X509* pCert, const std::string& sHostname);

  /// TLS1_VERSION .. TLS1_3_VERSION to "TLS 1.0" .. "TLS 1.3"; otherwise "Unknown".
  static std::string tlsVersionName(int iVersion);

 private:
  struct SslCtxDeleter {
    void operator()(SSL_CTX* p) const { SSL_CTX_free(p); }
  };

  std::chrono::milliseconds _durStepTimeout;
  std::unique_ptr<SSL_CTX, SslCtxDeleter> _upCtx;
};

}  // namespace certmon::core
