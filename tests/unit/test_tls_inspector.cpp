#include "core/TlsInspector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstring>
#include <ctime>
#include <memory>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"

using certmon::common::makeUtc;
using certmon::core::OpenSslTlsInspector;
using namespace std::chrono_literals;

namespace {

struct X509Deleter {
  void operator()(X509* p) const { X509_free(p); }
};
struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};

/// Self-signed leaf with the given issuer fields and DNS SANs.
std::unique_ptr<X509, X509Deleter> makeCertificate(const char* pIssuerCn, const char* pIssuerOrg,
                                                   const char* pSans) {
  std::unique_ptr<EVP_PKEY, PkeyDeleter> upKey(EVP_EC_gen("P-256"));
  std::unique_ptr<X509, X509Deleter> upCert(X509_new());
  X509_set_version(upCert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(upCert.get()), 1);

  const auto tNotBefore = std::chrono::system_clock::to_time_t(makeUtc(2026, 1, 1));
  const auto tNotAfter = std::chrono::system_clock::to_time_t(makeUtc(2026, 4, 1, 12, 0, 0));
  ASN1_TIME_set(X509_getm_notBefore(upCert.get()), tNotBefore);
  ASN1_TIME_set(X509_getm_notAfter(upCert.get()), tNotAfter);

  X509_NAME* pName = X509_get_subject_name(upCert.get());
  if (pIssuerOrg != nullptr) {
    X509_NAME_add_entry_by_txt(pName, "O", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(pIssuerOrg), -1, -1, 0);
  }
  if (pIssuerCn != nullptr) {
    X509_NAME_add_entry_by_txt(pName, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(pIssuerCn), -1, -1, 0);
  }
  X509_set_issuer_name(upCert.get(), pName);
  X509_set_pubkey(upCert.get(), upKey.get());

  if (pSans != nullptr) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, upCert.get(), upCert.get(), nullptr, nullptr, 0);
    X509_EXTENSION* pExt = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, pSans);
    X509_add_ext(upCert.get(), pExt, -1);
    X509_EXTENSION_free(pExt);
  }

  X509_sign(upCert.get(), upKey.get(), EVP_sha256());
  return upCert;
}

}  // namespace

TEST(TlsInspectorTest, ParsesIssuerValidityAndSans) {
  auto upCert = makeCertificate("Test Issuing CA", "Test Org",
                                "DNS:a.example.com,DNS:*.example.net");

  const auto ci = OpenSslTlsInspector::parseCertificate(upCert.get(), "a.example.com");

  EXPECT_EQ(ci.sIssuer, "Test Issuing CA");
  EXPECT_EQ(ci.tpNotBefore, makeUtc(2026, 1, 1));
  EXPECT_EQ(ci.tpNotAfter, makeUtc(2026, 4, 1, 12, 0, 0));
  ASSERT_EQ(ci.vSans.size(), 2u);
  EXPECT_EQ(ci.vSans[1], "*.example.net");
  EXPECT_TRUE(ci.bIsMatch);
  EXPECT_TRUE(ci.sTlsVersion.empty());
}

TEST(TlsInspectorTest, IssuerFallsBackToOrganization) {
  auto upCert = makeCertificate(nullptr, "Only Org", "DNS:a.example.com");
  EXPECT_EQ(OpenSslTlsInspector::parseCertificate(upCert.get(), "a.example.com").sIssuer,
            "Only Org");
}

TEST(TlsInspectorTest, WildcardMatchesOneLabelOnly) {
  auto upCert = makeCertificate("CA", nullptr, "DNS:*.example.net");
  EXPECT_TRUE(OpenSslTlsInspector::parseCertificate(upCert.get(), "www.example.net").bIsMatch);
  EXPECT_FALSE(OpenSslTlsInspector::parseCertificate(upCert.get(), "a.b.example.net").bIsMatch);
  EXPECT_FALSE(OpenSslTlsInspector::parseCertificate(upCert.get(), "example.org").bIsMatch);
}

TEST(TlsInspectorTest, VersionNames) {
  EXPECT_EQ(OpenSslTlsInspector::tlsVersionName(TLS1_2_VERSION), "TLS 1.2");
  EXPECT_EQ(OpenSslTlsInspector::tlsVersionName(TLS1_3_VERSION), "TLS 1.3");
  EXPECT_EQ(OpenSslTlsInspector::tlsVersionName(0), "Unknown");
}

TEST(TlsInspectorTest, ClosedPortIsConnectionError) {
  OpenSslTlsInspector oti(2s);
  EXPECT_THROW(oti.inspect("127.0.0.1", 1, certmon::common::RunContext()),
               certmon::common::ConnectionError);
}
