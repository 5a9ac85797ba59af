#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "common/RunContext.hpp"
#include "common/Types.hpp"

namespace certmon::core {

/// Tuning for one NetworkProber. Built from Config at startup.
/// Class abbreviation: pcfg
struct ProberConfig {
  std::chrono::milliseconds durProbeTimeout{60000};
  std::chrono::milliseconds durDialTimeout{15000};
  int iRetryAttempts = 3;
  std::chrono::milliseconds durRetryBackoff{5000};
  int iWhoisRefreshDays = 60;
  std::chrono::milliseconds durHttpMinRemaining{2000};
  std::chrono::milliseconds durHttpCeiling{15000};
};

/// Class abbreviation: da
struct DnsAnswer {
  std::vector<std::string> vAddresses;
  std::string sCanonicalName;  // empty when the host has no CNAME
};

/// Resolves a hostname to its address set and canonical alias.
/// Throws common::ConnectionError when the name does not resolve.
class IDnsResolver {
 public:
  virtual ~IDnsResolver() = default;
  virtual DnsAnswer resolve(const std::string& sHostname, const common::RunContext& rcCtx) = 0;
};

/// Leaf certificate as presented by the server.
/// Class abbreviation: ci
struct CertificateInfo {
  std::string sIssuer;
  common::SysTime tpNotBefore{};
  common::SysTime tpNotAfter{};
  std::vector<std::string> vSans;
  std::string sTlsVersion;
  bool bIsMatch = false;
};

/// Performs one TLS handshake without certificate verification.
/// Throws common::ConnectionError on dial or handshake failure.
class ITlsInspector {
 public:
  virtual ~ITlsInspector() = default;
  virtual CertificateInfo inspect(const std::string& sHostname, int iPort,
                                  const common::RunContext& rcCtx) = 0;
};

/// Class abbreviation: hpr
struct HttpProbeResult {
  int iStatusCode = 0;
  std::chrono::milliseconds durLatency{0};
};

/// One HTTPS GET against the host. Throws common::ConnectionError.
class IHttpProbe {
 public:
  virtual ~IHttpProbe() = default;
  virtual HttpProbeResult probe(const std::string& sHostname, int iPort,
                                const common::RunContext& rcCtx) = 0;
};

/// Registration authority lookup. Throws common::RegistrationLookupError.
class IRegistrationLookup {
 public:
  virtual ~IRegistrationLookup() = default;
  virtual common::SysTime lookupExpiry(const std::string& sDomain,
                                       const common::RunContext& rcCtx) = 0;
};

/// Class abbreviation: ri
struct RegistrationInfo {
  std::optional<common::SysTime> oExpiry;
  int iDaysLeft = 0;
};

/// Observation seam used by the reconciler. Never touches persisted state.
class IProber {
 public:
  virtual ~IProber() = default;

  /// DNS, TLS (with retry), then best-effort HTTP. Network failures come back
  /// as status + error message on the returned host, never as exceptions.
  virtual common::MonitoredHost probe(const std::string& sHostname, int iPort,
                                      const common::RunContext& rcCtx) = 0;

  /// Re-query the registration authority only when oPriorExpiry is unknown or
  /// iPriorDaysLeft is under the refresh threshold; otherwise recompute days
  /// left from the cached expiry. A failed lookup returns the prior values.
  virtual RegistrationInfo cachedRegistrationLookup(const std::string& sDomain,
                                                    std::optional<common::SysTime> oPriorExpiry,
                                                    int iPriorDaysLeft,
                                                    const common::RunContext& rcCtx) = 0;

  /// One-off probe plus a forced registration lookup.
  virtual common::MonitoredHost inspect(const std::string& sHostname, int iPort,
                                        const common::RunContext& rcCtx) = 0;
};

/// IProber over the four network collaborators.
/// Class abbreviation: np
class NetworkProber : public IProber {
 public:
  NetworkProber(ProberConfig pcfg, std::shared_ptr<IDnsResolver> spDns,
                std::shared_ptr<ITlsInspector> spTls, std::shared_ptr<IHttpProbe> spHttp,
                std::shared_ptr<IRegistrationLookup> spWhois);
  ~NetworkProber() override;

  common::MonitoredHost probe(const std::string& sHostname, int iPort,
                              const common::RunContext& rcCtx) override;
  RegistrationInfo cachedRegistrationLookup(const std::string& sDomain,
                                            std::optional<common::SysTime> oPriorExpiry,
                                            int iPriorDaysLeft,
                                            const common::RunContext& rcCtx) override;
  common::MonitoredHost inspect(const std::string& sHostname, int iPort,
                                const common::RunContext& rcCtx) override;

 private:
  ProberConfig _pcfg;
  std::shared_ptr<IDnsResolver> _spDns;
  std::shared_ptr<ITlsInspector> _spTls;
  std::shared_ptr<IHttpProbe> _spHttp;
  std::shared_ptr<IRegistrationLookup> _spWhois;
};

/// Run fnOp up to iAttempts times. Attempt k (0-based) is followed by a sleep of
/// durBackoff * 2^k, except after the last one. Rethrows the last
/// ConnectionError; throws ConnectionError("probe_cancelled") if rcCtx finishes.
template <typename Fn>
void withRetry(int iAttempts, std::chrono::milliseconds durBackoff,
               const common::RunContext& rcCtx, Fn&& fnOp) {
  for (int i = 0; i < iAttempts; ++i) {
    if (rcCtx.done()) {
      throw common::ConnectionError("probe_cancelled", "i/o timeout: probe cancelled");
    }
    try {
      fnOp();
      return;
    } catch (const common::ConnectionError&) {
      if (i == iAttempts - 1) throw;
    }
    if (!rcCtx.sleepFor(durBackoff * (1LL << i))) {
      throw common::ConnectionError("probe_cancelled", "i/o timeout: probe cancelled");
    }
  }
}

/// Map a raw dial/handshake message onto the fixed vocabulary:
/// "Connection timeout", "Connection refused", "Connection reset",
/// "TLS handshake failure", "DNS resolution failed (no such host)", else the raw text.
std::string classifyConnectionError(const std::string& sRawMessage);

/// Registrable domain heuristic: last two labels, three under a generic
/// second level of a two-letter TLD ("example.co.uk").
std::string registrableDomain(const std::string& sHostname);

}  // namespace certmon::core
