#include "core/Prober.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>

#include "common/Logger.hpp"
#include "common/TimeUtils.hpp"

namespace certmon::core {

namespace {

constexpr const char* kDnsFailurePrefix = "DNS resolution failed";

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

bool containsAny(const std::string& sHaystack, std::initializer_list<const char*> ilNeedles) {
  return std::any_of(ilNeedles.begin(), ilNeedles.end(), [&](const char* pNeedle) {
    return sHaystack.find(pNeedle) != std::string::npos;
  });
}

std::string joinAddresses(const std::vector<std::string>& vAddresses) {
  std::string sOut;
  for (const auto& sAddr : vAddresses) {
    if (!sOut.empty()) sOut += ", ";
    sOut += sAddr;
  }
  return sOut;
}

int64_t elapsedMs(std::chrono::steady_clock::time_point tpStart) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - tpStart)
      .count();
}

}  // namespace

std::string classifyConnectionError(const std::string& sRawMessage) {
  const std::string sLower = toLower(sRawMessage);
  if (containsAny(sLower, {"no such host", "could not resolve", "name or service not known",
                           "no address associated"})) {
    return std::string(kDnsFailurePrefix) + " (no such host)";
  }
  if (containsAny(sLower, {"timeout", "timed out"})) return "Connection timeout";
  if (containsAny(sLower, {"refused"})) return "Connection refused";
  if (containsAny(sLower, {"reset by peer", "connection reset"})) return "Connection reset";
  if (containsAny(sLower, {"handshake"})) return "TLS handshake failure";
  return sRawMessage;
}

std::string registrableDomain(const std::string& sHostname) {
  std::string sName = toLower(sHostname);
  while (!sName.empty() && sName.back() == '.') sName.pop_back();

  std::vector<std::string> vLabels;
  size_t uStart = 0;
  while (uStart <= sName.size()) {
    const size_t uDot = sName.find('.', uStart);
    const size_t uEnd = uDot == std::string::npos ? sName.size() : uDot;
    if (uEnd > uStart) vLabels.push_back(sName.substr(uStart, uEnd - uStart));
    if (uDot == std::string::npos) break;
    uStart = uDot + 1;
  }
  if (vLabels.size() <= 2) return sName;

  static const std::array<const char*, 7> kGenericSecondLevels = {"co",  "com", "net", "org",
                                                                  "gov", "edu", "ac"};
  const std::string& sTld = vLabels.back();
  const std::string& sSecond = vLabels[vLabels.size() - 2];
  const bool bGeneric =
      sTld.size() == 2 &&
      std::any_of(kGenericSecondLevels.begin(), kGenericSecondLevels.end(),
                  [&](const char* p) { return sSecond == p; });

  const size_t uKeep = bGeneric ? 3 : 2;
  std::string sOut;
  for (size_t i = vLabels.size() - uKeep; i < vLabels.size(); ++i) {
    if (!sOut.empty()) sOut += '.';
    sOut += vLabels[i];
  }
  return sOut;
}

NetworkProber::NetworkProber(ProberConfig pcfg, std::shared_ptr<IDnsResolver> spDns,
                             std::shared_ptr<ITlsInspector> spTls,
                             std::shared_ptr<IHttpProbe> spHttp,
                             std::shared_ptr<IRegistrationLookup> spWhois)
    : _pcfg(pcfg),
      _spDns(std::move(spDns)),
      _spTls(std::move(spTls)),
      _spHttp(std::move(spHttp)),
      _spWhois(std::move(spWhois)) {}

NetworkProber::~NetworkProber() = default;

common::MonitoredHost NetworkProber::probe(const std::string& sHostname, int iPort,
                                           const common::RunContext& rcCtx) {
  const auto rcProbe = rcCtx.withTimeout(_pcfg.durProbeTimeout);

  common::MonitoredHost mh;
  mh.sHostname = sHostname;
  mh.iPort = iPort > 0 ? iPort : 443;
  mh.status = common::HostStatus::Active;
  mh.oLastCheckAt = std::chrono::system_clock::now();

  const auto tpStart = std::chrono::steady_clock::now();

  // Step 1: DNS
  DnsAnswer da;
  try {
    da = _spDns->resolve(sHostname, rcProbe);
  } catch (const common::ConnectionError& e) {
    mh.status = common::HostStatus::Unresolvable;
    mh.sErrorMessage = std::string(kDnsFailurePrefix) + ": " + e.what();
    return mh;
  }
  std::sort(da.vAddresses.begin(), da.vAddresses.end());
  mh.vResolvedIps = da.vAddresses;
  mh.sResolvedRecord = joinAddresses(da.vAddresses);
  if (!da.sCanonicalName.empty() && da.sCanonicalName != sHostname) {
    mh.sResolvedRecord = da.sCanonicalName;
  }

  // Step 2: TLS handshake with retry
  CertificateInfo ci;
  try {
    withRetry(_pcfg.iRetryAttempts, _pcfg.durRetryBackoff, rcProbe,
              [&] { ci = _spTls->inspect(sHostname, mh.iPort, rcProbe); });
  } catch (const common::ConnectionError& e) {
    const std::string sMsg = classifyConnectionError(e.what());
    mh.iLatencyMs = 0;
    mh.sErrorMessage = sMsg;
    mh.iDaysRemaining = 0;
    mh.sIssuer.clear();
    mh.bIsMatch = true;
    mh.status = sMsg.starts_with(kDnsFailurePrefix) ? common::HostStatus::Unresolvable
                                                     : common::HostStatus::ConnectionError;
    return mh;
  }

  // Step 3: certificate fields
  mh.sIssuer = ci.sIssuer;
  mh.oNotBefore = ci.tpNotBefore;
  mh.oNotAfter = ci.tpNotAfter;
  mh.vSans = ci.vSans;
  mh.sTlsVersion = ci.sTlsVersion;
  mh.iDaysRemaining = common::daysUntil(ci.tpNotAfter);
  mh.bIsMatch = ci.bIsMatch;
  if (!ci.bIsMatch) {
    mh.sErrorMessage = "Hostname mismatch";
  }
  mh.status = mh.iDaysRemaining < 0 ? common::HostStatus::Expired : common::HostStatus::Active;
  mh.iLatencyMs = elapsedMs(tpStart);

  // Step 4: HTTP, best effort and only with budget left
  if (rcProbe.remaining() > _pcfg.durHttpMinRemaining) {
    const auto rcHttp = rcProbe.withTimeout(_pcfg.durHttpCeiling);
    try {
      const auto hpr = _spHttp->probe(sHostname, mh.iPort, rcHttp);
      mh.iHttpStatusCode = hpr.iStatusCode;
      mh.iLatencyMs = hpr.durLatency.count();
    } catch (const common::ConnectionError& e) {
      common::Logger::get()->debug("HTTP probe failed for {}: {}", sHostname, e.what());
    }
  }

  return mh;
}

RegistrationInfo NetworkProber::cachedRegistrationLookup(
    const std::string& sDomain, std::optional<common::SysTime> oPriorExpiry, int iPriorDaysLeft,
    const common::RunContext& rcCtx) {
  RegistrationInfo ri{oPriorExpiry, iPriorDaysLeft};

  const bool bQuery = !oPriorExpiry.has_value() || iPriorDaysLeft < _pcfg.iWhoisRefreshDays;
  if (!bQuery) {
    ri.iDaysLeft = common::daysUntil(*oPriorExpiry);
    return ri;
  }

  try {
    const auto tpExpiry = _spWhois->lookupExpiry(sDomain, rcCtx);
    ri.oExpiry = tpExpiry;
    ri.iDaysLeft = common::daysUntil(tpExpiry);
  } catch (const common::RegistrationLookupError& e) {
    common::Logger::get()->debug("WHOIS lookup failed for {}: {}", sDomain, e.what());
  }
  return ri;
}

common::MonitoredHost NetworkProber::inspect(const std::string& sHostname, int iPort,
                                             const common::RunContext& rcCtx) {
  auto mh = probe(sHostname, iPort, rcCtx);

  const std::string sDomain = registrableDomain(sHostname);
  try {
    const auto tpExpiry = _spWhois->lookupExpiry(sDomain, rcCtx);
    mh.oDomainExpiry = tpExpiry;
    mh.iDomainDaysLeft = common::daysUntil(tpExpiry);
  } catch (const common::RegistrationLookupError& e) {
    common::Logger::get()->warn("Inspect WHOIS lookup failed for {}: {}", sDomain, e.what());
  }
  return mh;
}

}  // namespace certmon::core
