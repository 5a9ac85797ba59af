#include "core/WhoisClient.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <ctime>
#include <sstream>
#include <utility>
#include <vector>

#include <poll.h>
#include <sys/socket.h>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/TimeUtils.hpp"
#include "core/TcpConnector.hpp"

namespace certmon::core {

namespace {

constexpr int kWhoisPort = 43;
constexpr size_t kMaxResponseBytes = 1 << 20;

constexpr std::array<const char*, 12> kExpiryKeys = {
    "registry expiry date",
    "registrar registration expiration date",
    "expiration date",
    "expiry date",
    "expiration time",
    "expire date",
    "expires on",
    "expires",
    "paid-till",
    "valid until",
    "record expires on",
    "expire",
};

constexpr std::array<const char*, 3> kReferralKeys = {
    "refer",
    "whois",
    "registrar whois server",
};

std::string trim(const std::string& sValue) {
  const auto itBegin = std::find_if_not(sValue.begin(), sValue.end(),
                                        [](unsigned char c) { return std::isspace(c); });
  const auto itEnd = std::find_if_not(sValue.rbegin(), sValue.rend(), [](unsigned char c) {
                       return std::isspace(c);
                     }).base();
  return itBegin < itEnd ? std::string(itBegin, itEnd) : std::string{};
}

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

/// Value of the first "key: value" line whose key equals one of aKeys
/// (case-insensitive), keys tried in priority order.
template <size_t N>
std::optional<std::string> findField(const std::string& sRaw,
                                     const std::array<const char*, N>& aKeys) {
  std::vector<std::pair<std::string, std::string>> vFields;
  std::istringstream iss(sRaw);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    const size_t uColon = sLine.find(':');
    if (uColon == std::string::npos) continue;
    std::string sValue = trim(sLine.substr(uColon + 1));
    if (sValue.empty()) continue;
    vFields.emplace_back(toLower(trim(sLine.substr(0, uColon))), std::move(sValue));
  }

  for (const char* pKey : aKeys) {
    for (const auto& [sKey, sValue] : vFields) {
      if (sKey == pKey) return sValue;
    }
  }
  return std::nullopt;
}

std::optional<common::SysTime> parseWithLayout(const std::string& sValue, const char* pLayout) {
  std::tm tmValue{};
  const char* pEnd = strptime(sValue.c_str(), pLayout, &tmValue);
  if (pEnd == nullptr || *pEnd != '\0') return std::nullopt;
  return common::makeUtc(tmValue.tm_year + 1900, tmValue.tm_mon + 1, tmValue.tm_mday,
                         tmValue.tm_hour, tmValue.tm_min, tmValue.tm_sec);
}

}  // namespace

WhoisClient::WhoisClient(std::chrono::milliseconds durTimeout, std::string sRootServer)
    : _durTimeout(durTimeout), _sRootServer(std::move(sRootServer)) {}

WhoisClient::~WhoisClient() = default;

std::optional<std::string> WhoisClient::parseReferral(const std::string& sRaw) {
  auto oServer = findField(sRaw, kReferralKeys);
  if (!oServer) return std::nullopt;

  std::string sServer = *oServer;
  for (const char* pScheme : {"whois://", "rwhois://", "http://", "https://"}) {
    if (toLower(sServer).starts_with(pScheme)) {
      sServer = sServer.substr(std::char_traits<char>::length(pScheme));
      break;
    }
  }
  while (!sServer.empty() && sServer.back() == '/') sServer.pop_back();
  if (sServer.empty()) return std::nullopt;
  return sServer;
}

std::optional<std::string> WhoisClient::parseExpiryField(const std::string& sRaw) {
  return findField(sRaw, kExpiryKeys);
}

std::optional<common::SysTime> WhoisClient::parseWhoisDate(const std::string& sValue) {
  std::string sDate = sValue;
  if (const size_t uParen = sDate.find(" ("); uParen != std::string::npos) {
    sDate = sDate.substr(0, uParen);
  }
  sDate = trim(sDate);
  if (sDate.empty()) return std::nullopt;

  // Covers "YYYY-MM-DD HH:MM:SS", the Z forms, fractional seconds and offsets
  if (auto oTp = common::parseIso8601(sDate)) return oTp;

  for (const char* pLayout : {"%Y-%m-%d", "%d-%b-%Y", "%Y.%m.%d"}) {
    if (auto oTp = parseWithLayout(sDate, pLayout)) return oTp;
  }
  return std::nullopt;
}

common::SysTime WhoisClient::lookupExpiry(const std::string& sDomain,
                                          const common::RunContext& rcCtx) {
  std::vector<std::string> vResponses;
  vResponses.push_back(query(_sRootServer, sDomain, rcCtx));

  // root -> registry -> registrar
  std::string sLastServer = _sRootServer;
  for (int iHop = 0; iHop < 2; ++iHop) {
    const auto oNext = parseReferral(vResponses.back());
    if (!oNext || toLower(*oNext) == toLower(sLastServer)) break;
    try {
      vResponses.push_back(query(*oNext, sDomain, rcCtx));
      sLastServer = *oNext;
    } catch (const common::RegistrationLookupError& e) {
      if (iHop == 0) throw;
      common::Logger::get()->debug("Registrar WHOIS {} failed for {}: {}", *oNext, sDomain,
                                   e.what());
      break;
    }
  }

  for (auto it = vResponses.rbegin(); it != vResponses.rend(); ++it) {
    const auto oField = parseExpiryField(*it);
    if (!oField) continue;
    if (auto oTp = parseWhoisDate(*oField)) return *oTp;
    common::Logger::get()->warn("WHOIS date parse failed for {}: '{}'", sDomain, *oField);
    throw common::RegistrationLookupError("whois_bad_date", "date parse failed: " + *oField);
  }
  throw common::RegistrationLookupError("whois_no_expiry",
                                        "no expiration date found for " + sDomain);
}

std::string WhoisClient::query(const std::string& sServer, const std::string& sDomain,
                               const common::RunContext& rcCtx) {
  const auto rcQuery = rcCtx.withTimeout(_durTimeout);

  Socket sock;
  try {
    sock = connectTcp(sServer, kWhoisPort, _durTimeout, rcQuery);
  } catch (const common::ConnectionError& e) {
    throw common::RegistrationLookupError("whois_unreachable", e.what());
  }

  const std::string sRequest = sDomain + "\r\n";
  size_t uSent = 0;
  while (uSent < sRequest.size()) {
    if (!waitFd(sock.fd(), POLLOUT, rcQuery.deadline(), rcQuery)) {
      throw common::RegistrationLookupError("whois_timeout", "whois " + sServer + ": i/o timeout");
    }
    const ssize_t iRc =
        ::send(sock.fd(), sRequest.data() + uSent, sRequest.size() - uSent, MSG_NOSIGNAL);
    if (iRc < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      throw common::RegistrationLookupError("whois_send_failed", "whois " + sServer + ": send failed");
    }
    uSent += static_cast<size_t>(iRc);
  }

  std::string sResponse;
  char szBuf[4096];
  while (sResponse.size() < kMaxResponseBytes) {
    if (!waitFd(sock.fd(), POLLIN, rcQuery.deadline(), rcQuery)) {
      throw common::RegistrationLookupError("whois_timeout", "whois " + sServer + ": i/o timeout");
    }
    const ssize_t iRc = ::recv(sock.fd(), szBuf, sizeof(szBuf), 0);
    if (iRc == 0) break;
    if (iRc < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      throw common::RegistrationLookupError("whois_recv_failed", "whois " + sServer + ": read failed");
    }
    sResponse.append(szBuf, static_cast<size_t>(iRc));
  }
  return sResponse;
}

}  // namespace certmon::core
