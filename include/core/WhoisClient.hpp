#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/Prober.hpp"

namespace certmon::core {

/// WHOIS over TCP/43. Starts at the IANA root server and follows the
/// "refer:" answer to the TLD registry, then a "Registrar WHOIS Server:"
/// answer for thin registries. The most specific response carrying an
/// expiry field wins.
/// Class abbreviation: wc
class WhoisClient : public IRegistrationLookup {
 public:
  explicit WhoisClient(std::chrono::milliseconds durTimeout,
                       std::string sRootServer = "whois.iana.org");
  ~WhoisClient() override;

  common::SysTime lookupExpiry(const std::string& sDomain,
                               const common::RunContext& rcCtx) override;

  /// Next server named by a response ("refer:", "whois:" or
  /// "Registrar WHOIS Server:"), without scheme or trailing slash.
  static std::optional<std::string> parseReferral(const std::string& sRaw);

  /// Value of the first registration-expiry field in a raw response.
  static std::optional<std::string> parseExpiryField(const std::string& sRaw);

  /// Accepts "2006-01-02 15:04:05", "2006-01-02T15:04:05Z", fractional seconds,
  /// RFC 3339 offsets, "2006-01-02", "02-Jan-2006" and "2006.01.02". A trailing
  /// " (...)" annotation is stripped first.
  static std::optional<common::SysTime> parseWhoisDate(const std::string& sValue);

 protected:
  /// Send "sDomain\r\n" to sServer:43 and read until the server closes.
  /// Throws common::RegistrationLookupError.
  virtual std::string query(const std::string& sServer, const std::string& sDomain,
                            const common::RunContext& rcCtx);

 private:
  std::chrono::milliseconds _durTimeout;
  std::string _sRootServer;
};

}  // namespace certmon::core
