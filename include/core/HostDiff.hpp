#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace certmon::core {

/// True when mhNew carries a certificate expiring more than 24h after the one
/// recorded in mhPrior. False when either expiry is unknown.
bool isRenewal(const common::MonitoredHost& mhPrior, const common::MonitoredHost& mhNew);

/// Lines describing what a probe cycle changed, in display order:
/// renewal, status, provider target/type, proxy, new error message.
/// Entering connection_error is not reported here; the alert path owns it.
std::vector<std::string> computeStateChanges(const common::MonitoredHost& mhPrior,
                                             const common::MonitoredHost& mhNew);

/// Provider configuration drift only (target, record type, proxy flag).
std::vector<std::string> computeConfigChanges(const common::MonitoredHost& mhPrior,
                                              const common::MonitoredHost& mhNew);

/// True if any provider-owned field differs between the two records.
bool providerFieldsDiffer(const common::MonitoredHost& mhPrior,
                          const common::MonitoredHost& mhNew);

}  // namespace certmon::core
