#include "core/HostDiff.hpp"

#include <chrono>

#include "common/TimeUtils.hpp"

namespace certmon::core {

namespace {

using common::HostStatus;

std::string proxyLabel(bool bProxied) { return bProxied ? "Proxied" : "DNS Only"; }

std::string targetLine(const common::MonitoredHost& mhPrior, const common::MonitoredHost& mhNew) {
  return "Target: <code>" + mhPrior.sTarget + "</code> ➔ <code>" + mhNew.sTarget + "</code>";
}

std::string typeLine(const common::MonitoredHost& mhPrior, const common::MonitoredHost& mhNew) {
  return "Type: " + mhPrior.sRecordType + " ➔ " + mhNew.sRecordType;
}

std::string proxyLine(const common::MonitoredHost& mhPrior, const common::MonitoredHost& mhNew) {
  return "Proxy: " + proxyLabel(mhPrior.bProxied) + " ➔ " + proxyLabel(mhNew.bProxied);
}

}  // namespace

bool isRenewal(const common::MonitoredHost& mhPrior, const common::MonitoredHost& mhNew) {
  if (!mhPrior.oNotAfter || !mhNew.oNotAfter) return false;
  return *mhNew.oNotAfter > *mhPrior.oNotAfter + std::chrono::hours(24);
}

std::vector<std::string> computeStateChanges(const common::MonitoredHost& mhPrior,
                                             const common::MonitoredHost& mhNew) {
  std::vector<std::string> vChanges;

  if (isRenewal(mhPrior, mhNew)) {
    vChanges.push_back("<b>SSL certificate renewed</b>\n   Expiry: <del>" +
                       common::formatDate(*mhPrior.oNotAfter) + "</del> ➔ " +
                       common::formatDate(*mhNew.oNotAfter) + " (" +
                       std::to_string(mhNew.iDaysRemaining) + " days)");
  }

  if (mhPrior.status != mhNew.status && mhNew.status != HostStatus::ConnectionError) {
    const std::string sTransition =
        common::toString(mhPrior.status) + " ➔ " + common::toString(mhNew.status);
    if (mhPrior.status == HostStatus::ConnectionError && mhNew.status == HostStatus::Active) {
      vChanges.push_back("<b>Connection restored</b>\n   Status: " + sTransition);
    } else {
      vChanges.push_back("Status: " + sTransition);
    }
  }

  if (mhPrior.sTarget != mhNew.sTarget) vChanges.push_back(targetLine(mhPrior, mhNew));
  if (mhPrior.sRecordType != mhNew.sRecordType) vChanges.push_back(typeLine(mhPrior, mhNew));
  if (mhPrior.bProxied != mhNew.bProxied) vChanges.push_back(proxyLine(mhPrior, mhNew));

  if (mhPrior.sErrorMessage != mhNew.sErrorMessage && !mhNew.sErrorMessage.empty() &&
      mhNew.status != HostStatus::ConnectionError) {
    vChanges.push_back("Error: " + mhNew.sErrorMessage);
  }
  return vChanges;
}

std::vector<std::string> computeConfigChanges(const common::MonitoredHost& mhPrior,
                                              const common::MonitoredHost& mhNew) {
  std::vector<std::string> vChanges;
  if (mhPrior.sTarget != mhNew.sTarget) vChanges.push_back(targetLine(mhPrior, mhNew));
  if (mhPrior.sRecordType != mhNew.sRecordType) vChanges.push_back(typeLine(mhPrior, mhNew));
  if (mhPrior.bProxied != mhNew.bProxied) vChanges.push_back(proxyLine(mhPrior, mhNew));
  return vChanges;
}

bool providerFieldsDiffer(const common::MonitoredHost& mhPrior,
                          const common::MonitoredHost& mhNew) {
  return mhPrior.sZoneId != mhNew.sZoneId || mhPrior.sZoneName != mhNew.sZoneName ||
         mhPrior.sRecordType != mhNew.sRecordType || mhPrior.sTarget != mhNew.sTarget ||
         mhPrior.bProxied != mhNew.bProxied || mhPrior.sComment != mhNew.sComment;
}

}  // namespace certmon::core
