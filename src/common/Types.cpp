#include "common/Types.hpp"

#include "common/Errors.hpp"

namespace certmon::common {

std::string toString(HostStatus status) {
  switch (status) {
    case HostStatus::Active:
      return "active";
    case HostStatus::Expired:
      return "expired";
    case HostStatus::Warning:
      return "warning";
    case HostStatus::Unresolvable:
      return "unresolvable";
    case HostStatus::ConnectionError:
      return "connection_error";
    case HostStatus::Pending:
      return "pending";
    case HostStatus::SkippedZone:
      return "skipped_zone";
  }
  return "pending";
}

HostStatus hostStatusFromString(const std::string& sValue) {
  if (sValue == "active") return HostStatus::Active;
  if (sValue == "expired") return HostStatus::Expired;
  if (sValue == "warning") return HostStatus::Warning;
  if (sValue == "unresolvable") return HostStatus::Unresolvable;
  if (sValue == "connection_error") return HostStatus::ConnectionError;
  if (sValue == "pending") return HostStatus::Pending;
  if (sValue == "skipped_zone") return HostStatus::SkippedZone;
  throw ValidationError("invalid_status", "Unknown host status '" + sValue + "'");
}

MonitoredHost makeZonePlaceholder(const std::string& sZoneId, const std::string& sZoneName) {
  MonitoredHost mh;
  mh.sHostname = sZoneName;
  mh.sZoneId = sZoneId;
  mh.sZoneName = sZoneName;
  mh.sRecordId = "placeholder-" + sZoneId;
  mh.sRecordType = kPlaceholderRecordType;
  mh.sTarget = kPlaceholderTarget;
  mh.bIgnored = true;
  mh.status = HostStatus::SkippedZone;
  mh.bIsMatch = true;
  return mh;
}

std::string toString(EventType eventType) {
  switch (eventType) {
    case EventType::Add:
      return "ADD";
    case EventType::Delete:
      return "DELETE";
    case EventType::Renew:
      return "RENEW";
    case EventType::Update:
      return "UPDATE";
    case EventType::SyncFinish:
      return "SYNC_FINISH";
    case EventType::ScanFinish:
      return "SCAN_FINISH";
    case EventType::ZoneAdd:
      return "ZONE_ADD";
    case EventType::ZoneDelete:
      return "ZONE_DELETE";
  }
  return "UPDATE";
}

}  // namespace certmon::common
