#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace certmon::common {

using SysTime = std::chrono::system_clock::time_point;

/// Per-cycle outcome of probing one host.
/// Warning is storage-only: the prober never produces it.
enum class HostStatus {
  Active,
  Expired,
  Warning,
  Unresolvable,
  ConnectionError,
  Pending,
  SkippedZone,
};

/// Wire/storage spelling: "active", "connection_error", "skipped_zone", ...
std::string toString(HostStatus status);

/// Inverse of toString. Throws ValidationError on an unknown spelling.
HostStatus hostStatusFromString(const std::string& sValue);

inline constexpr const char* kPlaceholderRecordType = "placeholder";
inline constexpr const char* kPlaceholderTarget = "Auto Generated Placeholder";

/// One tracked hostname. Unique key: (sHostname, sRecordId).
/// Class abbreviation: mh
struct MonitoredHost {
  int64_t iId = 0;

  // ── Identity ──────────────────────────────────────────────────────────
  std::string sHostname;
  std::string sZoneId;
  std::string sRecordId;  // empty for manually created hosts

  // ── Provider-owned ────────────────────────────────────────────────────
  std::string sZoneName;
  std::string sRecordType;
  std::string sTarget;
  bool bProxied = false;
  std::string sComment;

  // ── User-owned ────────────────────────────────────────────────────────
  bool bIgnored = false;
  int iPort = 443;
  bool bAutoRenew = false;

  // ── Observed ──────────────────────────────────────────────────────────
  std::string sIssuer;
  std::optional<SysTime> oNotBefore;
  std::optional<SysTime> oNotAfter;
  int iDaysRemaining = 0;
  std::vector<std::string> vSans;
  std::string sTlsVersion;
  int iHttpStatusCode = 0;
  int64_t iLatencyMs = 0;
  bool bIsMatch = false;
  std::vector<std::string> vResolvedIps;
  std::string sResolvedRecord;
  std::optional<SysTime> oDomainExpiry;
  int iDomainDaysLeft = 0;
  std::optional<SysTime> oLastCheckAt;
  std::optional<SysTime> oLastAlertAt;
  std::optional<SysTime> oCreatedAt;
  HostStatus status = HostStatus::Pending;
  std::string sErrorMessage;

  bool isPlaceholder() const { return sRecordType == kPlaceholderRecordType; }
  bool isManual() const { return sRecordId.empty(); }
};

/// Build the synthetic record that stands in for a zone without eligible hosts.
MonitoredHost makeZonePlaceholder(const std::string& sZoneId, const std::string& sZoneName);

/// A zone as listed by the DNS provider.
/// Class abbreviation: pz
struct ProviderZone {
  std::string sId;
  std::string sName;
  std::string sStatus;
};

/// A single DNS record as listed by the DNS provider.
/// Class abbreviation: prec
struct ProviderRecord {
  std::string sId;
  std::string sZoneId;
  std::string sZoneName;
  std::string sName;
  std::string sType;
  std::string sContent;
  bool bProxied = false;
  std::string sComment;
};

/// One page of a paginated record listing.
/// Class abbreviation: rp
struct RecordPage {
  std::vector<ProviderRecord> vRecords;
  int iPage = 1;
  int iTotalPages = 1;
};

/// What the record source saw for one zone during a stream.
/// Class abbreviation: zs
struct ZoneSummary {
  std::string sZoneId;
  std::string sZoneName;
  int iRecordsSeen = 0;
  int iEligible = 0;
  int iSkipped = 0;
  bool bListingFailed = false;  // at least one page could not be fetched
};

/// Listing query for persisted hosts.
/// Class abbreviation: hf
struct HostFilter {
  std::string sZone;
  std::string sStatus;   // exact status, or "active_only" / "mismatch"
  std::optional<bool> oProxied;
  std::string sIgnored = "false";  // "true" | "false" | "all"
  std::string sSearch;
  int iPage = 1;
  int iPageSize = 20;
  std::string sSort;     // e.g. "expiry_asc"; empty = newest first
};

/// Class abbreviation: hp
struct HostPage {
  std::vector<MonitoredHost> vHosts;
  int64_t iTotal = 0;
};

/// Dashboard aggregates.
/// Class abbreviation: as
struct AggregateStatistics {
  int64_t iTotal = 0;
  int64_t iZones = 0;
  int64_t iIgnored = 0;
  int64_t iConnectionErrors = 0;
  int64_t iMismatched = 0;
  int64_t iExpiring7 = 0;
  int64_t iExpiring15 = 0;
  int64_t iExpiring30 = 0;
  std::map<std::string, int64_t> mStatusCounts;
  std::map<std::string, int64_t> mIssuerCounts;
};

/// Per-run counters for a synchronization.
/// Class abbreviation: ss
struct SyncStats {
  int iAdded = 0;
  int iUpdated = 0;
  int iDeleted = 0;
  int iSkipped = 0;
  std::vector<std::string> vAddedNames;
  std::vector<std::string> vUpdatedDetails;
  std::vector<std::string> vDeletedNames;
  std::chrono::milliseconds durElapsed{0};
};

/// Outcome of one synchronization run.
/// Class abbreviation: sr
struct SyncReport {
  SyncStats stats;
  bool bSuccess = false;
  std::string sErrorMessage;
};

/// Outcome of a full rescan.
/// Class abbreviation: scs
struct ScanSummary {
  int iTotal = 0;
  int iActive = 0;
  int iExpired = 0;
  int iWarning = 0;
  int iFailed = 0;
  std::chrono::milliseconds durElapsed{0};
};

/// Lifecycle event categories understood by the notifier.
enum class EventType {
  Add,
  Delete,
  Renew,
  Update,
  SyncFinish,
  ScanFinish,
  ZoneAdd,
  ZoneDelete,
};

/// "ADD", "DELETE", "RENEW", "UPDATE", "SYNC_FINISH", "SCAN_FINISH", "ZONE_ADD", "ZONE_DELETE"
std::string toString(EventType eventType);

}  // namespace certmon::common
