#include "dal/HostRepository.hpp"

#include "common/Errors.hpp"
#include "dal/ConnectionPool.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>

#include <algorithm>
#include <chrono>
#include <ctime>

namespace certmon::dal {

namespace {

using common::MonitoredHost;
using common::SysTime;

// Column order is relied on by rowToHost().
constexpr const char* kSelectColumns =
    "id, hostname, zone_id, record_id, zone_name, record_type, target, proxied, comment, "
    "is_ignored, port, auto_renew, issuer, "
    "EXTRACT(EPOCH FROM not_before)::bigint, EXTRACT(EPOCH FROM not_after)::bigint, "
    "days_remaining, sans::text, tls_version, http_status_code, latency_ms, is_match, "
    "resolved_ips::text, resolved_record, EXTRACT(EPOCH FROM domain_expiry)::bigint, "
    "domain_days_left, EXTRACT(EPOCH FROM last_check_at)::bigint, "
    "EXTRACT(EPOCH FROM last_alert_at)::bigint, EXTRACT(EPOCH FROM created_at)::bigint, "
    "status, error_message";

std::optional<SysTime> optTime(const pqxx::field& fld) {
  if (fld.is_null()) return std::nullopt;
  return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(fld.as<int64_t>()));
}

std::optional<int64_t> toEpoch(const std::optional<SysTime>& oTime) {
  if (!oTime) return std::nullopt;
  return static_cast<int64_t>(std::chrono::system_clock::to_time_t(*oTime));
}

std::vector<std::string> parseStringArray(const pqxx::field& fld) {
  if (fld.is_null()) return {};
  auto jArr = nlohmann::json::parse(fld.as<std::string>(), nullptr, false);
  if (!jArr.is_array()) return {};
  std::vector<std::string> vItems;
  for (const auto& jItem : jArr) {
    if (jItem.is_string()) vItems.push_back(jItem.get<std::string>());
  }
  return vItems;
}

std::string dumpStringArray(const std::vector<std::string>& vItems) {
  return nlohmann::json(vItems).dump();
}

MonitoredHost rowToHost(const pqxx::row& row) {
  MonitoredHost mh;
  mh.iId = row[0].as<int64_t>();
  mh.sHostname = row[1].as<std::string>();
  mh.sZoneId = row[2].as<std::string>();
  mh.sRecordId = row[3].as<std::string>();
  mh.sZoneName = row[4].as<std::string>();
  mh.sRecordType = row[5].as<std::string>();
  mh.sTarget = row[6].as<std::string>();
  mh.bProxied = row[7].as<bool>();
  mh.sComment = row[8].as<std::string>();
  mh.bIgnored = row[9].as<bool>();
  mh.iPort = row[10].as<int>();
  mh.bAutoRenew = row[11].as<bool>();
  mh.sIssuer = row[12].as<std::string>();
  mh.oNotBefore = optTime(row[13]);
  mh.oNotAfter = optTime(row[14]);
  mh.iDaysRemaining = row[15].as<int>();
  mh.vSans = parseStringArray(row[16]);
  mh.sTlsVersion = row[17].as<std::string>();
  mh.iHttpStatusCode = row[18].as<int>();
  mh.iLatencyMs = row[19].as<int64_t>();
  mh.bIsMatch = row[20].as<bool>();
  mh.vResolvedIps = parseStringArray(row[21]);
  mh.sResolvedRecord = row[22].as<std::string>();
  mh.oDomainExpiry = optTime(row[23]);
  mh.iDomainDaysLeft = row[24].as<int>();
  mh.oLastCheckAt = optTime(row[25]);
  mh.oLastAlertAt = optTime(row[26]);
  mh.oCreatedAt = optTime(row[27]);
  mh.status = common::hostStatusFromString(row[28].as<std::string>());
  mh.sErrorMessage = row[29].as<std::string>();
  return mh;
}

/// Whitelisted ORDER BY clauses; unknown keys fall back to newest first.
std::string orderByFor(const std::string& sSort) {
  if (sSort == "expiry_asc") return "not_after ASC NULLS LAST, id DESC";
  if (sSort == "expiry_desc") return "not_after DESC NULLS LAST, id DESC";
  if (sSort == "domain_expiry_asc") return "domain_expiry ASC NULLS LAST, id DESC";
  if (sSort == "domain_expiry_desc") return "domain_expiry DESC NULLS LAST, id DESC";
  if (sSort == "days_remaining_asc") return "days_remaining ASC, id DESC";
  if (sSort == "days_remaining_desc") return "days_remaining DESC, id DESC";
  if (sSort == "check_time_asc") return "last_check_at ASC NULLS LAST, id DESC";
  if (sSort == "check_time_desc") return "last_check_at DESC NULLS LAST, id DESC";
  return "id DESC";
}

}  // namespace

HostRepository::HostRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
HostRepository::~HostRepository() = default;

int64_t HostRepository::upsert(const MonitoredHost& mh) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "INSERT INTO monitored_hosts ("
      "  hostname, zone_id, record_id, zone_name, record_type, target, proxied, comment, "
      "  issuer, not_before, not_after, days_remaining, sans, tls_version, http_status_code, "
      "  latency_ms, is_match, resolved_ips, resolved_record, domain_expiry, domain_days_left, "
      "  status, error_message, last_check_at, created_at, is_ignored) "
      "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10), to_timestamp($11), $12, "
      "  $13::jsonb, $14, $15, $16, $17, $18::jsonb, $19, to_timestamp($20), $21, $22, $23, "
      "  NOW(), NOW(), FALSE) "
      "ON CONFLICT (hostname, record_id) DO UPDATE SET "
      "  zone_id = EXCLUDED.zone_id, zone_name = EXCLUDED.zone_name, "
      "  record_type = EXCLUDED.record_type, target = EXCLUDED.target, "
      "  proxied = EXCLUDED.proxied, comment = EXCLUDED.comment, "
      "  issuer = EXCLUDED.issuer, not_before = EXCLUDED.not_before, "
      "  not_after = EXCLUDED.not_after, days_remaining = EXCLUDED.days_remaining, "
      "  sans = EXCLUDED.sans, tls_version = EXCLUDED.tls_version, "
      "  http_status_code = EXCLUDED.http_status_code, latency_ms = EXCLUDED.latency_ms, "
      "  is_match = EXCLUDED.is_match, resolved_ips = EXCLUDED.resolved_ips, "
      "  resolved_record = EXCLUDED.resolved_record, domain_expiry = EXCLUDED.domain_expiry, "
      "  domain_days_left = EXCLUDED.domain_days_left, status = EXCLUDED.status, "
      "  error_message = EXCLUDED.error_message, last_check_at = NOW() "
      "RETURNING id",
      pqxx::params{mh.sHostname, mh.sZoneId, mh.sRecordId, mh.sZoneName, mh.sRecordType,
                   mh.sTarget, mh.bProxied, mh.sComment, mh.sIssuer, toEpoch(mh.oNotBefore),
                   toEpoch(mh.oNotAfter), mh.iDaysRemaining, dumpStringArray(mh.vSans),
                   mh.sTlsVersion, mh.iHttpStatusCode, mh.iLatencyMs, mh.bIsMatch,
                   dumpStringArray(mh.vResolvedIps), mh.sResolvedRecord,
                   toEpoch(mh.oDomainExpiry), mh.iDomainDaysLeft, common::toString(mh.status),
                   mh.sErrorMessage});
  txn.commit();
  return result.one_row()[0].as<int64_t>();
}

int64_t HostRepository::create(const MonitoredHost& mh) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "INSERT INTO monitored_hosts ("
      "  hostname, zone_id, record_id, zone_name, record_type, target, proxied, comment, "
      "  is_ignored, port, auto_renew, status, is_match, domain_expiry, domain_days_left) "
      "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, to_timestamp($14), $15) "
      "RETURNING id",
      pqxx::params{mh.sHostname, mh.sZoneId, mh.sRecordId, mh.sZoneName, mh.sRecordType,
                   mh.sTarget, mh.bProxied, mh.sComment, mh.bIgnored, mh.iPort, mh.bAutoRenew,
                   common::toString(mh.status), mh.bIsMatch, toEpoch(mh.oDomainExpiry),
                   mh.iDomainDaysLeft});
  txn.commit();
  return result.one_row()[0].as<int64_t>();
}

std::optional<MonitoredHost> HostRepository::findById(int64_t iId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      std::string("SELECT ") + kSelectColumns + " FROM monitored_hosts WHERE id = $1",
      pqxx::params{iId});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return rowToHost(result[0]);
}

std::optional<MonitoredHost> HostRepository::findByHostname(const std::string& sHostname) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // A hostname may have several records (e.g. multiple A records); oldest wins
  auto result = txn.exec(
      std::string("SELECT ") + kSelectColumns +
          " FROM monitored_hosts WHERE hostname = $1 ORDER BY id ASC LIMIT 1",
      pqxx::params{sHostname});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return rowToHost(result[0]);
}

common::HostPage HostRepository::list(const common::HostFilter& hf) {
  std::string sWhere = " WHERE TRUE";
  pqxx::params params;
  int iParam = 0;
  auto nextParam = [&iParam]() { return "$" + std::to_string(++iParam); };

  if (!hf.sSearch.empty()) {
    const std::string sP = nextParam();
    sWhere += " AND (hostname ILIKE " + sP + " OR resolved_record ILIKE " + sP +
              " OR zone_name ILIKE " + sP + ")";
    params.append("%" + hf.sSearch + "%");
  }
  if (!hf.sZone.empty()) {
    sWhere += " AND zone_name = " + nextParam();
    params.append(hf.sZone);
  }
  if (hf.sStatus == "active_only") {
    sWhere += " AND status <> 'unresolvable'";
  } else if (hf.sStatus == "mismatch") {
    sWhere += " AND is_match = FALSE AND is_ignored = FALSE AND status <> 'unresolvable'";
  } else if (!hf.sStatus.empty()) {
    // Validates the spelling before it reaches SQL
    sWhere += " AND status = " + nextParam();
    params.append(common::toString(common::hostStatusFromString(hf.sStatus)));
  }
  if (hf.oProxied) {
    sWhere += " AND proxied = " + nextParam();
    params.append(*hf.oProxied);
  }
  if (hf.sIgnored == "true") {
    sWhere += " AND is_ignored = TRUE";
  } else if (hf.sIgnored == "false" || hf.sIgnored.empty()) {
    sWhere += " AND is_ignored = FALSE";
  }

  const int iPageSize = hf.iPageSize > 0 ? std::min(hf.iPageSize, 500) : 20;
  const int iPage = hf.iPage > 0 ? hf.iPage : 1;
  const int64_t iOffset = static_cast<int64_t>(iPage - 1) * iPageSize;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);

  auto countResult = txn.exec("SELECT COUNT(*) FROM monitored_hosts" + sWhere, params);
  common::HostPage hp;
  hp.iTotal = countResult.one_row()[0].as<int64_t>();

  auto result = txn.exec(std::string("SELECT ") + kSelectColumns + " FROM monitored_hosts" +
                             sWhere + " ORDER BY " + orderByFor(hf.sSort) + " LIMIT " +
                             std::to_string(iPageSize) + " OFFSET " + std::to_string(iOffset),
                         params);
  txn.commit();

  hp.vHosts.reserve(result.size());
  for (const auto& row : result) {
    hp.vHosts.push_back(rowToHost(row));
  }
  return hp;
}

std::vector<MonitoredHost> HostRepository::listAll() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(std::string("SELECT ") + kSelectColumns +
                         " FROM monitored_hosts ORDER BY id ASC");
  txn.commit();

  std::vector<MonitoredHost> vHosts;
  vHosts.reserve(result.size());
  for (const auto& row : result) {
    vHosts.push_back(rowToHost(row));
  }
  return vHosts;
}

std::vector<std::string> HostRepository::listZones() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT DISTINCT zone_name FROM monitored_hosts WHERE zone_name <> '' "
      "ORDER BY zone_name");
  txn.commit();

  std::vector<std::string> vZones;
  vZones.reserve(result.size());
  for (const auto& row : result) {
    vZones.push_back(row[0].as<std::string>());
  }
  return vZones;
}

bool HostRepository::deleteById(int64_t iId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("DELETE FROM monitored_hosts WHERE id = $1", pqxx::params{iId});
  txn.commit();
  return result.affected_rows() > 0;
}

int HostRepository::batchUpdateIgnored(const std::vector<int64_t>& vIds, bool bIgnored) {
  if (vIds.empty()) return 0;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE monitored_hosts SET is_ignored = $1 "
      "WHERE id IN (SELECT jsonb_array_elements_text($2::jsonb)::bigint)",
      pqxx::params{bIgnored, nlohmann::json(vIds).dump()});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

void HostRepository::updateUserSettings(int64_t iId, bool bIgnored, int iPort, bool bAutoRenew) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE monitored_hosts SET is_ignored = $2, port = $3, auto_renew = $4 WHERE id = $1",
      pqxx::params{iId, bIgnored, iPort, bAutoRenew});
  txn.commit();
  if (result.affected_rows() == 0) {
    throw common::NotFoundError("host_not_found", "Host " + std::to_string(iId) + " not found");
  }
}

void HostRepository::updateProbeFields(const MonitoredHost& mh) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "UPDATE monitored_hosts SET "
      "  zone_name = $2, record_type = $3, target = $4, proxied = $5, comment = $6, "
      "  issuer = $7, not_before = to_timestamp($8), not_after = to_timestamp($9), "
      "  days_remaining = $10, sans = $11::jsonb, tls_version = $12, "
      "  http_status_code = $13, latency_ms = $14, is_match = $15, "
      "  resolved_ips = $16::jsonb, resolved_record = $17, "
      "  domain_expiry = to_timestamp($18), domain_days_left = $19, "
      "  status = $20, error_message = $21, last_check_at = NOW() "
      "WHERE id = $1",
      pqxx::params{mh.iId, mh.sZoneName, mh.sRecordType, mh.sTarget, mh.bProxied, mh.sComment,
                   mh.sIssuer, toEpoch(mh.oNotBefore), toEpoch(mh.oNotAfter),
                   mh.iDaysRemaining, dumpStringArray(mh.vSans), mh.sTlsVersion,
                   mh.iHttpStatusCode, mh.iLatencyMs, mh.bIsMatch,
                   dumpStringArray(mh.vResolvedIps), mh.sResolvedRecord,
                   toEpoch(mh.oDomainExpiry), mh.iDomainDaysLeft, common::toString(mh.status),
                   mh.sErrorMessage});
  txn.commit();
}

void HostRepository::updateLastAlertTime(int64_t iId, SysTime tpWhen) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec("UPDATE monitored_hosts SET last_alert_at = to_timestamp($2) WHERE id = $1",
           pqxx::params{iId, toEpoch(tpWhen)});
  txn.commit();
}

common::AggregateStatistics HostRepository::getAggregateStatistics() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);

  // Expiry buckets only count hosts whose certificate data is meaningful
  auto totals = txn.exec(
      "SELECT "
      "  COUNT(*) FILTER (WHERE NOT is_ignored), "
      "  COUNT(*) FILTER (WHERE is_ignored), "
      "  COUNT(DISTINCT zone_name) FILTER (WHERE zone_name <> ''), "
      "  COUNT(*) FILTER (WHERE NOT is_ignored AND status = 'connection_error'), "
      "  COUNT(*) FILTER (WHERE NOT is_ignored AND NOT is_match "
      "                   AND status NOT IN ('unresolvable', 'connection_error')), "
      "  COUNT(*) FILTER (WHERE NOT is_ignored AND days_remaining < 8 AND status NOT IN "
      "                   ('unresolvable', 'pending', 'expired', 'connection_error')), "
      "  COUNT(*) FILTER (WHERE NOT is_ignored AND days_remaining < 16 AND status NOT IN "
      "                   ('unresolvable', 'pending', 'expired', 'connection_error')), "
      "  COUNT(*) FILTER (WHERE NOT is_ignored AND days_remaining < 31 AND status NOT IN "
      "                   ('unresolvable', 'pending', 'expired', 'connection_error')) "
      "FROM monitored_hosts").one_row();

  common::AggregateStatistics as;
  as.iTotal = totals[0].as<int64_t>();
  as.iIgnored = totals[1].as<int64_t>();
  as.iZones = totals[2].as<int64_t>();
  as.iConnectionErrors = totals[3].as<int64_t>();
  as.iMismatched = totals[4].as<int64_t>();
  as.iExpiring7 = totals[5].as<int64_t>();
  as.iExpiring15 = totals[6].as<int64_t>();
  as.iExpiring30 = totals[7].as<int64_t>();

  auto statusRows = txn.exec(
      "SELECT status, COUNT(*) FROM monitored_hosts WHERE NOT is_ignored GROUP BY status");
  for (const auto& row : statusRows) {
    as.mStatusCounts[row[0].as<std::string>()] = row[1].as<int64_t>();
  }

  auto issuerRows = txn.exec(
      "SELECT COALESCE(NULLIF(issuer, ''), 'Unknown'), COUNT(*) FROM monitored_hosts "
      "WHERE NOT is_ignored GROUP BY 1");
  for (const auto& row : issuerRows) {
    as.mIssuerCounts[row[0].as<std::string>()] = row[1].as<int64_t>();
  }

  txn.commit();
  return as;
}

}  // namespace certmon::dal
