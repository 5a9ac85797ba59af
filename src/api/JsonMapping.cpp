#include "api/JsonMapping.hpp"

#include <optional>

#include "common/Errors.hpp"
#include "common/TimeUtils.hpp"

namespace certmon::api {

namespace {

nlohmann::json timeOrNull(const std::optional<common::SysTime>& oTp) {
  if (!oTp) return nullptr;
  return common::toIso8601(*oTp);
}

/// RFC 4180 quoting: wrap when the field holds a separator, quote or newline.
std::string csvField(const std::string& sValue) {
  if (sValue.find_first_of(",\"\r\n") == std::string::npos) return sValue;
  std::string sOut = "\"";
  for (const char c : sValue) {
    if (c == '"') sOut += '"';
    sOut += c;
  }
  sOut += '"';
  return sOut;
}

}  // namespace

nlohmann::json toJson(const common::MonitoredHost& mh) {
  return {
      {"id", mh.iId},
      {"hostname", mh.sHostname},
      {"zone_id", mh.sZoneId},
      {"zone_name", mh.sZoneName},
      {"record_id", mh.sRecordId},
      {"record_type", mh.sRecordType},
      {"target", mh.sTarget},
      {"proxied", mh.bProxied},
      {"comment", mh.sComment},
      {"ignored", mh.bIgnored},
      {"port", mh.iPort},
      {"auto_renew", mh.bAutoRenew},
      {"issuer", mh.sIssuer},
      {"not_before", timeOrNull(mh.oNotBefore)},
      {"not_after", timeOrNull(mh.oNotAfter)},
      {"days_remaining", mh.iDaysRemaining},
      {"sans", mh.vSans},
      {"tls_version", mh.sTlsVersion},
      {"http_status_code", mh.iHttpStatusCode},
      {"latency_ms", mh.iLatencyMs},
      {"is_match", mh.bIsMatch},
      {"resolved_ips", mh.vResolvedIps},
      {"resolved_record", mh.sResolvedRecord},
      {"domain_expiry", timeOrNull(mh.oDomainExpiry)},
      {"domain_days_left", mh.iDomainDaysLeft},
      {"last_check_at", timeOrNull(mh.oLastCheckAt)},
      {"last_alert_at", timeOrNull(mh.oLastAlertAt)},
      {"created_at", timeOrNull(mh.oCreatedAt)},
      {"status", common::toString(mh.status)},
      {"error_message", mh.sErrorMessage},
  };
}

nlohmann::json toJson(const common::AggregateStatistics& as) {
  return {
      {"total", as.iTotal},
      {"zones", as.iZones},
      {"ignored", as.iIgnored},
      {"connection_errors", as.iConnectionErrors},
      {"mismatched", as.iMismatched},
      {"expiring", {{"d7", as.iExpiring7}, {"d15", as.iExpiring15}, {"d30", as.iExpiring30}}},
      {"status_counts", as.mStatusCounts},
      {"issuer_counts", as.mIssuerCounts},
  };
}

nlohmann::json toJson(const common::HostPage& hp, const common::HostFilter& hf) {
  nlohmann::json jData = nlohmann::json::array();
  for (const auto& mh : hp.vHosts) jData.push_back(toJson(mh));
  return {
      {"data", std::move(jData)},
      {"total", hp.iTotal},
      {"page", hf.iPage},
      {"page_size", hf.iPageSize},
  };
}

void validatePort(int iPort) {
  if (iPort < 1 || iPort > 65535) {
    throw common::ValidationError("invalid_port", "port must be between 1 and 65535");
  }
}

common::MonitoredHost manualHostFromJson(const nlohmann::json& jBody) {
  if (!jBody.is_object()) {
    throw common::ValidationError("invalid_body", "Expected a JSON object");
  }
  const std::string sHostname = jBody.value("hostname", "");
  if (sHostname.empty()) {
    throw common::ValidationError("missing_hostname", "hostname is required");
  }

  common::MonitoredHost mh;
  mh.sHostname = sHostname;
  mh.iPort = jBody.value("port", 443);
  validatePort(mh.iPort);
  mh.sZoneName = jBody.value("zone_name", "");
  mh.sComment = jBody.value("comment", "");
  mh.sRecordType = "manual";
  mh.status = common::HostStatus::Pending;
  mh.bIsMatch = true;
  return mh;
}

std::vector<int64_t> idsFromJson(const nlohmann::json& jBody, const std::string& sKey) {
  if (!jBody.is_object() || !jBody.contains(sKey) || !jBody[sKey].is_array()) {
    throw common::ValidationError("missing_ids", "'" + sKey + "' must be an array of ids");
  }
  std::vector<int64_t> vIds;
  for (const auto& jId : jBody[sKey]) {
    if (!jId.is_number_integer() || jId.get<int64_t>() <= 0) {
      throw common::ValidationError("invalid_id", "ids must be positive integers");
    }
    vIds.push_back(jId.get<int64_t>());
  }
  if (vIds.empty()) {
    throw common::ValidationError("missing_ids", "'" + sKey + "' must not be empty");
  }
  return vIds;
}

std::string toCsv(const std::vector<common::MonitoredHost>& vHosts) {
  std::string sOut = "\xEF\xBB\xBF";
  sOut += "Domain,Issuer,Expiry Date,Days Left,Status,Proxy,Zone\r\n";
  for (const auto& mh : vHosts) {
    sOut += csvField(mh.sHostname) + ",";
    sOut += csvField(mh.sIssuer) + ",";
    sOut += (mh.oNotAfter ? common::formatDate(*mh.oNotAfter) : std::string()) + ",";
    sOut += std::to_string(mh.iDaysRemaining) + ",";
    sOut += common::toString(mh.status) + ",";
    sOut += std::string(mh.bProxied ? "true" : "false") + ",";
    sOut += csvField(mh.sZoneName) + "\r\n";
  }
  return sOut;
}

}  // namespace certmon::api
