#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace certmon::api {

/// Wire form of a host. Keys are the storage column names; timestamps are ISO 8601
/// or null.
nlohmann::json toJson(const common::MonitoredHost& mh);

nlohmann::json toJson(const common::AggregateStatistics& as);

nlohmann::json toJson(const common::HostPage& hp, const common::HostFilter& hf);

/// Body of POST /api/v1/hosts. Requires "hostname"; "port" defaults to 443.
/// The result is a manual host (no provider record id), status pending.
/// Throws common::ValidationError.
common::MonitoredHost manualHostFromJson(const nlohmann::json& jBody);

/// Read a non-empty array of positive ids under sKey. Throws common::ValidationError.
std::vector<int64_t> idsFromJson(const nlohmann::json& jBody, const std::string& sKey);

/// Throws common::ValidationError when iPort is outside 1-65535.
void validatePort(int iPort);

/// Spreadsheet export: UTF-8 BOM, header row, one line per host.
std::string toCsv(const std::vector<common::MonitoredHost>& vHosts);

}  // namespace certmon::api
