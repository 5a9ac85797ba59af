#include "providers/CloudflareProvider.hpp"

#include "common/Errors.hpp"
#include "common/HttpClient.hpp"
#include "common/Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <utility>

namespace certmon::providers {

namespace {

constexpr int kZonePageSize = 50;

common::ProviderZone parseZone(const nlohmann::json& jZone) {
  common::ProviderZone pz;
  pz.sId = jZone.value("id", "");
  pz.sName = jZone.value("name", "");
  pz.sStatus = jZone.value("status", "");
  return pz;
}

common::ProviderRecord parseRecord(const nlohmann::json& jRec) {
  common::ProviderRecord prec;
  prec.sId = jRec.value("id", "");
  prec.sZoneId = jRec.value("zone_id", "");
  prec.sZoneName = jRec.value("zone_name", "");
  prec.sName = jRec.value("name", "");
  prec.sType = jRec.value("type", "");
  prec.sContent = jRec.value("content", "");
  prec.bProxied = jRec.value("proxied", false);
  // comment is null when unset
  if (jRec.contains("comment") && jRec["comment"].is_string()) {
    prec.sComment = jRec["comment"].get<std::string>();
  }
  return prec;
}

int totalPages(const nlohmann::json& jEnvelope) {
  if (!jEnvelope.contains("result_info") || !jEnvelope["result_info"].is_object()) {
    return 1;
  }
  return std::max(1, jEnvelope["result_info"].value("total_pages", 1));
}

}  // namespace

CloudflareProvider::CloudflareProvider(std::string sApiEndpoint, std::string sToken,
                                       std::shared_ptr<common::IHttpClient> spHttp)
    : _sApiEndpoint(std::move(sApiEndpoint)),
      _sToken(std::move(sToken)),
      _spHttp(std::move(spHttp)) {
  while (!_sApiEndpoint.empty() && _sApiEndpoint.back() == '/') {
    _sApiEndpoint.pop_back();
  }
}

CloudflareProvider::~CloudflareProvider() = default;

std::string CloudflareProvider::name() const { return "cloudflare"; }

nlohmann::json CloudflareProvider::get(const std::string& sPath) {
  common::HttpRequest hreq;
  hreq.sMethod = "GET";
  hreq.sUrl = _sApiEndpoint + sPath;
  hreq.vHeaders = {{"Authorization", "Bearer " + _sToken},
                   {"Content-Type", "application/json"}};
  hreq.durTimeout = std::chrono::seconds(30);

  common::HttpResponse hres;
  try {
    hres = _spHttp->send(hreq);
  } catch (const common::ConnectionError& e) {
    throw common::ProviderError("provider_unreachable",
                                std::string("Cloudflare request failed: ") + e.what());
  }

  nlohmann::json jBody;
  try {
    jBody = nlohmann::json::parse(hres.sBody);
  } catch (const nlohmann::json::parse_error&) {
    throw common::ProviderError(
        "provider_bad_response",
        "Cloudflare returned non-JSON body (HTTP " + std::to_string(hres.iStatus) + ")");
  }

  if (hres.iStatus >= 400 || !jBody.value("success", false)) {
    std::string sMessage = "HTTP " + std::to_string(hres.iStatus);
    if (jBody.contains("errors") && jBody["errors"].is_array() && !jBody["errors"].empty()) {
      const auto& jErr = jBody["errors"][0];
      sMessage += ": " + jErr.value("message", std::string("unknown error"));
    }
    throw common::ProviderError("provider_api_error", "Cloudflare API error " + sMessage);
  }

  return jBody;
}

std::vector<common::ProviderZone> CloudflareProvider::listZones() {
  std::vector<common::ProviderZone> vZones;
  int iPage = 1;
  int iTotal = 1;
  do {
    auto jBody = get("/zones?page=" + std::to_string(iPage) +
                     "&per_page=" + std::to_string(kZonePageSize));
    for (const auto& jZone : jBody.value("result", nlohmann::json::array())) {
      vZones.push_back(parseZone(jZone));
    }
    iTotal = totalPages(jBody);
    ++iPage;
  } while (iPage <= iTotal);

  common::Logger::get()->debug("Cloudflare: listed {} zones", vZones.size());
  return vZones;
}

common::ProviderZone CloudflareProvider::getZone(const std::string& sZoneId) {
  auto jBody = get("/zones/" + sZoneId);
  return parseZone(jBody.value("result", nlohmann::json::object()));
}

common::RecordPage CloudflareProvider::listRecords(const std::string& sZoneId, int iPage,
                                                   int iPerPage) {
  auto jBody = get("/zones/" + sZoneId + "/dns_records?page=" + std::to_string(iPage) +
                   "&per_page=" + std::to_string(iPerPage));

  common::RecordPage rp;
  rp.iPage = iPage;
  rp.iTotalPages = totalPages(jBody);
  for (const auto& jRec : jBody.value("result", nlohmann::json::array())) {
    auto prec = parseRecord(jRec);
    if (prec.sZoneId.empty()) {
      prec.sZoneId = sZoneId;
    }
    rp.vRecords.push_back(std::move(prec));
  }
  return rp;
}

common::ProviderRecord CloudflareProvider::getRecord(const std::string& sZoneId,
                                                     const std::string& sRecordId) {
  auto jBody = get("/zones/" + sZoneId + "/dns_records/" + sRecordId);
  auto prec = parseRecord(jBody.value("result", nlohmann::json::object()));
  if (prec.sZoneId.empty()) {
    prec.sZoneId = sZoneId;
  }
  return prec;
}

}  // namespace certmon::providers
