#include "api/routes/HostRoutes.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/JsonMapping.hpp"
#include "api/Responses.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/HostRepository.hpp"
#include "notify/Notifier.hpp"

namespace certmon::api::routes {

namespace {

constexpr size_t kBatchListLimit = 15;

int parseIntParam(const char* pName, const char* pValue) {
  const std::string sValue(pValue);
  int iValue = 0;
  const auto [pEnd, ec] = std::from_chars(sValue.data(), sValue.data() + sValue.size(), iValue);
  if (ec != std::errc() || pEnd != sValue.data() + sValue.size()) {
    throw common::ValidationError("invalid_query",
                                  std::string(pName) + " must be an integer");
  }
  return iValue;
}

std::string notFoundMessage(int64_t iId) {
  return "Host " + std::to_string(iId) + " not found";
}

}  // namespace

HostRoutes::HostRoutes(std::shared_ptr<dal::IHostRepository> spRepo,
                       std::shared_ptr<notify::INotifier> spNotifier)
    : _spRepo(std::move(spRepo)), _spNotifier(std::move(spNotifier)) {}

HostRoutes::~HostRoutes() = default;

common::HostFilter HostRoutes::filterFromQuery(const crow::query_string& qs) {
  common::HostFilter hf;
  if (const char* p = qs.get("zone")) hf.sZone = p;
  if (const char* p = qs.get("status")) hf.sStatus = p;
  if (const char* p = qs.get("search")) hf.sSearch = p;
  if (const char* p = qs.get("sort")) hf.sSort = p;
  if (const char* p = qs.get("page")) hf.iPage = parseIntParam("page", p);
  if (const char* p = qs.get("page_size")) hf.iPageSize = parseIntParam("page_size", p);

  if (const char* p = qs.get("proxied")) {
    const std::string sProxied(p);
    if (sProxied == "true") {
      hf.oProxied = true;
    } else if (sProxied == "false") {
      hf.oProxied = false;
    } else if (!sProxied.empty()) {
      throw common::ValidationError("invalid_query", "proxied must be true or false");
    }
  }
  if (const char* p = qs.get("ignored")) {
    const std::string sIgnored(p);
    if (sIgnored != "true" && sIgnored != "false" && sIgnored != "all") {
      throw common::ValidationError("invalid_query", "ignored must be true, false or all");
    }
    hf.sIgnored = sIgnored;
  }
  if (hf.iPage < 1 || hf.iPageSize < 1) {
    throw common::ValidationError("invalid_query", "page and page_size must be positive");
  }
  if (!hf.sStatus.empty() && hf.sStatus != "active_only" && hf.sStatus != "mismatch") {
    hf.sStatus = common::toString(common::hostStatusFromString(hf.sStatus));
  }
  return hf;
}

void HostRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/hosts
  CROW_ROUTE(app, "/api/v1/hosts").methods("GET"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          const auto hf = filterFromQuery(req.url_params);
          return jsonResponse(200, toJson(_spRepo->list(hf), hf));
        } catch (const common::AppError& e) {
          return errorResponse(e);
        }
      });

  // GET /api/v1/hosts/export
  CROW_ROUTE(app, "/api/v1/hosts/export").methods("GET"_method)([this]() -> crow::response {
    std::vector<common::MonitoredHost> vHosts;
    for (auto& mh : _spRepo->listAll()) {
      if (!mh.bIgnored && !mh.isPlaceholder()) vHosts.push_back(std::move(mh));
    }
    std::stable_sort(vHosts.begin(), vHosts.end(),
                     [](const common::MonitoredHost& a, const common::MonitoredHost& b) {
                       if (a.oNotAfter.has_value() != b.oNotAfter.has_value()) {
                         return a.oNotAfter.has_value();
                       }
                       return a.oNotAfter.has_value() && *a.oNotAfter < *b.oNotAfter;
                     });

    crow::response resp(200, toCsv(vHosts));
    resp.set_header("Content-Type", "text/csv; charset=utf-8");
    resp.set_header("Content-Disposition", "attachment;filename=hosts_report.csv");
    return resp;
  });

  // GET /api/v1/zones
  CROW_ROUTE(app, "/api/v1/zones").methods("GET"_method)([this]() -> crow::response {
    return jsonResponse(200, {{"data", _spRepo->listZones()}});
  });

  // GET /api/v1/stats
  CROW_ROUTE(app, "/api/v1/stats").methods("GET"_method)([this]() -> crow::response {
    return jsonResponse(200, {{"data", toJson(_spRepo->getAggregateStatistics())}});
  });

  // PATCH /api/v1/hosts/<id>/settings
  CROW_ROUTE(app, "/api/v1/hosts/<int>/settings").methods("PATCH"_method)(
      [this](const crow::request& req, int iId) -> crow::response {
        try {
          const auto jBody = parseBody(req);
          const auto oHost = _spRepo->findById(iId);
          if (!oHost) throw common::NotFoundError("host_not_found", notFoundMessage(iId));

          const bool bIgnored = jBody.value("ignored", oHost->bIgnored);
          const int iPort = jBody.value("port", oHost->iPort);
          const bool bAutoRenew = jBody.value("auto_renew", oHost->bAutoRenew);
          validatePort(iPort);

          _spRepo->updateUserSettings(iId, bIgnored, iPort, bAutoRenew);
          return jsonResponse(200, {{"message", "Settings updated"},
                                    {"ignored", bIgnored},
                                    {"port", iPort},
                                    {"auto_renew", bAutoRenew}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // POST /api/v1/hosts/batch-ignore
  CROW_ROUTE(app, "/api/v1/hosts/batch-ignore").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          const auto jBody = parseBody(req);
          const auto vIds = idsFromJson(jBody, "ids");
          const bool bIgnored = jBody.value("ignored", true);

          std::vector<std::string> vNames;
          for (const int64_t iId : vIds) {
            if (auto oHost = _spRepo->findById(iId)) vNames.push_back(oHost->sHostname);
          }
          const int iChanged = _spRepo->batchUpdateIgnored(vIds, bIgnored);

          std::string sDetails = std::string("Action: ") +
                                 (bIgnored ? "Stop monitoring" : "Resume monitoring") +
                                 "\nAffected: " + std::to_string(iChanged) + " host(s)";
          for (size_t i = 0; i < vNames.size() && i < kBatchListLimit; ++i) {
            sDetails += "\n- " + vNames[i];
          }
          if (vNames.size() > kBatchListLimit) {
            sDetails += "\n...and " + std::to_string(vNames.size() - kBatchListLimit) + " more";
          }
          _spNotifier->notifyOperation(common::EventType::Update, "Multiple hosts", sDetails);

          return jsonResponse(200, {{"message", "Batch update applied"}, {"updated", iChanged}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // POST /api/v1/hosts
  CROW_ROUTE(app, "/api/v1/hosts").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto mh = manualHostFromJson(parseBody(req));
          if (_spRepo->findByHostname(mh.sHostname)) {
            throw common::ConflictError("host_exists", mh.sHostname + " is already monitored");
          }
          mh.iId = _spRepo->create(mh);
          common::Logger::get()->info("Manual host added: {} (id={})", mh.sHostname, mh.iId);
          _spNotifier->notifyOperation(common::EventType::Add, mh.sHostname,
                                       "Manual add (client " + req.remote_ip_address + ")");
          return jsonResponse(201, {{"data", toJson(mh)}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // DELETE /api/v1/hosts/<id>
  CROW_ROUTE(app, "/api/v1/hosts/<int>").methods("DELETE"_method)(
      [this](const crow::request& req, int iId) -> crow::response {
        try {
          const auto oHost = _spRepo->findById(iId);
          if (!oHost || !_spRepo->deleteById(iId)) {
            throw common::NotFoundError("host_not_found", notFoundMessage(iId));
          }
          common::Logger::get()->info("Host deleted: {} (id={})", oHost->sHostname, iId);
          _spNotifier->notifyOperation(common::EventType::Delete, oHost->sHostname,
                                       "Manual delete (client " + req.remote_ip_address + ")");
          return jsonResponse(200, {{"message", "Host deleted"}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        }
      });
}

}  // namespace certmon::api::routes
