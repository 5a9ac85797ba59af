#include "api/routes/TaskRoutes.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/BackgroundJobs.hpp"
#include "api/JsonMapping.hpp"
#include "api/Responses.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/RunContext.hpp"
#include "core/Prober.hpp"
#include "core/Reconciler.hpp"
#include "core/ScheduleManager.hpp"
#include "dal/HostRepository.hpp"

namespace certmon::api::routes {

namespace {

constexpr auto kInspectTimeout = std::chrono::seconds(60);

}  // namespace

TaskRoutes::TaskRoutes(std::shared_ptr<core::Reconciler> spReconciler,
                       std::shared_ptr<core::IProber> spProber,
                       std::shared_ptr<dal::IHostRepository> spRepo, BackgroundJobs& bjJobs)
    : _spReconciler(std::move(spReconciler)),
      _spProber(std::move(spProber)),
      _spRepo(std::move(spRepo)),
      _bjJobs(bjJobs) {}

TaskRoutes::~TaskRoutes() = default;

void TaskRoutes::registerRoutes(crow::SimpleApp& app) {
  // POST /api/v1/sync
  CROW_ROUTE(app, "/api/v1/sync").methods("POST"_method)([this]() -> crow::response {
    try {
      if (_spReconciler->syncRunning()) {
        throw common::ConflictError("sync_in_progress", "A synchronization is already running");
      }
      _bjJobs.launch("sync", core::ScheduledJobs::forReconciler(_spReconciler).fnSync);
      return jsonResponse(202, {{"message", "Synchronization started"}});
    } catch (const common::AppError& e) {
      return errorResponse(e);
    }
  });

  // POST /api/v1/scan
  CROW_ROUTE(app, "/api/v1/scan").methods("POST"_method)([this]() -> crow::response {
    try {
      if (_spReconciler->rescanRunning()) {
        throw common::ConflictError("rescan_in_progress", "A full rescan is already running");
      }
      _bjJobs.launch("scan", core::ScheduledJobs::forReconciler(_spReconciler).fnScan);
      return jsonResponse(202, {{"message", "Full rescan started"}});
    } catch (const common::AppError& e) {
      return errorResponse(e);
    }
  });

  // POST /api/v1/hosts/<id>/scan
  CROW_ROUTE(app, "/api/v1/hosts/<int>/scan").methods("POST"_method)(
      [this](int iId) -> crow::response {
        try {
          const auto oHost = _spRepo->findById(iId);
          if (!oHost) {
            throw common::NotFoundError("host_not_found",
                                        "Host " + std::to_string(iId) + " not found");
          }
          auto spReconciler = _spReconciler;
          const std::string sHostname = oHost->sHostname;
          _bjJobs.launch("scan-host", [spReconciler, iId, sHostname](std::stop_token stToken) {
            const auto mh = spReconciler->scanHostById(iId, stToken);
            common::Logger::get()->info("Manual scan of {} finished: {}", sHostname,
                                        common::toString(mh.status));
          });
          return jsonResponse(202, {{"message", "Scan of " + sHostname + " started"}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        }
      });

  // POST /api/v1/hosts/batch-scan
  CROW_ROUTE(app, "/api/v1/hosts/batch-scan").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          auto vIds = idsFromJson(parseBody(req), "ids");
          const size_t uCount = vIds.size();
          auto spReconciler = _spReconciler;
          _bjJobs.launch("batch-scan",
                         [spReconciler, vIds = std::move(vIds)](std::stop_token stToken) {
                           spReconciler->scanHostsById(vIds, stToken);
                         });
          return jsonResponse(202, {{"message", "Batch scan of " + std::to_string(uCount) +
                                                    " host(s) started"}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // POST /api/v1/tools/inspect
  CROW_ROUTE(app, "/api/v1/tools/inspect").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          const auto jBody = parseBody(req);
          const std::string sHostname = jBody.value("hostname", "");
          if (sHostname.empty()) {
            throw common::ValidationError("missing_hostname", "hostname is required");
          }
          const int iPort = jBody.value("port", 443);
          validatePort(iPort);

          const auto rcCtx = common::RunContext().withTimeout(kInspectTimeout);
          const auto mh = _spProber->inspect(sHostname, iPort, rcCtx);
          return jsonResponse(200, {{"data", toJson(mh)}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });
}

}  // namespace certmon::api::routes
