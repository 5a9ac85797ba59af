#include "api/routes/HealthRoutes.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "api/Responses.hpp"
#include "common/TimeUtils.hpp"
#include "core/Reconciler.hpp"
#include "core/TaskScheduler.hpp"

namespace certmon::api::routes {

HealthRoutes::HealthRoutes(std::shared_ptr<core::Reconciler> spReconciler,
                           const core::TaskScheduler& tsScheduler)
    : _spReconciler(std::move(spReconciler)), _tsScheduler(tsScheduler) {}

HealthRoutes::~HealthRoutes() = default;

void HealthRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/health
  CROW_ROUTE(app, "/api/v1/health").methods("GET"_method)([this]() -> crow::response {
    nlohmann::json jSchedules = nlohmann::json::object();
    for (const auto& sName : _tsScheduler.taskNames()) {
      const auto oNext = _tsScheduler.nextRun(sName);
      jSchedules[sName] = {
          {"cron", _tsScheduler.cronText(sName).value_or("")},
          {"next_run", oNext && *oNext != common::SysTime::max() ? common::toIso8601(*oNext)
                                                                  : std::string()},
      };
    }
    return jsonResponse(200, {{"status", "ok"},
                              {"sync_running", _spReconciler->syncRunning()},
                              {"rescan_running", _spReconciler->rescanRunning()},
                              {"schedules", jSchedules}});
  });
}

}  // namespace certmon::api::routes
