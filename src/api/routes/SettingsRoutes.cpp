#include "api/routes/SettingsRoutes.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "api/Responses.hpp"
#include "common/AlertSettings.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/CronExpression.hpp"
#include "core/ScheduleManager.hpp"
#include "dal/SettingsRepository.hpp"
#include "notify/Notifier.hpp"
#include "notify/TemplateEngine.hpp"

namespace certmon::api::routes {

namespace {

void validateSchedule(const char* pKey, bool bEnabled, const std::string& sSchedule) {
  if (!bEnabled || sSchedule.empty()) return;
  try {
    core::CronExpression::parse(sSchedule).next(std::chrono::system_clock::now());
  } catch (const common::ValidationError& e) {
    throw common::ValidationError(e._sErrorCode, std::string(pKey) + ": " + e.what());
  }
}

}  // namespace

SettingsRoutes::SettingsRoutes(std::shared_ptr<dal::ISettingsRepository> spSettingsRepo,
                               std::shared_ptr<notify::INotifier> spNotifier,
                               core::ScheduleManager& smManager)
    : _spSettingsRepo(std::move(spSettingsRepo)),
      _spNotifier(std::move(spNotifier)),
      _smManager(smManager) {}

SettingsRoutes::~SettingsRoutes() = default;

void SettingsRoutes::registerRoutes(crow::SimpleApp& app) {
  // GET /api/v1/settings
  CROW_ROUTE(app, "/api/v1/settings").methods("GET"_method)([this]() -> crow::response {
    const nlohmann::json jSettings = _spSettingsRepo->get();
    return jsonResponse(200, {{"data", jSettings}});
  });

  // PUT /api/v1/settings
  CROW_ROUTE(app, "/api/v1/settings").methods("PUT"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          const auto jPatch = parseBody(req);
          if (!jPatch.is_object()) {
            throw common::ValidationError("invalid_body", "Expected a JSON object");
          }

          // Validate the document as it will look after the merge
          nlohmann::json jMerged = _spSettingsRepo->get();
          jMerged.update(jPatch);
          const auto alsCandidate = jMerged.get<common::AlertSettings>();
          notify::validateTemplates(alsCandidate);
          validateSchedule("sync_schedule", alsCandidate.bSyncEnabled, alsCandidate.sSyncSchedule);
          validateSchedule("scan_schedule", alsCandidate.bScanEnabled, alsCandidate.sScanSchedule);

          const nlohmann::json jSaved = _spSettingsRepo->save(jPatch);
          _spNotifier->reloadSettings();
          _smManager.reload();

          auto spLog = common::Logger::get();
          spLog->info("Settings saved (sync={}, scan={}, telegram={}, webhook={})",
                      alsCandidate.bSyncEnabled, alsCandidate.bScanEnabled,
                      alsCandidate.bTelegramEnabled, alsCandidate.bWebhookEnabled);
          return jsonResponse(200, {{"message", "Settings saved"}, {"data", jSaved}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });

  // POST /api/v1/settings/test
  CROW_ROUTE(app, "/api/v1/settings/test").methods("POST"_method)(
      [this](const crow::request& req) -> crow::response {
        try {
          const auto alsTest = parseBody(req).get<common::AlertSettings>();
          _spNotifier->sendTestMessage(alsTest);
          return jsonResponse(200, {{"message", "Test message delivered"}});
        } catch (const common::AppError& e) {
          return errorResponse(e);
        } catch (const nlohmann::json::exception&) {
          return invalidJsonResponse();
        }
      });
}

}  // namespace certmon::api::routes
