#include "api/ApiServer.hpp"

#include <cstdint>

#include "api/routes/HealthRoutes.hpp"
#include "api/routes/HostRoutes.hpp"
#include "api/routes/SettingsRoutes.hpp"
#include "api/routes/TaskRoutes.hpp"
#include "common/Logger.hpp"

namespace certmon::api {

ApiServer::ApiServer(routes::HealthRoutes& hlrHealth, routes::TaskRoutes& trTasks,
                     routes::HostRoutes& hrHosts, routes::SettingsRoutes& srSettings)
    : _hlrHealth(hlrHealth), _trTasks(trTasks), _hrHosts(hrHosts), _srSettings(srSettings) {
  crow::logger::setLogLevel(crow::LogLevel::Warning);
}

ApiServer::~ApiServer() = default;

void ApiServer::registerRoutes() {
  _hlrHealth.registerRoutes(_app);
  _trTasks.registerRoutes(_app);
  _hrHosts.registerRoutes(_app);
  _srSettings.registerRoutes(_app);
  _app.validate();
}

void ApiServer::start(int iPort, int iThreads) {
  common::Logger::get()->info("API server listening on port {} ({} threads)", iPort, iThreads);
  _app.port(static_cast<uint16_t>(iPort)).concurrency(static_cast<uint16_t>(iThreads)).run();
}

void ApiServer::stop() {
  _app.stop();
}

}  // namespace certmon::api
