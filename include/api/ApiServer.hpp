#pragma once

#include <crow.h>

namespace certmon::api::routes {
class HealthRoutes;
class HostRoutes;
class SettingsRoutes;
class TaskRoutes;
}  // namespace certmon::api::routes

namespace certmon::api {

/// Owns the Crow application instance; registers all routes at startup.
/// Class abbreviation: api
class ApiServer {
 public:
  ApiServer(routes::HealthRoutes& hlrHealth, routes::TaskRoutes& trTasks,
            routes::HostRoutes& hrHosts, routes::SettingsRoutes& srSettings);
  ~ApiServer();

  void registerRoutes();

  /// Blocks until SIGINT/SIGTERM or stop().
  void start(int iPort, int iThreads);
  void stop();

 private:
  crow::SimpleApp _app;
  routes::HealthRoutes& _hlrHealth;
  routes::TaskRoutes& _trTasks;
  routes::HostRoutes& _hrHosts;
  routes::SettingsRoutes& _srSettings;
};

}  // namespace certmon::api
