#pragma once

#include <memory>

#include <crow.h>

namespace certmon::core {
class Reconciler;
class TaskScheduler;
}  // namespace certmon::core

namespace certmon::api::routes {

/// Handler for /api/v1/health
/// Class abbreviation: hlr
class HealthRoutes {
 public:
  HealthRoutes(std::shared_ptr<core::Reconciler> spReconciler,
               const core::TaskScheduler& tsScheduler);
  ~HealthRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  std::shared_ptr<core::Reconciler> _spReconciler;
  const core::TaskScheduler& _tsScheduler;
};

}  // namespace certmon::api::routes
