#pragma once

#include <memory>

#include <crow.h>

namespace certmon::core {
class IProber;
class Reconciler;
}  // namespace certmon::core

namespace certmon::dal {
class IHostRepository;
}

namespace certmon::api {
class BackgroundJobs;
}

namespace certmon::api::routes {

/// Handlers that start synchronization and scans, plus the inspection tool.
/// Long-running calls answer 202 and continue on BackgroundJobs.
/// Class abbreviation: tr
class TaskRoutes {
 public:
  TaskRoutes(std::shared_ptr<core::Reconciler> spReconciler,
             std::shared_ptr<core::IProber> spProber,
             std::shared_ptr<dal::IHostRepository> spRepo, BackgroundJobs& bjJobs);
  ~TaskRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  std::shared_ptr<core::Reconciler> _spReconciler;
  std::shared_ptr<core::IProber> _spProber;
  std::shared_ptr<dal::IHostRepository> _spRepo;
  BackgroundJobs& _bjJobs;
};

}  // namespace certmon::api::routes
