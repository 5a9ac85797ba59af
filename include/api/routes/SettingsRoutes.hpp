#pragma once

#include <memory>

#include <crow.h>

namespace certmon::core {
class ScheduleManager;
}

namespace certmon::dal {
class ISettingsRepository;
}

namespace certmon::notify {
class INotifier;
}

namespace certmon::api::routes {

/// Handlers for /api/v1/settings
/// Class abbreviation: sr
class SettingsRoutes {
 public:
  SettingsRoutes(std::shared_ptr<dal::ISettingsRepository> spSettingsRepo,
                 std::shared_ptr<notify::INotifier> spNotifier, core::ScheduleManager& smManager);
  ~SettingsRoutes();

  void registerRoutes(crow::SimpleApp& app);

 private:
  std::shared_ptr<dal::ISettingsRepository> _spSettingsRepo;
  std::shared_ptr<notify::INotifier> _spNotifier;
  core::ScheduleManager& _smManager;
};

}  // namespace certmon::api::routes
