#pragma once

#include <memory>

#include <crow.h>

#include "common/Types.hpp"

namespace certmon::dal {
class IHostRepository;
}

namespace certmon::notify {
class INotifier;
}

namespace certmon::api::routes {

/// Handlers for /api/v1/hosts, /api/v1/zones and /api/v1/stats
/// Class abbreviation: hr
class HostRoutes {
 public:
  HostRoutes(std::shared_ptr<dal::IHostRepository> spRepo,
             std::shared_ptr<notify::INotifier> spNotifier);
  ~HostRoutes();

  void registerRoutes(crow::SimpleApp& app);

  /// Build a listing filter from query parameters. Throws common::ValidationError.
  static common::HostFilter filterFromQuery(const crow::query_string& qs);

 private:
  std::shared_ptr<dal::IHostRepository> _spRepo;
  std::shared_ptr<notify::INotifier> _spNotifier;
};

}  // namespace certmon::api::routes
