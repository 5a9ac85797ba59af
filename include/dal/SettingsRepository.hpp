#pragma once

#include <nlohmann/json_fwd.hpp>

#include "common/AlertSettings.hpp"

namespace certmon::dal {

class ConnectionPool;

/// Single global AlertSettings document.
class ISettingsRepository {
 public:
  virtual ~ISettingsRepository() = default;

  /// Stored settings, or defaults when nothing was saved yet.
  virtual common::AlertSettings get() = 0;

  /// Merge jPatch into the stored document (keys absent from jPatch keep their
  /// stored value) and return the merged result.
  virtual common::AlertSettings save(const nlohmann::json& jPatch) = 0;
};

/// PostgreSQL implementation over the single-row alert_settings table.
/// Class abbreviation: str
class SettingsRepository : public ISettingsRepository {
 public:
  explicit SettingsRepository(ConnectionPool& cpPool);
  ~SettingsRepository() override;

  common::AlertSettings get() override;
  common::AlertSettings save(const nlohmann::json& jPatch) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace certmon::dal
