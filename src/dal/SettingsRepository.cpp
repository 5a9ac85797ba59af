#include "dal/SettingsRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>

namespace certmon::dal {

SettingsRepository::SettingsRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
SettingsRepository::~SettingsRepository() = default;

common::AlertSettings SettingsRepository::get() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("SELECT document::text FROM alert_settings WHERE id = 1");
  txn.commit();

  if (result.empty()) {
    return common::AlertSettings{};
  }
  return nlohmann::json::parse(result[0][0].as<std::string>()).get<common::AlertSettings>();
}

common::AlertSettings SettingsRepository::save(const nlohmann::json& jPatch) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // JSONB || is a shallow merge: top-level keys in the patch win
  auto result = txn.exec(
      "INSERT INTO alert_settings (id, document, updated_at) VALUES (1, $1::jsonb, NOW()) "
      "ON CONFLICT (id) DO UPDATE SET "
      "  document = alert_settings.document || EXCLUDED.document, updated_at = NOW() "
      "RETURNING document::text",
      pqxx::params{jPatch.dump()});
  txn.commit();

  return nlohmann::json::parse(result.one_row()[0].as<std::string>())
      .get<common::AlertSettings>();
}

}  // namespace certmon::dal
