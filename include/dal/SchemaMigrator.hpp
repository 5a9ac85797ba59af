#pragma once

namespace certmon::dal {

class ConnectionPool;

/// Creates the monitored_hosts and alert_settings tables when absent.
/// Idempotent; run once at startup before any repository is used.
/// Class abbreviation: sm
class SchemaMigrator {
 public:
  explicit SchemaMigrator(ConnectionPool& cpPool);

  void apply();

 private:
  ConnectionPool& _cpPool;
};

}  // namespace certmon::dal
