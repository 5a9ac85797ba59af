#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace certmon::dal {

class ConnectionPool;

/// Persisted-state seam for monitored hosts.
/// Writes are keyed by (hostname, record_id); no locking beyond the store's own.
class IHostRepository {
 public:
  virtual ~IHostRepository() = default;

  /// Insert-or-update keyed by (hostname, record_id). Writes provider-owned and
  /// observed fields; created_at and is_ignored=false are set on insert only.
  /// User-owned fields of an existing row are never touched. Returns the row id.
  virtual int64_t upsert(const common::MonitoredHost& mh) = 0;

  /// Plain insert including user-owned fields (manual hosts, placeholders).
  virtual int64_t create(const common::MonitoredHost& mh) = 0;

  virtual std::optional<common::MonitoredHost> findById(int64_t iId) = 0;
  virtual std::optional<common::MonitoredHost> findByHostname(const std::string& sHostname) = 0;

  virtual common::HostPage list(const common::HostFilter& hf) = 0;

  /// Every persisted host, unfiltered (placeholders and ignored included).
  virtual std::vector<common::MonitoredHost> listAll() = 0;

  virtual std::vector<std::string> listZones() = 0;

  /// Returns false if no row had that id.
  virtual bool deleteById(int64_t iId) = 0;

  virtual int batchUpdateIgnored(const std::vector<int64_t>& vIds, bool bIgnored) = 0;

  /// User-owned fields only.
  virtual void updateUserSettings(int64_t iId, bool bIgnored, int iPort, bool bAutoRenew) = 0;

  /// Observed-state fields plus last_check_at; keyed by id.
  virtual void updateProbeFields(const common::MonitoredHost& mh) = 0;

  virtual void updateLastAlertTime(int64_t iId, common::SysTime tpWhen) = 0;

  virtual common::AggregateStatistics getAggregateStatistics() = 0;
};

/// PostgreSQL implementation over the monitored_hosts table.
/// Class abbreviation: hr
class HostRepository : public IHostRepository {
 public:
  explicit HostRepository(ConnectionPool& cpPool);
  ~HostRepository() override;

  int64_t upsert(const common::MonitoredHost& mh) override;
  int64_t create(const common::MonitoredHost& mh) override;
  std::optional<common::MonitoredHost> findById(int64_t iId) override;
  std::optional<common::MonitoredHost> findByHostname(const std::string& sHostname) override;
  common::HostPage list(const common::HostFilter& hf) override;
  std::vector<common::MonitoredHost> listAll() override;
  std::vector<std::string> listZones() override;
  bool deleteById(int64_t iId) override;
  int batchUpdateIgnored(const std::vector<int64_t>& vIds, bool bIgnored) override;
  void updateUserSettings(int64_t iId, bool bIgnored, int iPort, bool bAutoRenew) override;
  void updateProbeFields(const common::MonitoredHost& mh) override;
  void updateLastAlertTime(int64_t iId, common::SysTime tpWhen) override;
  common::AggregateStatistics getAggregateStatistics() override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace certmon::dal
