#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "common/RunContext.hpp"
#include "common/Types.hpp"
#include "core/SkipPolicy.hpp"

namespace certmon::dal {
class IHostRepository;
}

namespace certmon::notify {
class INotifier;
}

namespace certmon::core {

class IProber;
class IRecordSource;

/// Class abbreviation: rcfg
struct ReconcilerConfig {
  int iSyncConcurrency = 15;
  int iRescanConcurrency = 10;
  int iBatchScanConcurrency = 5;
  size_t uStreamCapacity = 500;
  std::chrono::seconds durSyncTimeout{1200};
  std::chrono::seconds durRescanTimeout{1800};
  std::chrono::seconds durSingleScanTimeout{120};
  int iNotifyBatchSize = 20;
  std::chrono::milliseconds durBatchPause{200};
};

/// Drives synchronization (source -> merge/probe -> deletion -> placeholders)
/// and full rescans. One sync and one rescan may run at a time; a second
/// request of the same kind throws common::ConflictError.
/// Class abbreviation: rec
class Reconciler {
 public:
  Reconciler(ReconcilerConfig rcfg, std::shared_ptr<IRecordSource> spSource,
             std::shared_ptr<IProber> spProber, std::shared_ptr<dal::IHostRepository> spRepo,
             std::shared_ptr<notify::INotifier> spNotifier, SkipPolicy spPolicy);
  ~Reconciler();

  /// Full synchronization against the provider. Failures (source error,
  /// timeout, safety valve) come back as bSuccess=false; no deletion happens then.
  common::SyncReport performSync(std::stop_token stToken = {});

  /// Probe every non-ignored, non-placeholder host and emit SCAN_FINISH.
  common::ScanSummary performRescan(std::stop_token stToken = {});

  /// Probe one persisted host with expiry alerting. Throws common::NotFoundError.
  common::MonitoredHost scanHostById(int64_t iId, std::stop_token stToken = {});

  /// Probe a set of persisted hosts; unknown ids count as failed.
  common::ScanSummary scanHostsById(const std::vector<int64_t>& vIds,
                                    std::stop_token stToken = {});

  /// Probe mhPrior, persist the observed state and emit state-change events.
  /// bCheckExpiry additionally runs the expiry alert rules; a fresh transition
  /// into connection_error runs them regardless.
  common::MonitoredHost scanOne(const common::MonitoredHost& mhPrior, bool bCheckExpiry,
                                const common::RunContext& rcCtx);

  /// SYNC_FINISH, then the deleted names and change details as batched UPDATE events.
  void notifySyncResult(const common::SyncReport& sr);

  bool syncRunning() const { return _bSyncRunning.load(); }
  bool rescanRunning() const { return _bRescanRunning.load(); }

 private:
  struct SyncRun;

  void mergeOne(SyncRun& run, common::MonitoredHost mhFetched,
                std::optional<common::MonitoredHost> oPrior, bool bZoneIsNew);
  void detectZoneChanges(SyncRun& run);
  void deletionPass(SyncRun& run);
  void placeholderPass(SyncRun& run);
  void sendBatches(const std::string& sTitle, const std::vector<std::string>& vItems);

  ReconcilerConfig _rcfg;
  std::shared_ptr<IRecordSource> _spSource;
  std::shared_ptr<IProber> _spProber;
  std::shared_ptr<dal::IHostRepository> _spRepo;
  std::shared_ptr<notify::INotifier> _spNotifier;
  SkipPolicy _spPolicy;

  std::mutex _mtxSync;
  std::mutex _mtxRescan;
  std::atomic<bool> _bSyncRunning{false};
  std::atomic<bool> _bRescanRunning{false};
};

}  // namespace certmon::core
