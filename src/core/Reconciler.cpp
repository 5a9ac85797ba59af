#include "core/Reconciler.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <thread>
#include <utility>

#include "common/BoundedChannel.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/TimeUtils.hpp"
#include "core/HostDiff.hpp"
#include "core/Prober.hpp"
#include "core/RecordSource.hpp"
#include "core/ThreadPool.hpp"
#include "dal/HostRepository.hpp"
#include "notify/Notifier.hpp"

namespace certmon::core {

namespace {

using common::EventType;
using common::HostStatus;
using common::MonitoredHost;

constexpr int kSyncProgressEvery = 20;
constexpr int kRescanProgressEvery = 5;

/// Sets a running flag for the lifetime of a run.
class RunningFlag {
 public:
  explicit RunningFlag(std::atomic<bool>& bFlag) : _bFlag(bFlag) { _bFlag.store(true); }
  ~RunningFlag() { _bFlag.store(false); }

 private:
  std::atomic<bool>& _bFlag;
};

std::string join(const std::vector<std::string>& vItems, const std::string& sSep) {
  std::string sOut;
  for (size_t i = 0; i < vItems.size(); ++i) {
    if (i > 0) sOut += sSep;
    sOut += vItems[i];
  }
  return sOut;
}

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point tpStart) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - tpStart);
}

std::string addDetails(const MonitoredHost& mh) {
  const std::string sProxy = mh.bProxied ? "☁️ Proxied" : "🛡 DNS Only";
  const std::string sStatus =
      mh.status == HostStatus::Active ? "✅ Active" : "⚠️ " + common::toString(mh.status);
  const std::string sDomainExpiry =
      mh.oDomainExpiry ? common::formatDate(*mh.oDomainExpiry) : "Unknown";
  return "🎯 <b>Target</b>: <code>" + mh.sTarget + "</code>\n" +
         "🏷 <b>Type</b>: " + mh.sRecordType + "\n" +
         "⚡ <b>Proxy</b>: " + sProxy + "\n" +
         "📊 <b>Status</b>: " + sStatus + "\n" +
         "📅 <b>Domain expiry</b>: " + sDomainExpiry;
}

}  // namespace

/// Shared state of one synchronization. Fields above the mutex are written by
/// the coordinating thread only; the ones below it are shared with workers.
struct Reconciler::SyncRun {
  common::RunContext rcCtx;
  std::vector<MonitoredHost> vPrior;
  std::set<std::string> setPriorZones;
  std::set<std::string> setSeen;
  std::set<std::string> setZonesWithRealData;
  std::vector<common::ZoneSummary> vZones;
  std::set<std::string> setObservedZones;
  std::set<std::string> setFailedZoneIds;
  std::set<std::string> setFailedZoneNames;
  std::set<int64_t> setDeletedIds;

  std::mutex mtx;
  common::SyncStats stats;
  std::atomic<int> iProcessed{0};

  bool inFailedZone(const MonitoredHost& mh) const {
    return (!mh.sZoneId.empty() && setFailedZoneIds.contains(mh.sZoneId)) ||
           (!mh.sZoneName.empty() && setFailedZoneNames.contains(mh.sZoneName));
  }
};

Reconciler::Reconciler(ReconcilerConfig rcfg, std::shared_ptr<IRecordSource> spSource,
                       std::shared_ptr<IProber> spProber,
                       std::shared_ptr<dal::IHostRepository> spRepo,
                       std::shared_ptr<notify::INotifier> spNotifier, SkipPolicy spPolicy)
    : _rcfg(rcfg),
      _spSource(std::move(spSource)),
      _spProber(std::move(spProber)),
      _spRepo(std::move(spRepo)),
      _spNotifier(std::move(spNotifier)),
      _spPolicy(std::move(spPolicy)) {}

Reconciler::~Reconciler() = default;

common::SyncReport Reconciler::performSync(std::stop_token stToken) {
  std::unique_lock<std::mutex> lockRun(_mtxSync, std::try_to_lock);
  if (!lockRun.owns_lock()) {
    throw common::ConflictError("sync_in_progress", "A synchronization is already running");
  }
  RunningFlag flag(_bSyncRunning);

  auto spLog = common::Logger::get();
  const auto tpStart = std::chrono::steady_clock::now();
  spLog->info("Synchronization started");
  _spNotifier->reloadSettings();

  SyncRun run;
  run.rcCtx = common::RunContext::withDeadline(stToken, _rcfg.durSyncTimeout);
  common::SyncReport sr;

  auto fail = [&](const std::string& sMessage) {
    sr.bSuccess = false;
    sr.sErrorMessage = sMessage;
    sr.stats = run.stats;
    sr.stats.durElapsed = elapsedSince(tpStart);
    spLog->error("Synchronization failed: {}", sMessage);
    return sr;
  };

  try {
    run.vPrior = _spRepo->listAll();
  } catch (const std::exception& e) {
    return fail(std::string("loading stored hosts failed: ") + e.what());
  }

  // ── Fetching ──────────────────────────────────────────────────────────
  std::map<std::string, MonitoredHost> mPrior;
  for (const auto& mh : run.vPrior) {
    if (!mh.isPlaceholder()) mPrior.emplace(mh.sHostname, mh);
    if (!mh.isManual() && !mh.sZoneName.empty()) run.setPriorZones.insert(mh.sZoneName);
  }

  common::BoundedChannel<MonitoredHost> chRecords(_rcfg.uStreamCapacity);
  std::string sSourceError;
  std::jthread thSource([&] {
    try {
      _spSource->stream(chRecords, run.rcCtx);
    } catch (const std::exception& e) {
      sSourceError = e.what();
    }
  });

  // ── Streaming merge ───────────────────────────────────────────────────
  {
    ThreadPool tp(_rcfg.iSyncConcurrency);
    while (auto oRecord = chRecords.pop(run.rcCtx)) {
      MonitoredHost mh = std::move(*oRecord);
      if (!run.setSeen.insert(mh.sHostname).second) continue;

      if (_spPolicy.shouldSkip(mh.sHostname)) {
        std::lock_guard<std::mutex> lock(run.mtx);
        ++run.stats.iSkipped;
        continue;
      }
      if (!mh.sZoneName.empty()) run.setZonesWithRealData.insert(mh.sZoneName);

      std::optional<MonitoredHost> oPrior;
      if (const auto it = mPrior.find(mh.sHostname); it != mPrior.end()) oPrior = it->second;
      const bool bZoneIsNew =
          !mh.sZoneName.empty() && !run.setPriorZones.contains(mh.sZoneName);

      tp.submit([this, &run, mh = std::move(mh), oPrior = std::move(oPrior),
                 bZoneIsNew]() mutable {
        mergeOne(run, std::move(mh), std::move(oPrior), bZoneIsNew);
      });
    }
    tp.wait();
  }
  chRecords.close();
  thSource.join();

  run.vZones = _spSource->observedZones();
  int iRecordsSeen = 0;
  for (const auto& zs : run.vZones) {
    iRecordsSeen += zs.iRecordsSeen;
    run.stats.iSkipped += zs.iSkipped;
    if (!zs.sZoneName.empty()) run.setObservedZones.insert(zs.sZoneName);
    if (zs.bListingFailed) {
      if (!zs.sZoneId.empty()) run.setFailedZoneIds.insert(zs.sZoneId);
      if (!zs.sZoneName.empty()) run.setFailedZoneNames.insert(zs.sZoneName);
    }
  }

  if (!sSourceError.empty()) {
    return fail("record source failed: " + sSourceError);
  }
  if (run.rcCtx.done()) {
    return fail(stToken.stop_requested() ? "synchronization cancelled"
                                         : "synchronization timed out");
  }

  try {
    const auto iStored = std::count_if(run.vPrior.begin(), run.vPrior.end(),
                                       [](const MonitoredHost& mh) { return !mh.isManual(); });
    if (run.setSeen.empty() && iRecordsSeen == 0 && iStored > 0) {
      throw common::ReconciliationAbortedError(
          "safety_valve",
          "provider returned no records while " + std::to_string(iStored) +
              " hosts are stored; deletion pass skipped");
    }
  } catch (const common::ReconciliationAbortedError& e) {
    spLog->warn("Safety valve tripped: {}", e.what());
    return fail(e.what());
  }

  detectZoneChanges(run);
  deletionPass(run);
  placeholderPass(run);

  sr.bSuccess = true;
  sr.stats = run.stats;
  sr.stats.durElapsed = elapsedSince(tpStart);
  spLog->info("Synchronization finished: added={} updated={} deleted={} skipped={} in {}",
              sr.stats.iAdded, sr.stats.iUpdated, sr.stats.iDeleted, sr.stats.iSkipped,
              common::formatDuration(sr.stats.durElapsed));
  return sr;
}

void Reconciler::mergeOne(SyncRun& run, MonitoredHost mhFetched,
                          std::optional<MonitoredHost> oPrior, bool bZoneIsNew) {
  auto spLog = common::Logger::get();
  try {
    if (oPrior) {
      MonitoredHost mhMerged = *oPrior;
      mhMerged.sZoneId = mhFetched.sZoneId;
      mhMerged.sZoneName = mhFetched.sZoneName;
      mhMerged.sRecordType = mhFetched.sRecordType;
      mhMerged.sTarget = mhFetched.sTarget;
      mhMerged.bProxied = mhFetched.bProxied;
      mhMerged.sComment = mhFetched.sComment;
      if (!mhMerged.oDomainExpiry && mhFetched.oDomainExpiry) {
        mhMerged.oDomainExpiry = mhFetched.oDomainExpiry;
        mhMerged.iDomainDaysLeft = mhFetched.iDomainDaysLeft;
      }

      const auto vConfigChanges = computeConfigChanges(*oPrior, mhMerged);
      scanOne(mhMerged, false, run.rcCtx);

      if (!vConfigChanges.empty()) {
        {
          std::lock_guard<std::mutex> lock(run.mtx);
          ++run.stats.iUpdated;
          run.stats.vUpdatedDetails.push_back("<b>" + mhMerged.sHostname + "</b>\n   ↳ " +
                                              join(vConfigChanges, "\n   ↳ "));
        }
        _spNotifier->notifyOperation(EventType::Update, mhMerged.sHostname,
                                     join(vConfigChanges, "\n"));
      }
    } else {
      mhFetched.status = HostStatus::Pending;
      mhFetched.iId = _spRepo->upsert(mhFetched);
      const auto mhScanned = scanOne(mhFetched, false, run.rcCtx);

      {
        std::lock_guard<std::mutex> lock(run.mtx);
        ++run.stats.iAdded;
        run.stats.vAddedNames.push_back(mhFetched.sHostname);
      }
      if (bZoneIsNew) {
        spLog->debug("ADD for {} muted: zone {} is new", mhFetched.sHostname,
                     mhFetched.sZoneName);
      } else {
        _spNotifier->notifyOperation(EventType::Add, mhScanned.sHostname,
                                     addDetails(mhScanned));
      }
    }
  } catch (const std::exception& e) {
    spLog->error("Merging {} failed: {}", mhFetched.sHostname, e.what());
  }

  const int iDone = ++run.iProcessed;
  if (iDone % kSyncProgressEvery == 0) {
    spLog->info("Synchronization progress: {} hosts processed", iDone);
  }
}

void Reconciler::detectZoneChanges(SyncRun& run) {
  auto spLog = common::Logger::get();

  std::map<std::string, int> mEligible;
  for (const auto& zs : run.vZones) {
    if (!zs.sZoneName.empty()) mEligible[zs.sZoneName] += zs.iEligible;
  }
  for (const auto& [sZone, iCount] : mEligible) {
    if (run.setPriorZones.contains(sZone)) continue;
    spLog->info("New zone discovered: {} ({} hosts, per-host notifications muted)", sZone,
                iCount);
    _spNotifier->notifyOperation(
        EventType::ZoneAdd, sZone,
        "Source: Cloudflare sync\nA new zone was added to Cloudflare and is now monitored.\n"
        "Subdomains: " + std::to_string(iCount) +
            "\n(Per-host add notifications for this zone are muted 🔕)");
  }

  for (const auto& sZone : run.setPriorZones) {
    if (run.setObservedZones.contains(sZone) || run.setFailedZoneNames.contains(sZone)) continue;

    int iCount = 0;
    bool bProtected = false;
    for (const auto& mh : run.vPrior) {
      if (mh.sZoneName != sZone) continue;
      bProtected = bProtected || run.inFailedZone(mh);
      if (!mh.isPlaceholder()) ++iCount;
    }
    if (bProtected) continue;

    spLog->info("Zone removed: {} ({} hosts)", sZone, iCount);
    _spNotifier->notifyOperation(
        EventType::ZoneDelete, sZone,
        "Source: Cloudflare sync\nThe zone was removed from Cloudflare; its hosts are cleaned up.\n"
        "Affected subdomains: " + std::to_string(iCount));
  }
}

void Reconciler::deletionPass(SyncRun& run) {
  auto spLog = common::Logger::get();
  for (const auto& mh : run.vPrior) {
    if (mh.isManual()) continue;
    if (run.inFailedZone(mh)) continue;

    if (mh.isPlaceholder()) {
      if (run.setObservedZones.contains(mh.sZoneName)) continue;
      try {
        if (_spRepo->deleteById(mh.iId)) run.setDeletedIds.insert(mh.iId);
        spLog->info("Removed placeholder of vanished zone {}", mh.sZoneName);
      } catch (const std::exception& e) {
        spLog->error("Removing placeholder {} failed: {}", mh.sZoneName, e.what());
      }
      continue;
    }

    if (run.setSeen.contains(mh.sHostname) || _spPolicy.shouldSkip(mh.sHostname)) continue;

    try {
      if (!_spRepo->deleteById(mh.iId)) continue;
    } catch (const std::exception& e) {
      spLog->error("Deleting {} failed: {}", mh.sHostname, e.what());
      continue;
    }
    run.setDeletedIds.insert(mh.iId);
    ++run.stats.iDeleted;
    run.stats.vDeletedNames.push_back(mh.sHostname);
    spLog->info("Deleted {}: no longer present at the provider", mh.sHostname);
    _spNotifier->notifyOperation(
        EventType::Delete, mh.sHostname,
        "Source: Cloudflare sync\nThe record was removed from Cloudflare and has been deleted.");
  }
}

void Reconciler::placeholderPass(SyncRun& run) {
  auto spLog = common::Logger::get();

  std::set<std::string> setSurvivingZones;
  for (const auto& mh : run.vPrior) {
    if (run.setDeletedIds.contains(mh.iId)) continue;

    if (mh.isPlaceholder() && run.setZonesWithRealData.contains(mh.sZoneName)) {
      try {
        _spRepo->deleteById(mh.iId);
        spLog->info("Removed placeholder of {}: zone now has hosts", mh.sZoneName);
      } catch (const std::exception& e) {
        spLog->error("Removing placeholder {} failed: {}", mh.sZoneName, e.what());
      }
      continue;
    }
    if (!mh.sZoneName.empty()) setSurvivingZones.insert(mh.sZoneName);
  }

  for (const auto& zs : run.vZones) {
    if (zs.sZoneName.empty() || zs.bListingFailed) continue;
    if (run.setZonesWithRealData.contains(zs.sZoneName)) continue;
    if (setSurvivingZones.contains(zs.sZoneName)) continue;

    try {
      _spRepo->create(common::makeZonePlaceholder(zs.sZoneId, zs.sZoneName));
      setSurvivingZones.insert(zs.sZoneName);
      spLog->info("Created placeholder for zone {} ({} records, none eligible)", zs.sZoneName,
                  zs.iRecordsSeen);
    } catch (const std::exception& e) {
      spLog->error("Creating placeholder for {} failed: {}", zs.sZoneName, e.what());
    }
  }
}

MonitoredHost Reconciler::scanOne(const MonitoredHost& mhPrior, bool bCheckExpiry,
                                  const common::RunContext& rcCtx) {
  MonitoredHost mhNew = _spProber->probe(mhPrior.sHostname, mhPrior.iPort, rcCtx);

  mhNew.iId = mhPrior.iId;
  mhNew.sZoneId = mhPrior.sZoneId;
  mhNew.sRecordId = mhPrior.sRecordId;
  mhNew.sZoneName = mhPrior.sZoneName;
  mhNew.sRecordType = mhPrior.sRecordType;
  mhNew.sTarget = mhPrior.sTarget;
  mhNew.bProxied = mhPrior.bProxied;
  mhNew.sComment = mhPrior.sComment;
  mhNew.bIgnored = mhPrior.bIgnored;
  mhNew.iPort = mhPrior.iPort;
  mhNew.bAutoRenew = mhPrior.bAutoRenew;
  mhNew.oCreatedAt = mhPrior.oCreatedAt;
  mhNew.oLastAlertAt = mhPrior.oLastAlertAt;

  const std::string sDomain =
      mhPrior.sZoneName.empty() ? registrableDomain(mhPrior.sHostname) : mhPrior.sZoneName;
  const auto ri = _spProber->cachedRegistrationLookup(sDomain, mhPrior.oDomainExpiry,
                                                      mhPrior.iDomainDaysLeft, rcCtx);
  mhNew.oDomainExpiry = ri.oExpiry;
  mhNew.iDomainDaysLeft = ri.iDaysLeft;

  const auto vChanges = computeStateChanges(mhPrior, mhNew);

  try {
    _spRepo->updateProbeFields(mhNew);
  } catch (const std::exception& e) {
    common::Logger::get()->error("Persisting probe result for {} failed: {}", mhNew.sHostname,
                                 e.what());
  }

  if (mhPrior.status != HostStatus::Pending && !vChanges.empty()) {
    if (isRenewal(mhPrior, mhNew)) {
      _spNotifier->notifyOperation(EventType::Renew, mhNew.sHostname, vChanges.front());
      if (vChanges.size() > 1) {
        _spNotifier->notifyOperation(
            EventType::Update, mhNew.sHostname,
            join(std::vector<std::string>(vChanges.begin() + 1, vChanges.end()), "\n"));
      }
    } else {
      _spNotifier->notifyOperation(EventType::Update, mhNew.sHostname, join(vChanges, "\n"));
    }
  }

  const bool bFreshConnectionError = mhNew.status == HostStatus::ConnectionError &&
                                     mhPrior.status != HostStatus::ConnectionError;
  if (bCheckExpiry || bFreshConnectionError) {
    _spNotifier->checkAndNotify(mhNew);
  }
  return mhNew;
}

common::ScanSummary Reconciler::performRescan(std::stop_token stToken) {
  std::unique_lock<std::mutex> lockRun(_mtxRescan, std::try_to_lock);
  if (!lockRun.owns_lock()) {
    throw common::ConflictError("rescan_in_progress", "A full rescan is already running");
  }
  RunningFlag flag(_bRescanRunning);

  auto spLog = common::Logger::get();
  const auto tpStart = std::chrono::steady_clock::now();
  _spNotifier->reloadSettings();

  std::vector<MonitoredHost> vHosts;
  for (auto& mh : _spRepo->listAll()) {
    if (!mh.bIgnored && !mh.isPlaceholder()) vHosts.push_back(std::move(mh));
  }
  spLog->info("Full rescan started: {} hosts", vHosts.size());

  const auto rcCtx = common::RunContext::withDeadline(stToken, _rcfg.durRescanTimeout);
  common::ScanSummary scs;
  scs.iTotal = static_cast<int>(vHosts.size());
  std::mutex mtxTally;
  std::atomic<int> iProcessed{0};
  {
    ThreadPool tp(_rcfg.iRescanConcurrency);
    for (const auto& mh : vHosts) {
      if (rcCtx.done()) {
        spLog->warn("Full rescan stopped early: {} of {} hosts submitted", iProcessed.load(),
                    vHosts.size());
        break;
      }
      tp.submit([&, mh] {
        try {
          const auto mhNew = scanOne(mh, true, rcCtx);
          std::lock_guard<std::mutex> lock(mtxTally);
          switch (mhNew.status) {
            case HostStatus::Active:
              ++scs.iActive;
              break;
            case HostStatus::Expired:
              ++scs.iExpired;
              break;
            default:
              ++scs.iWarning;
              break;
          }
        } catch (const std::exception& e) {
          spLog->error("Rescan of {} failed: {}", mh.sHostname, e.what());
          std::lock_guard<std::mutex> lock(mtxTally);
          ++scs.iFailed;
        }
        const int iDone = ++iProcessed;
        if (iDone % kRescanProgressEvery == 0) {
          spLog->info("Rescan progress: {}/{}", iDone, vHosts.size());
        }
      });
    }
    tp.wait();
  }
  scs.durElapsed = elapsedSince(tpStart);

  notify::TaskSummaryData tsd;
  tsd.iTotal = scs.iTotal;
  tsd.iActive = scs.iActive;
  tsd.iExpired = scs.iExpired;
  tsd.iWarning = scs.iWarning;
  try {
    const auto as = _spRepo->getAggregateStatistics();
    const auto count = [&as](const char* pStatus) {
      const auto it = as.mStatusCounts.find(pStatus);
      return it == as.mStatusCounts.end() ? 0 : static_cast<int>(it->second);
    };
    tsd.iTotal = static_cast<int>(as.iTotal);
    tsd.iActive = count("active");
    tsd.iExpired = count("expired");
    tsd.iWarning = count("warning") + count("unresolvable");
  } catch (const std::exception& e) {
    spLog->warn("Statistics unavailable, reporting this run's tally: {}", e.what());
  }
  tsd.sDuration = common::formatDuration(scs.durElapsed);
  _spNotifier->notifyTaskFinish(EventType::ScanFinish, tsd);

  spLog->info("Full rescan finished: active={} expired={} warning={} failed={} in {}",
              scs.iActive, scs.iExpired, scs.iWarning, scs.iFailed, tsd.sDuration);
  return scs;
}

MonitoredHost Reconciler::scanHostById(int64_t iId, std::stop_token stToken) {
  auto oHost = _spRepo->findById(iId);
  if (!oHost) {
    throw common::NotFoundError("host_not_found", "Host " + std::to_string(iId) + " not found");
  }
  _spNotifier->reloadSettings();
  const auto rcCtx = common::RunContext::withDeadline(stToken, _rcfg.durSingleScanTimeout);
  return scanOne(*oHost, true, rcCtx);
}

common::ScanSummary Reconciler::scanHostsById(const std::vector<int64_t>& vIds,
                                              std::stop_token stToken) {
  auto spLog = common::Logger::get();
  const auto tpStart = std::chrono::steady_clock::now();
  _spNotifier->reloadSettings();
  const auto rcCtx = common::RunContext::withDeadline(stToken, _rcfg.durRescanTimeout);

  common::ScanSummary scs;
  scs.iTotal = static_cast<int>(vIds.size());
  std::mutex mtxTally;
  {
    ThreadPool tp(_rcfg.iBatchScanConcurrency);
    for (const int64_t iId : vIds) {
      tp.submit([&, iId] {
        try {
          const auto oHost = _spRepo->findById(iId);
          if (!oHost) {
            spLog->warn("Batch scan: host {} not found", iId);
            std::lock_guard<std::mutex> lock(mtxTally);
            ++scs.iFailed;
            return;
          }
          const auto mhNew = scanOne(*oHost, true, rcCtx);
          std::lock_guard<std::mutex> lock(mtxTally);
          if (mhNew.status == HostStatus::Active) {
            ++scs.iActive;
          } else if (mhNew.status == HostStatus::Expired) {
            ++scs.iExpired;
          } else {
            ++scs.iWarning;
          }
        } catch (const std::exception& e) {
          spLog->error("Batch scan of host {} failed: {}", iId, e.what());
          std::lock_guard<std::mutex> lock(mtxTally);
          ++scs.iFailed;
        }
      });
    }
    tp.wait();
  }
  scs.durElapsed = elapsedSince(tpStart);

  notify::TaskSummaryData tsd;
  tsd.iTotal = scs.iTotal;
  tsd.iActive = scs.iActive;
  tsd.iExpired = scs.iExpired;
  tsd.iWarning = scs.iWarning;
  tsd.sDuration = common::formatDuration(scs.durElapsed);
  tsd.sDetails = "Manual batch scan of " + std::to_string(vIds.size()) + " host(s), " +
                 std::to_string(scs.iFailed) + " failed";
  _spNotifier->notifyTaskFinish(EventType::ScanFinish, tsd);
  return scs;
}

void Reconciler::notifySyncResult(const common::SyncReport& sr) {
  notify::TaskSummaryData tsd;
  tsd.iAdded = sr.stats.iAdded;
  tsd.iUpdated = sr.stats.iUpdated;
  tsd.iDeleted = sr.stats.iDeleted;
  tsd.iSkipped = sr.stats.iSkipped;
  tsd.sDuration = common::formatDuration(sr.stats.durElapsed);
  _spNotifier->notifyTaskFinish(EventType::SyncFinish, tsd);

  if (!sr.stats.vDeletedNames.empty()) {
    std::vector<std::string> vItems;
    for (const auto& sName : sr.stats.vDeletedNames) vItems.push_back("🔸 " + sName);
    sendBatches("🗑 Deleted hosts", vItems);
  }
  if (!sr.stats.vUpdatedDetails.empty()) {
    sendBatches("🛠 Change details", sr.stats.vUpdatedDetails);
  }
}

void Reconciler::sendBatches(const std::string& sTitle, const std::vector<std::string>& vItems) {
  const size_t uBatch = static_cast<size_t>(std::max(1, _rcfg.iNotifyBatchSize));
  const size_t uPages = (vItems.size() + uBatch - 1) / uBatch;
  for (size_t uPage = 0; uPage < uPages; ++uPage) {
    const auto itBegin = vItems.begin() + static_cast<std::ptrdiff_t>(uPage * uBatch);
    const auto itEnd = vItems.begin() +
                       static_cast<std::ptrdiff_t>(std::min(vItems.size(), (uPage + 1) * uBatch));
    std::string sPageTitle = sTitle;
    if (uPages > 1) {
      sPageTitle += " (" + std::to_string(uPage + 1) + "/" + std::to_string(uPages) + ")";
    }
    _spNotifier->notifyOperation(EventType::Update, sPageTitle,
                                 join(std::vector<std::string>(itBegin, itEnd), "\n"));
    if (uPage + 1 < uPages) std::this_thread::sleep_for(_rcfg.durBatchPause);
  }
}

}  // namespace certmon::core
