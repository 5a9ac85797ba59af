#pragma once

/// In-process fakes of the collaborator interfaces used by the unit tests.

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/AlertSettings.hpp"
#include "common/BoundedChannel.hpp"
#include "common/Errors.hpp"
#include "common/HttpClient.hpp"
#include "common/TimeUtils.hpp"
#include "common/Types.hpp"
#include "core/Prober.hpp"
#include "core/RecordSource.hpp"
#include "dal/HostRepository.hpp"
#include "dal/SettingsRepository.hpp"
#include "notify/Notifier.hpp"
#include "providers/IProvider.hpp"

namespace certmon::test {

// ── HTTP ────────────────────────────────────────────────────────────────────

/// Records every request; answers with queued responses, then with the default.
class FakeHttpClient : public common::IHttpClient {
 public:
  common::HttpResponse send(const common::HttpRequest& hreq) override {
    std::lock_guard<std::mutex> lock(_mtx);
    vRequests.push_back(hreq);
    if (bThrowConnectionError) {
      throw common::ConnectionError("http_connect_failed", "Connection refused");
    }
    if (!vQueued.empty()) {
      auto hresp = vQueued.front();
      vQueued.erase(vQueued.begin());
      return hresp;
    }
    return hrespDefault;
  }

  void queue(int iStatus, std::string sBody) {
    common::HttpResponse hresp;
    hresp.iStatus = iStatus;
    hresp.sBody = std::move(sBody);
    vQueued.push_back(std::move(hresp));
  }

  std::vector<common::HttpRequest> requests() {
    std::lock_guard<std::mutex> lock(_mtx);
    return vRequests;
  }

  std::vector<common::HttpRequest> vRequests;
  std::vector<common::HttpResponse> vQueued;
  common::HttpResponse hrespDefault{200, "{}", std::chrono::milliseconds(5)};
  bool bThrowConnectionError = false;

 private:
  std::mutex _mtx;
};

// ── Provider ────────────────────────────────────────────────────────────────

class FakeProvider : public providers::IProvider {
 public:
  std::string name() const override { return "fake"; }

  std::vector<common::ProviderZone> listZones() override {
    if (bFailListZones) throw common::ProviderError("provider_unreachable", "zone list failed");
    return vZones;
  }

  common::ProviderZone getZone(const std::string& sZoneId) override {
    for (const auto& pz : vZones) {
      if (pz.sId == sZoneId) return pz;
    }
    throw common::ProviderError("zone_not_found", "no zone " + sZoneId);
  }

  common::RecordPage listRecords(const std::string& sZoneId, int iPage, int iPerPage) override {
    ++iListCalls;
    if (setFailingZones.contains(sZoneId)) {
      throw common::ProviderError("provider_unreachable", "listing failed for " + sZoneId);
    }
    const auto& vAll = mRecords[sZoneId];
    common::RecordPage rp;
    rp.iPage = iPage;
    rp.iTotalPages = vAll.empty() ? 1 : static_cast<int>((vAll.size() + iPerPage - 1) / iPerPage);
    const size_t uStart = static_cast<size_t>((iPage - 1) * iPerPage);
    for (size_t i = uStart; i < vAll.size() && i < uStart + static_cast<size_t>(iPerPage); ++i) {
      rp.vRecords.push_back(vAll[i]);
    }
    return rp;
  }

  common::ProviderRecord getRecord(const std::string& sZoneId,
                                   const std::string& sRecordId) override {
    for (const auto& prec : mRecords[sZoneId]) {
      if (prec.sId == sRecordId) return prec;
    }
    throw common::ProviderError("record_not_found", "no record " + sRecordId);
  }

  void addZone(const std::string& sId, const std::string& sName,
               const std::string& sStatus = "active") {
    vZones.push_back(common::ProviderZone{sId, sName, sStatus});
  }

  void addRecord(const std::string& sZoneId, const std::string& sName,
                 const std::string& sType = "A", const std::string& sContent = "192.0.2.1",
                 bool bProxied = false) {
    common::ProviderRecord prec;
    prec.sId = "rec-" + sName;
    prec.sZoneId = sZoneId;
    prec.sName = sName;
    prec.sType = sType;
    prec.sContent = sContent;
    prec.bProxied = bProxied;
    for (const auto& pz : vZones) {
      if (pz.sId == sZoneId) prec.sZoneName = pz.sName;
    }
    mRecords[sZoneId].push_back(prec);
  }

  std::vector<common::ProviderZone> vZones;
  std::map<std::string, std::vector<common::ProviderRecord>> mRecords;
  std::set<std::string> setFailingZones;
  bool bFailListZones = false;
  int iListCalls = 0;
};

// ── Registration lookup ─────────────────────────────────────────────────────

class FakeRegistrationLookup : public core::IRegistrationLookup {
 public:
  common::SysTime lookupExpiry(const std::string& sDomain,
                               const common::RunContext& /*rcCtx*/) override {
    std::lock_guard<std::mutex> lock(_mtx);
    vQueried.push_back(sDomain);
    if (bFail) throw common::RegistrationLookupError("whois_failed", "no answer");
    return tpExpiry;
  }

  std::vector<std::string> queried() {
    std::lock_guard<std::mutex> lock(_mtx);
    return vQueried;
  }

  common::SysTime tpExpiry = common::makeUtc(2030, 1, 1);
  bool bFail = false;
  std::vector<std::string> vQueried;

 private:
  std::mutex _mtx;
};

// ── Host repository ─────────────────────────────────────────────────────────

class FakeHostRepository : public dal::IHostRepository {
 public:
  int64_t upsert(const common::MonitoredHost& mh) override {
    std::lock_guard<std::mutex> lock(_mtx);
    ++iUpserts;
    for (auto& mhStored : _vHosts) {
      if (mhStored.sHostname == mh.sHostname && mhStored.sRecordId == mh.sRecordId) {
        const auto mhUser = mhStored;
        mhStored = mh;
        mhStored.iId = mhUser.iId;
        mhStored.bIgnored = mhUser.bIgnored;
        mhStored.iPort = mhUser.iPort;
        mhStored.bAutoRenew = mhUser.bAutoRenew;
        mhStored.oCreatedAt = mhUser.oCreatedAt;
        mhStored.oLastAlertAt = mhUser.oLastAlertAt;
        return mhStored.iId;
      }
    }
    auto mhNew = mh;
    mhNew.iId = ++_iNextId;
    mhNew.bIgnored = false;
    mhNew.oCreatedAt = std::chrono::system_clock::now();
    _vHosts.push_back(mhNew);
    return mhNew.iId;
  }

  int64_t create(const common::MonitoredHost& mh) override {
    std::lock_guard<std::mutex> lock(_mtx);
    ++iCreates;
    auto mhNew = mh;
    mhNew.iId = ++_iNextId;
    _vHosts.push_back(mhNew);
    return mhNew.iId;
  }

  std::optional<common::MonitoredHost> findById(int64_t iId) override {
    std::lock_guard<std::mutex> lock(_mtx);
    for (const auto& mh : _vHosts) {
      if (mh.iId == iId) return mh;
    }
    return std::nullopt;
  }

  std::optional<common::MonitoredHost> findByHostname(const std::string& sHostname) override {
    std::lock_guard<std::mutex> lock(_mtx);
    for (const auto& mh : _vHosts) {
      if (mh.sHostname == sHostname) return mh;
    }
    return std::nullopt;
  }

  common::HostPage list(const common::HostFilter& /*hf*/) override {
    std::lock_guard<std::mutex> lock(_mtx);
    return common::HostPage{_vHosts, static_cast<int64_t>(_vHosts.size())};
  }

  std::vector<common::MonitoredHost> listAll() override {
    std::lock_guard<std::mutex> lock(_mtx);
    if (bFailListAll) throw std::runtime_error("database unavailable");
    return _vHosts;
  }

  std::vector<std::string> listZones() override {
    std::lock_guard<std::mutex> lock(_mtx);
    std::set<std::string> setZones;
    for (const auto& mh : _vHosts) {
      if (!mh.sZoneName.empty()) setZones.insert(mh.sZoneName);
    }
    return {setZones.begin(), setZones.end()};
  }

  bool deleteById(int64_t iId) override {
    std::lock_guard<std::mutex> lock(_mtx);
    const auto it = std::find_if(_vHosts.begin(), _vHosts.end(),
                                 [iId](const common::MonitoredHost& mh) { return mh.iId == iId; });
    if (it == _vHosts.end()) return false;
    _vHosts.erase(it);
    ++iDeletes;
    return true;
  }

  int batchUpdateIgnored(const std::vector<int64_t>& vIds, bool bIgnored) override {
    std::lock_guard<std::mutex> lock(_mtx);
    int iChanged = 0;
    for (auto& mh : _vHosts) {
      if (std::find(vIds.begin(), vIds.end(), mh.iId) != vIds.end()) {
        mh.bIgnored = bIgnored;
        ++iChanged;
      }
    }
    return iChanged;
  }

  void updateUserSettings(int64_t iId, bool bIgnored, int iPort, bool bAutoRenew) override {
    std::lock_guard<std::mutex> lock(_mtx);
    for (auto& mh : _vHosts) {
      if (mh.iId == iId) {
        mh.bIgnored = bIgnored;
        mh.iPort = iPort;
        mh.bAutoRenew = bAutoRenew;
      }
    }
  }

  void updateProbeFields(const common::MonitoredHost& mhProbed) override {
    std::lock_guard<std::mutex> lock(_mtx);
    ++iProbeUpdates;
    for (auto& mh : _vHosts) {
      if (mh.iId != mhProbed.iId) continue;
      const auto mhUser = mh;
      mh = mhProbed;
      mh.bIgnored = mhUser.bIgnored;
      mh.iPort = mhUser.iPort;
      mh.bAutoRenew = mhUser.bAutoRenew;
      mh.oCreatedAt = mhUser.oCreatedAt;
      mh.oLastAlertAt = mhUser.oLastAlertAt;
      mh.oLastCheckAt = std::chrono::system_clock::now();
    }
  }

  void updateLastAlertTime(int64_t iId, common::SysTime tpWhen) override {
    std::lock_guard<std::mutex> lock(_mtx);
    for (auto& mh : _vHosts) {
      if (mh.iId == iId) mh.oLastAlertAt = tpWhen;
    }
  }

  common::AggregateStatistics getAggregateStatistics() override {
    std::lock_guard<std::mutex> lock(_mtx);
    common::AggregateStatistics as;
    for (const auto& mh : _vHosts) {
      if (mh.bIgnored) {
        ++as.iIgnored;
        continue;
      }
      ++as.iTotal;
      ++as.mStatusCounts[common::toString(mh.status)];
    }
    return as;
  }

  /// Seed a stored host directly; returns its id.
  int64_t seed(common::MonitoredHost mh) {
    std::lock_guard<std::mutex> lock(_mtx);
    mh.iId = ++_iNextId;
    _vHosts.push_back(mh);
    return mh.iId;
  }

  std::vector<common::MonitoredHost> hosts() {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vHosts;
  }

  std::atomic<int> iUpserts{0};
  std::atomic<int> iCreates{0};
  std::atomic<int> iDeletes{0};
  std::atomic<int> iProbeUpdates{0};
  bool bFailListAll = false;

 private:
  std::mutex _mtx;
  std::vector<common::MonitoredHost> _vHosts;
  int64_t _iNextId = 0;
};

// ── Settings repository ─────────────────────────────────────────────────────

class FakeSettingsRepository : public dal::ISettingsRepository {
 public:
  common::AlertSettings get() override {
    std::lock_guard<std::mutex> lock(_mtx);
    ++iGets;
    if (bFail) throw std::runtime_error("settings unavailable");
    return als;
  }

  common::AlertSettings save(const nlohmann::json& jPatch) override {
    std::lock_guard<std::mutex> lock(_mtx);
    nlohmann::json jStored = als;
    jStored.update(jPatch);
    als = jStored.get<common::AlertSettings>();
    return als;
  }

  void set(const common::AlertSettings& alsNew) {
    std::lock_guard<std::mutex> lock(_mtx);
    als = alsNew;
  }

  common::AlertSettings als;
  std::atomic<int> iGets{0};
  bool bFail = false;

 private:
  std::mutex _mtx;
};

// ── Prober ──────────────────────────────────────────────────────────────────

/// Answers every probe with a healthy certificate unless a per-host result is set.
class FakeProber : public core::IProber {
 public:
  common::MonitoredHost probe(const std::string& sHostname, int iPort,
                              const common::RunContext& /*rcCtx*/) override {
    std::lock_guard<std::mutex> lock(_mtx);
    vProbed.push_back(sHostname);
    if (const auto it = mResults.find(sHostname); it != mResults.end()) {
      auto mh = it->second;
      mh.sHostname = sHostname;
      mh.iPort = iPort;
      return mh;
    }
    common::MonitoredHost mh;
    mh.sHostname = sHostname;
    mh.iPort = iPort;
    mh.status = common::HostStatus::Active;
    mh.sIssuer = "Test CA";
    mh.oNotBefore = tpNotBefore;
    mh.oNotAfter = tpNotAfter;
    mh.iDaysRemaining = common::daysUntil(tpNotAfter);
    mh.sTlsVersion = "TLS 1.3";
    mh.bIsMatch = true;
    mh.iHttpStatusCode = 200;
    mh.vResolvedIps = {"192.0.2.1"};
    mh.sResolvedRecord = "192.0.2.1";
    return mh;
  }

  core::RegistrationInfo cachedRegistrationLookup(const std::string& /*sDomain*/,
                                                  std::optional<common::SysTime> oPriorExpiry,
                                                  int iPriorDaysLeft,
                                                  const common::RunContext& /*rcCtx*/) override {
    return core::RegistrationInfo{oPriorExpiry, iPriorDaysLeft};
  }

  common::MonitoredHost inspect(const std::string& sHostname, int iPort,
                                const common::RunContext& rcCtx) override {
    return probe(sHostname, iPort, rcCtx);
  }

  void setResult(const std::string& sHostname, common::MonitoredHost mh) {
    std::lock_guard<std::mutex> lock(_mtx);
    mResults[sHostname] = std::move(mh);
  }

  std::vector<std::string> probed() {
    std::lock_guard<std::mutex> lock(_mtx);
    return vProbed;
  }

  common::SysTime tpNotBefore = common::makeUtc(2025, 1, 1);
  common::SysTime tpNotAfter = std::chrono::system_clock::now() + std::chrono::hours(24 * 80);

 private:
  std::mutex _mtx;
  std::map<std::string, common::MonitoredHost> mResults;
  std::vector<std::string> vProbed;
};

// ── Notifier ────────────────────────────────────────────────────────────────

/// Class abbreviation: ev
struct RecordedEvent {
  common::EventType eventType;
  std::string sTarget;
  std::string sDetails;
};

class FakeNotifier : public notify::INotifier {
 public:
  void notifyOperation(common::EventType eventType, const std::string& sTarget,
                       const std::string& sDetails) override {
    std::lock_guard<std::mutex> lock(_mtx);
    vEvents.push_back(RecordedEvent{eventType, sTarget, sDetails});
  }

  void notifyTaskFinish(common::EventType eventType, notify::TaskSummaryData tsd) override {
    std::lock_guard<std::mutex> lock(_mtx);
    vTaskFinishes.emplace_back(eventType, std::move(tsd));
  }

  void checkAndNotify(const common::MonitoredHost& mh) override {
    std::lock_guard<std::mutex> lock(_mtx);
    vChecked.push_back(mh.sHostname);
  }

  void sendTestMessage(const common::AlertSettings& /*als*/) override { ++iTestMessages; }

  void reloadSettings() override { ++iReloads; }

  std::vector<RecordedEvent> events() {
    std::lock_guard<std::mutex> lock(_mtx);
    return vEvents;
  }

  int count(common::EventType eventType) {
    std::lock_guard<std::mutex> lock(_mtx);
    return static_cast<int>(std::count_if(
        vEvents.begin(), vEvents.end(),
        [eventType](const RecordedEvent& ev) { return ev.eventType == eventType; }));
  }

  std::vector<std::string> checked() {
    std::lock_guard<std::mutex> lock(_mtx);
    return vChecked;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(_mtx);
    vEvents.clear();
    vTaskFinishes.clear();
    vChecked.clear();
  }

  std::vector<RecordedEvent> vEvents;
  std::vector<std::pair<common::EventType, notify::TaskSummaryData>> vTaskFinishes;
  std::vector<std::string> vChecked;
  std::atomic<int> iTestMessages{0};
  std::atomic<int> iReloads{0};

 private:
  std::mutex _mtx;
};

// ── Record source ───────────────────────────────────────────────────────────

/// Pushes a fixed list of hosts and reports preset zone summaries.
class FakeRecordSource : public core::IRecordSource {
 public:
  void stream(common::BoundedChannel<common::MonitoredHost>& chOut,
              const common::RunContext& rcCtx) override {
    ++iStreams;
    if (fnOnStream) fnOnStream();
    for (const auto& mh : vHosts) {
      if (!chOut.push(mh, rcCtx)) break;
    }
    chOut.close();
    if (!sThrowMessage.empty()) throw common::ProviderError("provider_unreachable", sThrowMessage);
  }

  std::vector<common::ZoneSummary> observedZones() const override { return vZones; }

  /// Add an eligible host and count it in its zone summary.
  void addHost(const std::string& sZoneId, const std::string& sZoneName,
               const std::string& sHostname, const std::string& sTarget = "192.0.2.1",
               const std::string& sType = "A", bool bProxied = false) {
    common::MonitoredHost mh;
    mh.sHostname = sHostname;
    mh.sZoneId = sZoneId;
    mh.sZoneName = sZoneName;
    mh.sRecordId = "rec-" + sHostname;
    mh.sRecordType = sType;
    mh.sTarget = sTarget;
    mh.bProxied = bProxied;
    mh.status = common::HostStatus::Pending;
    vHosts.push_back(mh);
    auto& zs = zone(sZoneId, sZoneName);
    ++zs.iRecordsSeen;
    ++zs.iEligible;
  }

  common::ZoneSummary& zone(const std::string& sZoneId, const std::string& sZoneName) {
    for (auto& zs : vZones) {
      if (zs.sZoneId == sZoneId) return zs;
    }
    vZones.push_back(common::ZoneSummary{sZoneId, sZoneName, 0, 0, 0, false});
    return vZones.back();
  }

  std::vector<common::MonitoredHost> vHosts;
  std::vector<common::ZoneSummary> vZones;
  std::string sThrowMessage;
  std::function<void()> fnOnStream;
  std::atomic<int> iStreams{0};
};

// ── Builders ────────────────────────────────────────────────────────────────

/// A stored, previously probed provider host.
inline common::MonitoredHost storedHost(const std::string& sHostname, const std::string& sZoneId,
                                        const std::string& sZoneName,
                                        const std::string& sTarget = "192.0.2.1") {
  common::MonitoredHost mh;
  mh.sHostname = sHostname;
  mh.sZoneId = sZoneId;
  mh.sZoneName = sZoneName;
  mh.sRecordId = "rec-" + sHostname;
  mh.sRecordType = "A";
  mh.sTarget = sTarget;
  mh.status = common::HostStatus::Active;
  mh.bIsMatch = true;
  mh.sIssuer = "Test CA";
  return mh;
}

}  // namespace certmon::test
