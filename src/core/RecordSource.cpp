#include "core/RecordSource.hpp"

#include <utility>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/TimeUtils.hpp"
#include "core/Prober.hpp"
#include "dal/HostRepository.hpp"
#include "providers/IProvider.hpp"

namespace certmon::core {

namespace {

/// Closes the channel when the stream unwinds, whatever the reason.
class ChannelCloser {
 public:
  explicit ChannelCloser(common::BoundedChannel<common::MonitoredHost>& ch) : _ch(ch) {}
  ~ChannelCloser() { _ch.close(); }

 private:
  common::BoundedChannel<common::MonitoredHost>& _ch;
};

bool isMonitoredType(const std::string& sType) { return sType == "A" || sType == "CNAME"; }

}  // namespace

ProviderRecordSource::ProviderRecordSource(RecordSourceConfig rscfg,
                                           std::shared_ptr<providers::IProvider> spProvider,
                                           std::shared_ptr<IRegistrationLookup> spWhois,
                                           std::shared_ptr<dal::IHostRepository> spRepo,
                                           SkipPolicy spPolicy)
    : _rscfg(std::move(rscfg)),
      _spProvider(std::move(spProvider)),
      _spWhois(std::move(spWhois)),
      _spRepo(std::move(spRepo)),
      _spPolicy(std::move(spPolicy)) {}

ProviderRecordSource::~ProviderRecordSource() = default;

common::MonitoredHost ProviderRecordSource::toMonitoredHost(const common::ProviderRecord& prec,
                                                            const common::ProviderZone& pz) {
  common::MonitoredHost mh;
  mh.sHostname = prec.sName;
  mh.sZoneId = pz.sId;
  mh.sRecordId = prec.sId;
  mh.sZoneName = pz.sName.empty() ? prec.sZoneName : pz.sName;
  mh.sRecordType = prec.sType;
  mh.sTarget = prec.sContent;
  mh.bProxied = prec.bProxied;
  mh.sComment = prec.sComment;
  mh.status = common::HostStatus::Pending;
  return mh;
}

std::vector<common::ZoneSummary> ProviderRecordSource::observedZones() const {
  std::lock_guard<std::mutex> lock(_mtxZones);
  return _vZones;
}

std::vector<common::ProviderZone> ProviderRecordSource::resolveZones() {
  if (_rscfg.vZoneIds.empty()) {
    return _spProvider->listZones();
  }

  std::vector<common::ProviderZone> vZones;
  for (const auto& sZoneId : _rscfg.vZoneIds) {
    try {
      vZones.push_back(_spProvider->getZone(sZoneId));
    } catch (const common::ProviderError& e) {
      common::Logger::get()->warn("Zone {} could not be fetched, skipping: {}", sZoneId,
                                  e.what());
      common::ZoneSummary zs;
      zs.sZoneId = sZoneId;
      zs.bListingFailed = true;
      std::lock_guard<std::mutex> lock(_mtxZones);
      _vZones.push_back(zs);
    }
  }
  return vZones;
}

void ProviderRecordSource::stream(common::BoundedChannel<common::MonitoredHost>& chOut,
                                  const common::RunContext& rcCtx) {
  ChannelCloser closer(chOut);
  {
    std::lock_guard<std::mutex> lock(_mtxZones);
    _vZones.clear();
  }

  const auto vZones = resolveZones();
  common::Logger::get()->info("Streaming records from {} zone(s) via {}", vZones.size(),
                              _spProvider->name());

  for (size_t i = 0; i < vZones.size(); ++i) {
    if (rcCtx.done()) {
      common::Logger::get()->warn("Record stream stopped before zone {}", vZones[i].sName);
      return;
    }

    common::ZoneSummary zs;
    zs.sZoneId = vZones[i].sId;
    zs.sZoneName = vZones[i].sName;
    const bool bContinue = streamZone(vZones[i], chOut, rcCtx, zs);
    {
      std::lock_guard<std::mutex> lock(_mtxZones);
      _vZones.push_back(zs);
    }
    if (!bContinue) return;

    if (i + 1 < vZones.size() && !rcCtx.sleepFor(_rscfg.durZonePause)) return;
  }
}

bool ProviderRecordSource::streamZone(const common::ProviderZone& pz,
                                      common::BoundedChannel<common::MonitoredHost>& chOut,
                                      const common::RunContext& rcCtx,
                                      common::ZoneSummary& zs) {
  if (!pz.sStatus.empty() && pz.sStatus != "active") {
    common::Logger::get()->warn("Zone {} has status '{}'", pz.sName, pz.sStatus);
  }

  RegistrationInfo ri;
  if (_spWhois) {
    try {
      const auto tpExpiry = _spWhois->lookupExpiry(pz.sName, rcCtx);
      ri.oExpiry = tpExpiry;
      ri.iDaysLeft = common::daysUntil(tpExpiry);
    } catch (const common::RegistrationLookupError& e) {
      common::Logger::get()->debug("Registration lookup for zone {} failed: {}", pz.sName,
                                   e.what());
    }
  }

  int iPage = 1;
  while (true) {
    common::RecordPage rp;
    try {
      rp = _spProvider->listRecords(pz.sId, iPage, _rscfg.iPageSize);
    } catch (const common::ProviderError& e) {
      common::Logger::get()->warn("Listing zone {} failed at page {}: {}", pz.sName, iPage,
                                  e.what());
      zs.bListingFailed = true;
      return true;
    }

    for (const auto& prec : rp.vRecords) {
      ++zs.iRecordsSeen;
      if (!isMonitoredType(prec.sType)) continue;
      if (_spPolicy.shouldSkip(prec.sName)) {
        ++zs.iSkipped;
        common::Logger::get()->debug("Skipping {} by policy", prec.sName);
        continue;
      }

      auto mh = toMonitoredHost(prec, pz);
      mh.oDomainExpiry = ri.oExpiry;
      mh.iDomainDaysLeft = ri.iDaysLeft;
      writePendingSnapshot(mh);

      if (!chOut.push(std::move(mh), rcCtx)) {
        zs.bListingFailed = true;
        return false;
      }
      ++zs.iEligible;
    }

    if (iPage >= rp.iTotalPages) break;
    ++iPage;
    if (!rcCtx.sleepFor(_rscfg.durPagePause)) {
      zs.bListingFailed = true;
      return false;
    }
  }

  common::Logger::get()->debug("Zone {}: {} record(s), {} eligible, {} skipped", pz.sName,
                               zs.iRecordsSeen, zs.iEligible, zs.iSkipped);
  return true;
}

void ProviderRecordSource::writePendingSnapshot(const common::MonitoredHost& mh) {
  if (!_spRepo) return;
  try {
    if (_spRepo->findByHostname(mh.sHostname)) return;
    _spRepo->upsert(mh);
  } catch (const std::exception& e) {
    common::Logger::get()->error("Pending snapshot for {} failed: {}", mh.sHostname, e.what());
  }
}

}  // namespace certmon::core
