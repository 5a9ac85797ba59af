#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/BoundedChannel.hpp"
#include "common/RunContext.hpp"
#include "common/Types.hpp"
#include "core/SkipPolicy.hpp"

namespace certmon::providers {
class IProvider;
}

namespace certmon::dal {
class IHostRepository;
}

namespace certmon::core {

class IRegistrationLookup;

/// Class abbreviation: rscfg
struct RecordSourceConfig {
  std::vector<std::string> vZoneIds;  // empty = every zone the provider lists
  int iPageSize = 100;
  std::chrono::milliseconds durPagePause{200};
  std::chrono::milliseconds durZonePause{1000};
};

/// Producer side of a synchronization run.
class IRecordSource {
 public:
  virtual ~IRecordSource() = default;

  /// Push one pending MonitoredHost per eligible record into chOut.
  /// chOut is closed on every exit path. Throws common::ProviderError when the
  /// zone list itself cannot be fetched; per-zone failures are only logged.
  virtual void stream(common::BoundedChannel<common::MonitoredHost>& chOut,
                      const common::RunContext& rcCtx) = 0;

  /// Zones visited by the last stream() call, in visiting order. Configured
  /// zones that could not be fetched appear with only sZoneId and bListingFailed.
  virtual std::vector<common::ZoneSummary> observedZones() const = 0;
};

/// IRecordSource over a DNS provider. Keeps A and CNAME records, drops the
/// ones the skip policy matches, and stamps each host with its zone's
/// registration expiry.
/// Class abbreviation: prs
class ProviderRecordSource : public IRecordSource {
 public:
  /// spRepo may be null; the pending snapshot is then not written.
  ProviderRecordSource(RecordSourceConfig rscfg, std::shared_ptr<providers::IProvider> spProvider,
                       std::shared_ptr<IRegistrationLookup> spWhois,
                       std::shared_ptr<dal::IHostRepository> spRepo, SkipPolicy spPolicy);
  ~ProviderRecordSource() override;

  void stream(common::BoundedChannel<common::MonitoredHost>& chOut,
              const common::RunContext& rcCtx) override;
  std::vector<common::ZoneSummary> observedZones() const override;

  /// Map a provider record onto a fresh pending host of the given zone.
  static common::MonitoredHost toMonitoredHost(const common::ProviderRecord& prec,
                                               const common::ProviderZone& pz);

 private:
  std::vector<common::ProviderZone> resolveZones();

  /// Returns false when the consumer went away and streaming must stop.
  bool streamZone(const common::ProviderZone& pz,
                  common::BoundedChannel<common::MonitoredHost>& chOut,
                  const common::RunContext& rcCtx, common::ZoneSummary& zs);

  void writePendingSnapshot(const common::MonitoredHost& mh);

  RecordSourceConfig _rscfg;
  std::shared_ptr<providers::IProvider> _spProvider;
  std::shared_ptr<IRegistrationLookup> _spWhois;
  std::shared_ptr<dal::IHostRepository> _spRepo;
  SkipPolicy _spPolicy;

  mutable std::mutex _mtxZones;
  std::vector<common::ZoneSummary> _vZones;
};

}  // namespace certmon::core
