#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace certmon::providers {

/// Pure abstract interface for all DNS provider integrations.
/// Read-only: the monitor never writes to the provider.
/// All methods throw common::ProviderError on transport or API failure.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;
  virtual std::vector<common::ProviderZone> listZones() = 0;
  virtual common::ProviderZone getZone(const std::string& sZoneId) = 0;

  /// One page of records for a zone. Pages are 1-based.
  virtual common::RecordPage listRecords(const std::string& sZoneId, int iPage,
                                         int iPerPage) = 0;
  virtual common::ProviderRecord getRecord(const std::string& sZoneId,
                                           const std::string& sRecordId) = 0;
};

}  // namespace certmon::providers
