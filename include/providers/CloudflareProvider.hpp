#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "providers/IProvider.hpp"

namespace certmon::common {
class IHttpClient;
}

namespace certmon::providers {

/// Cloudflare API v4 provider implementation (bearer token auth).
/// Class abbreviation: cfp
class CloudflareProvider : public IProvider {
 public:
  CloudflareProvider(std::string sApiEndpoint, std::string sToken,
                     std::shared_ptr<common::IHttpClient> spHttp);
  ~CloudflareProvider() override;

  std::string name() const override;
  std::vector<common::ProviderZone> listZones() override;
  common::ProviderZone getZone(const std::string& sZoneId) override;
  common::RecordPage listRecords(const std::string& sZoneId, int iPage, int iPerPage) override;
  common::ProviderRecord getRecord(const std::string& sZoneId,
                                   const std::string& sRecordId) override;

 private:
  /// GET sPath relative to the endpoint. Returns the parsed envelope after
  /// checking HTTP status and the "success" flag.
  nlohmann::json get(const std::string& sPath);

  std::string _sApiEndpoint;
  std::string _sToken;
  std::shared_ptr<common::IHttpClient> _spHttp;
};

}  // namespace certmon::providers
