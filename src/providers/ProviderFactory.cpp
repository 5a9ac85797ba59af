#include "providers/ProviderFactory.hpp"

#include "common/Errors.hpp"
#include "providers/CloudflareProvider.hpp"

namespace certmon::providers {

std::unique_ptr<IProvider> ProviderFactory::create(const std::string& sType,
                                                   const std::string& sApiEndpoint,
                                                   const std::string& sToken,
                                                   std::shared_ptr<common::IHttpClient> spHttp) {
  if (sType == "cloudflare") {
    return std::make_unique<CloudflareProvider>(sApiEndpoint, sToken, std::move(spHttp));
  }
  throw common::ValidationError("unknown_provider", "Unsupported DNS provider type: " + sType);
}

}  // namespace certmon::providers
