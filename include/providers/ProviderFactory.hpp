#pragma once

#include <memory>
#include <string>

#include "providers/IProvider.hpp"

namespace certmon::common {
class IHttpClient;
}

namespace certmon::providers {

/// Creates concrete IProvider instances by type string.
class ProviderFactory {
 public:
  /// Throws ValidationError for an unknown sType.
  static std::unique_ptr<IProvider> create(const std::string& sType,
                                           const std::string& sApiEndpoint,
                                           const std::string& sToken,
                                           std::shared_ptr<common::IHttpClient> spHttp);
};

}  // namespace certmon::providers
