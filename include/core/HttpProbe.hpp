#pragma once

#include <memory>

#include "common/HttpClient.hpp"
#include "core/Prober.hpp"

namespace certmon::core {

/// GET https://host:port/ without peer verification and without following
/// redirects, so the origin's own status code is recorded.
/// Class abbreviation: chp
class CurlHttpProbe : public IHttpProbe {
 public:
  explicit CurlHttpProbe(std::shared_ptr<common::IHttpClient> spHttp);

  HttpProbeResult probe(const std::string& sHostname, int iPort,
                        const common::RunContext& rcCtx) override;

 private:
  std::shared_ptr<common::IHttpClient> _spHttp;
};

}  // namespace certmon::core
