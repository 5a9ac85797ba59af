#include "core/HttpProbe.hpp"

namespace certmon::core {

CurlHttpProbe::CurlHttpProbe(std::shared_ptr<common::IHttpClient> spHttp)
    : _spHttp(std::move(spHttp)) {}

HttpProbeResult CurlHttpProbe::probe(const std::string& sHostname, int iPort,
                                     const common::RunContext& rcCtx) {
  common::HttpRequest hreq;
  hreq.sMethod = "GET";
  hreq.sUrl = "https://" + sHostname + ":" + std::to_string(iPort);
  hreq.durTimeout = rcCtx.remaining();
  hreq.bFollowRedirects = false;
  hreq.bVerifyPeer = false;
  hreq.pContext = &rcCtx;

  const auto hres = _spHttp->send(hreq);
  return HttpProbeResult{static_cast<int>(hres.iStatus), hres.durElapsed};
}

}  // namespace certmon::core
