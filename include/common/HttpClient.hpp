#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace certmon::common {

class RunContext;

/// Class abbreviation: hreq
struct HttpRequest {
  std::string sMethod = "GET";
  std::string sUrl;
  std::vector<std::pair<std::string, std::string>> vHeaders;
  std::string sBody;
  std::chrono::milliseconds durTimeout{10000};
  bool bFollowRedirects = false;
  bool bVerifyPeer = true;
  std::string sBasicUser;      // basic auth when either is non-empty
  std::string sBasicPassword;
  const RunContext* pContext = nullptr;  // aborts the transfer when done()
};

/// Class abbreviation: hres
struct HttpResponse {
  long iStatus = 0;
  std::string sBody;
  std::chrono::milliseconds durElapsed{0};
};

/// Outbound HTTP seam. Transport failures (DNS, connect, TLS, timeout, abort)
/// throw ConnectionError; any HTTP status is returned, not thrown.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;
  virtual HttpResponse send(const HttpRequest& hreq) = 0;
};

/// libcurl easy-interface client. One easy handle per call; safe to share.
/// Class abbreviation: chc
class CurlHttpClient : public IHttpClient {
 public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  HttpResponse send(const HttpRequest& hreq) override;
};

/// RAII for curl_global_init / curl_global_cleanup. Construct once in main
/// before any thread starts.
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

}  // namespace certmon::common
