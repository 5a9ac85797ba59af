#include "common/HttpClient.hpp"

#include "common/Errors.hpp"
#include "common/RunContext.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace certmon::common {

namespace {

size_t writeBody(char* pData, size_t uSize, size_t uCount, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  pBody->append(pData, uSize * uCount);
  return uSize * uCount;
}

int checkAbort(void* pUser, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* pCtx = static_cast<const RunContext*>(pUser);
  return (pCtx != nullptr && pCtx->done()) ? 1 : 0;
}

struct EasyDeleter {
  void operator()(CURL* pCurl) const { curl_easy_cleanup(pCurl); }
};

struct SlistDeleter {
  void operator()(curl_slist* pList) const { curl_slist_free_all(pList); }
};

}  // namespace

CurlHttpClient::CurlHttpClient() = default;
CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::send(const HttpRequest& hreq) {
  std::unique_ptr<CURL, EasyDeleter> upCurl(curl_easy_init());
  if (!upCurl) {
    throw ConnectionError("http_init_failed", "curl_easy_init failed");
  }
  CURL* pCurl = upCurl.get();

  HttpResponse hres;

  auto durTimeout = hreq.durTimeout;
  if (hreq.pContext != nullptr) {
    durTimeout = std::min(durTimeout, hreq.pContext->remaining());
    if (durTimeout <= std::chrono::milliseconds::zero()) {
      throw ConnectionError("http_timeout", "i/o timeout");
    }
  }

  curl_easy_setopt(pCurl, CURLOPT_URL, hreq.sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_CUSTOMREQUEST, hreq.sMethod.c_str());
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT_MS, static_cast<long>(durTimeout.count()));
  curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, hreq.bFollowRedirects ? 1L : 0L);
  curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYPEER, hreq.bVerifyPeer ? 1L : 0L);
  curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYHOST, hreq.bVerifyPeer ? 2L : 0L);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeBody);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &hres.sBody);
  curl_easy_setopt(pCurl, CURLOPT_USERAGENT, "certmon/0.1");

  if (hreq.pContext != nullptr) {
    curl_easy_setopt(pCurl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(pCurl, CURLOPT_XFERINFOFUNCTION, checkAbort);
    curl_easy_setopt(pCurl, CURLOPT_XFERINFODATA, hreq.pContext);
  }

  if (!hreq.sBody.empty() || hreq.sMethod == "POST" || hreq.sMethod == "PUT") {
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, hreq.sBody.c_str());
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(hreq.sBody.size()));
  }

  if (!hreq.sBasicUser.empty() || !hreq.sBasicPassword.empty()) {
    curl_easy_setopt(pCurl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(pCurl, CURLOPT_USERNAME, hreq.sBasicUser.c_str());
    curl_easy_setopt(pCurl, CURLOPT_PASSWORD, hreq.sBasicPassword.c_str());
  }

  std::unique_ptr<curl_slist, SlistDeleter> upHeaders;
  for (const auto& [sName, sValue] : hreq.vHeaders) {
    const std::string sLine = sName + ": " + sValue;
    curl_slist* pNext = curl_slist_append(upHeaders.get(), sLine.c_str());
    if (pNext == nullptr) {
      throw ConnectionError("http_init_failed", "curl_slist_append failed");
    }
    // curl_slist_append returns the (unchanged) head once the list exists
    static_cast<void>(upHeaders.release());
    upHeaders.reset(pNext);
  }
  if (upHeaders) {
    curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  }

  const auto tpStart = std::chrono::steady_clock::now();
  const CURLcode rc = curl_easy_perform(pCurl);
  hres.durElapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - tpStart);

  if (rc != CURLE_OK) {
    switch (rc) {
      case CURLE_OPERATION_TIMEDOUT:
        throw ConnectionError("http_timeout", "i/o timeout");
      case CURLE_ABORTED_BY_CALLBACK:
        throw ConnectionError("http_cancelled", "request cancelled");
      case CURLE_COULDNT_RESOLVE_HOST:
        throw ConnectionError("http_unresolvable", "no such host");
      case CURLE_COULDNT_CONNECT:
        throw ConnectionError("http_connect_failed", "connection refused");
      default:
        throw ConnectionError("http_transport_error", curl_easy_strerror(rc));
    }
  }

  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &hres.iStatus);
  return hres;
}

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace certmon::common
