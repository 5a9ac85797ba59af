#include "core/DnsResolver.hpp"

#include <algorithm>
#include <memory>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <resolv.h>
#include <sys/socket.h>

#include "common/Errors.hpp"

namespace certmon::core {

namespace {

constexpr int kAnswerBufferSize = 4096;

struct AddrInfoDeleter {
  void operator()(addrinfo* p) const { freeaddrinfo(p); }
};

std::string addressToString(const addrinfo* p) {
  char szBuf[INET6_ADDRSTRLEN] = {};
  if (p->ai_family == AF_INET) {
    const auto* pIn = reinterpret_cast<const sockaddr_in*>(p->ai_addr);
    inet_ntop(AF_INET, &pIn->sin_addr, szBuf, sizeof(szBuf));
  } else if (p->ai_family == AF_INET6) {
    const auto* pIn6 = reinterpret_cast<const sockaddr_in6*>(p->ai_addr);
    inet_ntop(AF_INET6, &pIn6->sin6_addr, szBuf, sizeof(szBuf));
  }
  return szBuf;
}

std::string lookupCanonicalName(const std::string& sHostname) {
  struct __res_state state {};
  if (res_ninit(&state) != 0) {
    return {};
  }

  unsigned char aAnswer[kAnswerBufferSize];
  const int iLen = res_nquery(&state, sHostname.c_str(), ns_c_in, ns_t_cname, aAnswer,
                              sizeof(aAnswer));
  std::string sCanonical;
  ns_msg handle;
  if (iLen > 0 && ns_initparse(aAnswer, iLen, &handle) == 0) {
    const int iCount = ns_msg_count(handle, ns_s_an);
    for (int i = 0; i < iCount; ++i) {
      ns_rr rr;
      if (ns_parserr(&handle, ns_s_an, i, &rr) != 0 || ns_rr_type(rr) != ns_t_cname) continue;
      char szName[NS_MAXDNAME] = {};
      if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), ns_rr_rdata(rr), szName,
                    sizeof(szName)) >= 0) {
        sCanonical = szName;
        break;
      }
    }
  }
  res_nclose(&state);

  while (!sCanonical.empty() && sCanonical.back() == '.') sCanonical.pop_back();
  return sCanonical;
}

}  // namespace

DnsAnswer SystemDnsResolver::resolve(const std::string& sHostname,
                                     const common::RunContext& rcCtx) {
  if (rcCtx.done()) {
    throw common::ConnectionError("dns_cancelled", "lookup " + sHostname + ": i/o timeout");
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* pRaw = nullptr;
  const int iRc = ::getaddrinfo(sHostname.c_str(), nullptr, &hints, &pRaw);
  if (iRc != 0 || pRaw == nullptr) {
    const std::string sReason =
        (iRc == EAI_NONAME || iRc == EAI_NODATA) ? "no such host" : gai_strerror(iRc);
    throw common::ConnectionError("dns_unresolvable", "lookup " + sHostname + ": " + sReason);
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> upResults(pRaw);

  DnsAnswer da;
  for (const addrinfo* p = upResults.get(); p != nullptr; p = p->ai_next) {
    std::string sAddr = addressToString(p);
    if (!sAddr.empty() &&
        std::find(da.vAddresses.begin(), da.vAddresses.end(), sAddr) == da.vAddresses.end()) {
      da.vAddresses.push_back(std::move(sAddr));
    }
  }
  std::sort(da.vAddresses.begin(), da.vAddresses.end());

  da.sCanonicalName = lookupCanonicalName(sHostname);
  return da;
}

}  // namespace certmon::core
