#include "core/TcpConnector.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "common/Errors.hpp"

namespace certmon::core {

namespace {

// Poll slice so a stop request is noticed without a wakeup fd.
constexpr auto kPollSlice = std::chrono::milliseconds(200);

struct AddrInfoDeleter {
  void operator()(addrinfo* p) const { freeaddrinfo(p); }
};

}  // namespace

Socket::~Socket() {
  if (_iFd >= 0) ::close(_iFd);
}

Socket::Socket(Socket&& other) noexcept : _iFd(other._iFd) { other._iFd = -1; }

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    if (_iFd >= 0) ::close(_iFd);
    _iFd = other._iFd;
    other._iFd = -1;
  }
  return *this;
}

bool waitFd(int iFd, short iEvents, common::RunContext::Clock::time_point tpDeadline,
            const common::RunContext& rcCtx) {
  tpDeadline = std::min(tpDeadline, rcCtx.deadline());
  while (!rcCtx.cancelled()) {
    const auto durLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        tpDeadline - common::RunContext::Clock::now());
    if (durLeft.count() <= 0) return false;

    pollfd pfd{};
    pfd.fd = iFd;
    pfd.events = iEvents;
    const int iWaitMs = static_cast<int>(std::min(durLeft, kPollSlice).count());
    const int iRc = ::poll(&pfd, 1, iWaitMs);
    if (iRc > 0) return true;
    if (iRc < 0 && errno != EINTR) return false;
  }
  return false;
}

Socket connectTcp(const std::string& sHost, int iPort, std::chrono::milliseconds durDialTimeout,
                  const common::RunContext& rcCtx) {
  const std::string sAddress = sHost + ":" + std::to_string(iPort);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* pRaw = nullptr;
  const int iGai = ::getaddrinfo(sHost.c_str(), std::to_string(iPort).c_str(), &hints, &pRaw);
  if (iGai != 0 || pRaw == nullptr) {
    throw common::ConnectionError("dial_unresolvable",
                                  "dial tcp " + sAddress + ": lookup " + sHost + ": no such host");
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> upResults(pRaw);

  const auto tpDeadline = common::RunContext::Clock::now() + durDialTimeout;
  std::string sLastError = "no usable address";

  for (addrinfo* p = upResults.get(); p != nullptr; p = p->ai_next) {
    Socket sock(::socket(p->ai_family, p->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                         p->ai_protocol));
    if (!sock.valid()) {
      sLastError = std::strerror(errno);
      continue;
    }

    if (::connect(sock.fd(), p->ai_addr, p->ai_addrlen) == 0) {
      return sock;
    }
    if (errno != EINPROGRESS) {
      sLastError = std::string("connect: ") + std::strerror(errno);
      continue;
    }

    if (!waitFd(sock.fd(), POLLOUT, tpDeadline, rcCtx)) {
      throw common::ConnectionError("dial_timeout", "dial tcp " + sAddress + ": i/o timeout");
    }

    int iErr = 0;
    socklen_t uLen = sizeof(iErr);
    if (::getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &iErr, &uLen) == 0 && iErr == 0) {
      return sock;
    }
    sLastError = std::string("connect: ") + std::strerror(iErr != 0 ? iErr : errno);
  }

  throw common::ConnectionError("dial_failed", "dial tcp " + sAddress + ": " + sLastError);
}

}  // namespace certmon::core
