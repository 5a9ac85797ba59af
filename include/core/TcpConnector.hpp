#pragma once

#include <chrono>
#include <string>

#include "common/RunContext.hpp"

namespace certmon::core {

/// Owning socket descriptor. Move-only; closes on destruction.
/// Class abbreviation: sock
class Socket {
 public:
  Socket() = default;
  explicit Socket(int iFd) : _iFd(iFd) {}
  ~Socket();

  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  int fd() const { return _iFd; }
  bool valid() const { return _iFd >= 0; }

 private:
  int _iFd = -1;
};

/// Non-blocking TCP connect to sHost:iPort, trying each resolved address in
/// turn. Bounded by durDialTimeout and by rcCtx.
/// Throws common::ConnectionError ("no such host", "i/o timeout", or the errno text).
Socket connectTcp(const std::string& sHost, int iPort, std::chrono::milliseconds durDialTimeout,
                  const common::RunContext& rcCtx);

/// Poll iFd for iEvents until tpDeadline or rcCtx finishes.
/// Returns false on timeout or cancellation.
bool waitFd(int iFd, short iEvents, common::RunContext::Clock::time_point tpDeadline,
            const common::RunContext& rcCtx);

}  // namespace certmon::core
