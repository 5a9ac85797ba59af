#include "common/RunContext.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <utility>

namespace certmon::common {

namespace {

// Effectively no deadline.
constexpr auto kUnbounded = std::chrono::hours(24 * 365 * 10);

}  // namespace

RunContext::RunContext() : _tpDeadline(Clock::now() + kUnbounded) {}

RunContext::RunContext(std::stop_token stToken, Clock::time_point tpDeadline)
    : _stToken(std::move(stToken)), _tpDeadline(tpDeadline) {}

RunContext RunContext::withDeadline(std::stop_token stToken, Clock::duration durTimeout) {
  return RunContext(std::move(stToken), Clock::now() + durTimeout);
}

RunContext RunContext::withTimeout(Clock::duration durTimeout) const {
  const auto tpChild = Clock::now() + durTimeout;
  return RunContext(_stToken, std::min(_tpDeadline, tpChild));
}

bool RunContext::done() const {
  return _stToken.stop_requested() || Clock::now() >= _tpDeadline;
}

std::chrono::milliseconds RunContext::remaining() const {
  const auto tpNow = Clock::now();
  if (tpNow >= _tpDeadline) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(_tpDeadline - tpNow);
}

bool RunContext::sleepFor(Clock::duration durSleep) const {
  const auto tpWake = std::min(_tpDeadline, Clock::now() + durSleep);
  std::mutex mtx;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mtx);
  std::stop_token stToken = _stToken;
  cv.wait_until(lock, stToken, tpWake, [] { return false; });
  return !done();
}

}  // namespace certmon::common
