#pragma once

#include <chrono>
#include <stop_token>

namespace certmon::common {

/// Cancellation and deadline carried through a run and down into each probe.
/// Copyable; children derived with withTimeout() never outlive the parent deadline.
/// Class abbreviation: rc
class RunContext {
 public:
  using Clock = std::chrono::steady_clock;

  /// No deadline, never cancelled.
  RunContext();
  RunContext(std::stop_token stToken, Clock::time_point tpDeadline);

  /// Context bounded by durTimeout from now, cancelled through stToken.
  static RunContext withDeadline(std::stop_token stToken, Clock::duration durTimeout);

  /// Child context: same stop token, deadline = min(parent, now + durTimeout).
  RunContext withTimeout(Clock::duration durTimeout) const;

  /// True once the stop token fired or the deadline passed.
  bool done() const;
  bool cancelled() const { return _stToken.stop_requested(); }

  /// Time left before the deadline; zero when already expired.
  std::chrono::milliseconds remaining() const;

  Clock::time_point deadline() const { return _tpDeadline; }
  std::stop_token token() const { return _stToken; }

  /// Sleep for durSleep or until done(). Returns false if interrupted.
  bool sleepFor(Clock::duration durSleep) const;

 private:
  std::stop_token _stToken;
  Clock::time_point _tpDeadline;
};

}  // namespace certmon::common
