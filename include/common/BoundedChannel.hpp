#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

#include "common/RunContext.hpp"

namespace certmon::common {

/// Fixed-capacity multi-producer/multi-consumer FIFO.
/// close() is the completion signal: pop() drains what is left, then reports end.
/// Class abbreviation: bc
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t uCapacity) : _uCapacity(uCapacity == 0 ? 1 : uCapacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  /// Block until there is room. Returns false if the channel was closed or
  /// rcCtx finished first; the item is not enqueued in that case.
  bool push(T item, const RunContext& rcCtx) {
    std::unique_lock<std::mutex> lock(_mtx);
    std::stop_token stToken = rcCtx.token();
    const bool bReady = _cvNotFull.wait_until(lock, stToken, rcCtx.deadline(), [this] {
      return _bClosed || _dqItems.size() < _uCapacity;
    });
    if (!bReady || _bClosed) {
      return false;
    }
    _dqItems.push_back(std::move(item));
    _cvNotEmpty.notify_one();
    return true;
  }

  /// Non-blocking enqueue. Returns false when full or closed.
  bool tryPush(T item) {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bClosed || _dqItems.size() >= _uCapacity) {
      return false;
    }
    _dqItems.push_back(std::move(item));
    _cvNotEmpty.notify_one();
    return true;
  }

  /// Block until an item arrives. Returns nullopt once the channel is closed
  /// and drained, or when rcCtx finished.
  std::optional<T> pop(const RunContext& rcCtx) {
    std::unique_lock<std::mutex> lock(_mtx);
    std::stop_token stToken = rcCtx.token();
    _cvNotEmpty.wait_until(lock, stToken, rcCtx.deadline(), [this] {
      return _bClosed || !_dqItems.empty();
    });
    if (_dqItems.empty()) {
      return std::nullopt;
    }
    T item = std::move(_dqItems.front());
    _dqItems.pop_front();
    _cvNotFull.notify_one();
    return item;
  }

  /// Idempotent. Wakes every blocked producer and consumer.
  void close() {
    {
      std::lock_guard<std::mutex> lock(_mtx);
      _bClosed = true;
    }
    _cvNotEmpty.notify_all();
    _cvNotFull.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _bClosed;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _dqItems.size();
  }

  size_t capacity() const { return _uCapacity; }

 private:
  const size_t _uCapacity;
  std::deque<T> _dqItems;
  mutable std::mutex _mtx;
  std::condition_variable_any _cvNotEmpty;
  std::condition_variable_any _cvNotFull;
  bool _bClosed = false;
};

}  // namespace certmon::common
