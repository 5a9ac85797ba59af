#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "common/BoundedChannel.hpp"

namespace certmon::notify {

class IAlertChannel;

/// Class abbreviation: dj
struct DeliveryJob {
  std::shared_ptr<IAlertChannel> spChannel;
  std::string sMessage;
};

/// One bounded queue and one worker for a single channel kind. The worker
/// sends strictly serially and pauses durInterval after every attempt.
/// Failed sends are logged and dropped.
/// Class abbreviation: dq
class DeliveryQueue {
 public:
  DeliveryQueue(std::string sName, size_t uCapacity, std::chrono::milliseconds durInterval);
  ~DeliveryQueue();

  DeliveryQueue(const DeliveryQueue&) = delete;
  DeliveryQueue& operator=(const DeliveryQueue&) = delete;

  /// Never blocks. Returns false (and warns) when the queue is full or shut down.
  bool enqueue(DeliveryJob dj);

  /// Stop the worker; messages still queued are discarded. Idempotent.
  void shutdown();

  size_t pending() const { return _chJobs.size(); }
  const std::string& name() const { return _sName; }

 private:
  void run(std::stop_token stToken);

  std::string _sName;
  std::chrono::milliseconds _durInterval;
  common::BoundedChannel<DeliveryJob> _chJobs;
  std::jthread _thWorker;
};

}  // namespace certmon::notify
