#include "notify/DeliveryQueue.hpp"

#include <utility>

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "notify/AlertChannel.hpp"

namespace certmon::notify {

DeliveryQueue::DeliveryQueue(std::string sName, size_t uCapacity,
                             std::chrono::milliseconds durInterval)
    : _sName(std::move(sName)), _durInterval(durInterval), _chJobs(uCapacity) {
  _thWorker = std::jthread([this](std::stop_token stToken) { run(stToken); });
  common::Logger::get()->info("{} delivery worker started (capacity {})", _sName,
                              _chJobs.capacity());
}

DeliveryQueue::~DeliveryQueue() { shutdown(); }

bool DeliveryQueue::enqueue(DeliveryJob dj) {
  if (!_chJobs.tryPush(std::move(dj))) {
    common::Logger::get()->warn("{} queue is full or closed, dropping message", _sName);
    return false;
  }
  common::Logger::get()->debug("{} message queued ({} pending)", _sName, _chJobs.size());
  return true;
}

void DeliveryQueue::shutdown() {
  if (!_thWorker.joinable()) return;
  _thWorker.request_stop();
  _chJobs.close();
  _thWorker.join();
}

void DeliveryQueue::run(std::stop_token stToken) {
  const common::RunContext rcWorker(stToken, common::RunContext().deadline());
  while (!stToken.stop_requested()) {
    auto oJob = _chJobs.pop(rcWorker);
    if (!oJob) break;

    try {
      oJob->spChannel->send(oJob->sMessage);
    } catch (const common::DeliveryError& e) {
      common::Logger::get()->error("{} delivery failed: {}", _sName, e.what());
    } catch (const std::exception& e) {
      common::Logger::get()->error("{} delivery failed unexpectedly: {}", _sName, e.what());
    }

    if (!rcWorker.sleepFor(_durInterval)) break;
  }
}

}  // namespace certmon::notify
