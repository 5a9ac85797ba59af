#include "core/ThreadPool.hpp"

#include <algorithm>

namespace certmon::core {

namespace {

int resolveSize(int iSize) {
  if (iSize > 0) return iSize;
  return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

}  // namespace

ThreadPool::ThreadPool(int iSize)
    : _iSize(resolveSize(iSize)), _semSlots(resolveSize(iSize)) {
  _vWorkers.reserve(static_cast<size_t>(_iSize));
  for (int i = 0; i < _iSize; ++i) {
    _vWorkers.emplace_back([this](std::stop_token stToken) { workerLoop(stToken); });
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::workerLoop(std::stop_token stToken) {
  while (true) {
    std::function<void()> fnTask;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this, &stToken] {
        return _bStopping || stToken.stop_requested() || !_qTasks.empty();
      });
      if (_qTasks.empty()) {
        return;
      }
      fnTask = std::move(_qTasks.front());
      _qTasks.pop();
    }

    // packaged_task stores any exception in its future
    fnTask();

    {
      std::lock_guard<std::mutex> lock(_mtx);
      --_iPending;
      if (_iPending == 0) {
        _cvIdle.notify_all();
      }
    }
    _semSlots.release();
  }
}

void ThreadPool::wait() {
  std::unique_lock<std::mutex> lock(_mtx);
  _cvIdle.wait(lock, [this] { return _iPending == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& worker : _vWorkers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace certmon::core
