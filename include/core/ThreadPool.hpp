#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <semaphore>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace certmon::core {

/// Fixed-size pool of std::jthread workers with a counting semaphore bounding
/// the number of queued-or-running tasks to the pool width.
/// submit() blocks the caller while every slot is taken, which back-pressures
/// whatever feeds the pool. wait() is the barrier for everything submitted so far.
/// Class abbreviation: tp
class ThreadPool {
 public:
  explicit ThreadPool(int iSize = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /// Throws std::runtime_error after shutdown(). Task exceptions land in the future.
  template <typename F>
  auto submit(F&& fnTask) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

  /// Block until every submitted task has finished.
  void wait();

  /// Finish queued tasks, then join the workers. Idempotent.
  void shutdown();

  int size() const { return _iSize; }

 private:
  void workerLoop(std::stop_token stToken);

  int _iSize;
  std::vector<std::jthread> _vWorkers;
  std::queue<std::function<void()>> _qTasks;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::condition_variable _cvIdle;
  std::counting_semaphore<> _semSlots;
  int _iPending = 0;
  bool _bStopping = false;
};

template <typename F>
auto ThreadPool::submit(F&& fnTask) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
  using R = std::invoke_result_t<std::decay_t<F>>;

  _semSlots.acquire();
  auto spTask = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fnTask));
  auto fut = spTask->get_future();
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) {
      _semSlots.release();
      throw std::runtime_error("ThreadPool is shut down");
    }
    ++_iPending;
    _qTasks.emplace([spTask]() { (*spTask)(); });
  }
  _cv.notify_one();
  return fut;
}

}  // namespace certmon::core
