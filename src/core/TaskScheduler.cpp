#include "core/TaskScheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace certmon::core {

namespace {

/// Clears the running flag when a worker leaves, however it leaves.
class RunningGuard {
 public:
  explicit RunningGuard(std::shared_ptr<std::atomic<bool>> spFlag) : _spFlag(std::move(spFlag)) {}
  ~RunningGuard() { _spFlag->store(false); }
  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

 private:
  std::shared_ptr<std::atomic<bool>> _spFlag;
};

constexpr auto kMaxSleep = std::chrono::hours(1);

}  // namespace

TaskScheduler::TaskScheduler() = default;

TaskScheduler::~TaskScheduler() {
  stop();
}

void TaskScheduler::scheduleInterval(const std::string& sName, std::chrono::seconds durInterval,
                                     TaskFn fnTask) {
  if (durInterval <= std::chrono::seconds::zero()) {
    throw common::ValidationError("invalid_interval",
                                  "Task '" + sName + "' needs a positive interval");
  }
  Task task;
  task.sName = sName;
  task.oInterval = durInterval;
  task.fn = std::move(fnTask);
  task.tpNextRun = std::chrono::system_clock::now() + durInterval;
  upsert(std::move(task));
}

void TaskScheduler::scheduleCron(const std::string& sName, const CronExpression& ceWhen,
                                 TaskFn fnTask) {
  Task task;
  task.sName = sName;
  task.oCron = ceWhen;
  task.fn = std::move(fnTask);
  task.tpNextRun = ceWhen.next(std::chrono::system_clock::now());
  upsert(std::move(task));
}

void TaskScheduler::upsert(Task task) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mTasks.find(task.sName);
  if (it != _mTasks.end()) {
    task.spRunning = it->second.spRunning;
    task.thWorker = std::move(it->second.thWorker);
    it->second = std::move(task);
  } else {
    task.spRunning = std::make_shared<std::atomic<bool>>(false);
    std::string sName = task.sName;
    _mTasks.emplace(std::move(sName), std::move(task));
  }
  _bChanged = true;
  _cv.notify_all();
}

bool TaskScheduler::unschedule(const std::string& sName) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mTasks.find(sName);
  if (it == _mTasks.end()) return false;

  if (it->second.thWorker.joinable()) {
    it->second.thWorker.request_stop();
    _vRetired.push_back(RetiredRun{std::move(it->second.thWorker), it->second.spRunning});
  }
  _mTasks.erase(it);
  _bChanged = true;
  _cv.notify_all();
  return true;
}

bool TaskScheduler::has(const std::string& sName) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _mTasks.count(sName) > 0;
}

std::vector<std::string> TaskScheduler::taskNames() const {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<std::string> vNames;
  vNames.reserve(_mTasks.size());
  for (const auto& [sName, task] : _mTasks) vNames.push_back(sName);
  return vNames;
}

std::optional<common::SysTime> TaskScheduler::nextRun(const std::string& sName) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mTasks.find(sName);
  if (it == _mTasks.end()) return std::nullopt;
  return it->second.tpNextRun;
}

std::optional<std::string> TaskScheduler::cronText(const std::string& sName) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mTasks.find(sName);
  if (it == _mTasks.end() || !it->second.oCron) return std::nullopt;
  return it->second.oCron->text();
}

common::SysTime TaskScheduler::computeNext(const Task& task, common::SysTime tpNow) {
  if (task.oInterval) return tpNow + *task.oInterval;
  try {
    return task.oCron->next(tpNow);
  } catch (const common::ValidationError& ex) {
    auto spLog = common::Logger::get();
    spLog->error("TaskScheduler: task '{}' will not run again: {}", task.sName, ex.what());
    return common::SysTime::max();
  }
}

// Called with _mtx held.
void TaskScheduler::fire(Task& task) {
  auto spLog = common::Logger::get();
  if (task.spRunning->load()) {
    spLog->warn("TaskScheduler: task '{}' is still running, skipping this run", task.sName);
    return;
  }
  if (task.thWorker.joinable()) task.thWorker.join();

  task.spRunning->store(true);
  task.thWorker = std::jthread(
      [sName = task.sName, fn = task.fn, spRunning = task.spRunning](std::stop_token stToken) {
        RunningGuard guard(spRunning);
        auto spLog = common::Logger::get();
        spLog->debug("TaskScheduler: task '{}' started", sName);
        try {
          fn(stToken);
        } catch (const std::exception& ex) {
          spLog->error("TaskScheduler: task '{}' failed: {}", sName, ex.what());
          return;
        }
        spLog->debug("TaskScheduler: task '{}' finished", sName);
      });
}

// Called with _mtx held.
void TaskScheduler::reapRetired() {
  auto it = std::remove_if(_vRetired.begin(), _vRetired.end(), [](RetiredRun& rr) {
    if (rr.spRunning->load()) return false;
    if (rr.thWorker.joinable()) rr.thWorker.join();
    return true;
  });
  _vRetired.erase(it, _vRetired.end());
}

void TaskScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    std::unique_lock<std::mutex> ulock(_mtx);
    while (!stToken.stop_requested()) {
      const auto tpNow = std::chrono::system_clock::now();

      for (auto& [sName, task] : _mTasks) {
        if (tpNow >= task.tpNextRun) {
          fire(task);
          task.tpNextRun = computeNext(task, tpNow);
        }
      }
      reapRetired();

      auto tpNextWake = tpNow + kMaxSleep;
      for (const auto& [sName, task] : _mTasks) {
        tpNextWake = std::min(tpNextWake, task.tpNextRun);
      }

      _bChanged = false;
      _cv.wait_until(ulock, stToken, tpNextWake, [this]() { return _bChanged; });
    }
  });
}

void TaskScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  _thread.request_stop();
  if (_thread.joinable()) _thread.join();

  std::vector<std::jthread> vWorkers;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    for (auto& [sName, task] : _mTasks) {
      if (task.thWorker.joinable()) vWorkers.push_back(std::move(task.thWorker));
    }
    for (auto& rr : _vRetired) {
      if (rr.thWorker.joinable()) vWorkers.push_back(std::move(rr.thWorker));
    }
    _vRetired.clear();
  }
  for (auto& th : vWorkers) {
    th.request_stop();
    th.join();
  }
}

}  // namespace certmon::core
