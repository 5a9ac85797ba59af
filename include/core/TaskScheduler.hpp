#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "common/Types.hpp"
#include "core/CronExpression.hpp"

namespace certmon::core {

/// Runs named background tasks on fixed intervals or cron expressions.
/// Every firing runs on the task's own worker thread; a firing that finds the
/// previous run of the same task still active is skipped with a warning.
/// Class abbreviation: ts
class TaskScheduler {
 public:
  using TaskFn = std::function<void(std::stop_token)>;

  TaskScheduler();
  ~TaskScheduler();

  /// Register or replace sName. The first run is one interval from now.
  void scheduleInterval(const std::string& sName, std::chrono::seconds durInterval,
                        TaskFn fnTask);

  /// Register or replace sName. Replacing keeps an active run alive and
  /// still counts it for overlap detection.
  void scheduleCron(const std::string& sName, const CronExpression& ceWhen, TaskFn fnTask);

  /// Returns false when sName was not registered. An active run is asked to
  /// stop and joined on stop().
  bool unschedule(const std::string& sName);

  bool has(const std::string& sName) const;
  std::vector<std::string> taskNames() const;
  std::optional<common::SysTime> nextRun(const std::string& sName) const;
  std::optional<std::string> cronText(const std::string& sName) const;

  void start();
  void stop();

 private:
  struct Task {
    std::string sName;
    std::optional<std::chrono::seconds> oInterval;
    std::optional<CronExpression> oCron;
    TaskFn fn;
    common::SysTime tpNextRun;
    std::shared_ptr<std::atomic<bool>> spRunning;
    std::jthread thWorker;
  };

  struct RetiredRun {
    std::jthread thWorker;
    std::shared_ptr<std::atomic<bool>> spRunning;
  };

  void upsert(Task task);
  void fire(Task& task);
  static common::SysTime computeNext(const Task& task, common::SysTime tpNow);
  void reapRetired();

  std::map<std::string, Task> _mTasks;
  std::vector<RetiredRun> _vRetired;
  std::jthread _thread;
  mutable std::mutex _mtx;
  std::condition_variable_any _cv;
  bool _bRunning = false;
  bool _bChanged = false;
};

}  // namespace certmon::core
