#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace certmon::api {

/// Runs request-triggered work after the response has been sent.
/// Each job gets its own thread; finished threads are joined on the next launch.
/// Class abbreviation: bj
class BackgroundJobs {
 public:
  using JobFn = std::function<void(std::stop_token)>;

  BackgroundJobs();
  ~BackgroundJobs();

  BackgroundJobs(const BackgroundJobs&) = delete;
  BackgroundJobs& operator=(const BackgroundJobs&) = delete;

  /// Exceptions thrown by fnJob are logged under sName.
  /// Throws common::ConflictError("shutting_down") after stopAll().
  void launch(const std::string& sName, JobFn fnJob);

  /// Ask every running job to stop and join them all.
  void stopAll();

  size_t active() const;

 private:
  struct Job {
    std::jthread thWorker;
    std::shared_ptr<std::atomic<bool>> spDone;
  };

  void reap();  // caller holds _mtx

  std::vector<Job> _vJobs;
  mutable std::mutex _mtx;
  bool _bStopped = false;
};

}  // namespace certmon::api
