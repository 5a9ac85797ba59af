#include "api/BackgroundJobs.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "common/Errors.hpp"
#include "common/Logger.hpp"

namespace certmon::api {

BackgroundJobs::BackgroundJobs() = default;

BackgroundJobs::~BackgroundJobs() {
  stopAll();
}

void BackgroundJobs::launch(const std::string& sName, JobFn fnJob) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bStopped) {
    throw common::ConflictError("shutting_down", "Server is shutting down");
  }
  reap();

  auto spDone = std::make_shared<std::atomic<bool>>(false);
  std::jthread thWorker([sName, fnJob = std::move(fnJob), spDone](std::stop_token stToken) {
    auto spLog = common::Logger::get();
    try {
      fnJob(stToken);
    } catch (const std::exception& ex) {
      spLog->error("Background job '{}' failed: {}", sName, ex.what());
    }
    spDone->store(true);
  });
  _vJobs.push_back(Job{std::move(thWorker), std::move(spDone)});
}

void BackgroundJobs::reap() {
  auto it = std::remove_if(_vJobs.begin(), _vJobs.end(), [](Job& job) {
    if (!job.spDone->load()) return false;
    job.thWorker.join();
    return true;
  });
  _vJobs.erase(it, _vJobs.end());
}

void BackgroundJobs::stopAll() {
  std::vector<Job> vJobs;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _bStopped = true;
    vJobs = std::move(_vJobs);
    _vJobs.clear();
  }
  for (auto& job : vJobs) job.thWorker.request_stop();
  for (auto& job : vJobs) {
    if (job.thWorker.joinable()) job.thWorker.join();
  }
}

size_t BackgroundJobs::active() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<size_t>(std::count_if(_vJobs.begin(), _vJobs.end(),
                                           [](const Job& job) { return !job.spDone->load(); }));
}

}  // namespace certmon::api
