#include "core/MaintenanceScheduler.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace jwks::core {

MaintenanceScheduler::MaintenanceScheduler() = default;

MaintenanceScheduler::~MaintenanceScheduler() { stop(); }

void MaintenanceScheduler::schedule(const std::string& sName, std::chrono::seconds durInterval,
                                    std::function<void()> fnJob) {
  if (durInterval.count() <= 0) {
    throw std::invalid_argument("Job '" + sName + "' needs a positive interval");
  }

  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) {
    throw std::logic_error("Cannot schedule '" + sName + "' on a running scheduler");
  }
  const bool bDuplicate = std::any_of(_vJobs.begin(), _vJobs.end(),
                                      [&](const Job& job) { return job.sName == sName; });
  if (bDuplicate) {
    throw std::invalid_argument("Job '" + sName + "' is already scheduled");
  }
  _vJobs.push_back(Job{sName, durInterval, std::move(fnJob), {}});
}

void MaintenanceScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  const auto tpNow = std::chrono::steady_clock::now();
  for (auto& job : _vJobs) {
    job.tpDue = tpNow;
  }
  common::Logger::get()->info("Maintenance scheduler started with {} job(s)", _vJobs.size());
  _thread = std::jthread([this](std::stop_token stToken) { runLoop(stToken); });
}

void MaintenanceScheduler::runLoop(std::stop_token stToken) {
  auto spLog = common::Logger::get();

  while (!stToken.stop_requested()) {
    for (auto& job : _vJobs) {
      if (stToken.stop_requested()) break;
      if (std::chrono::steady_clock::now() < job.tpDue) continue;
      try {
        job.fn();
      } catch (const std::exception& ex) {
        spLog->error("Maintenance job '{}' failed: {}", job.sName, ex.what());
      } catch (...) {
        spLog->error("Maintenance job '{}' failed with unknown error", job.sName);
      }
      job.tpDue = std::chrono::steady_clock::now() + job.durInterval;
    }

    auto tpWake = std::chrono::steady_clock::now() + std::chrono::hours(1);
    for (const auto& job : _vJobs) {
      tpWake = std::min(tpWake, job.tpDue);
    }

    std::unique_lock<std::mutex> lock(_mtx);
    _cv.wait_until(lock, stToken, tpWake, [] { return false; });
  }
}

void MaintenanceScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  _thread.request_stop();
  if (_thread.joinable()) {
    _thread.join();
  }
  common::Logger::get()->info("Maintenance scheduler stopped");
}

bool MaintenanceScheduler::isRunning() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _bRunning;
}

}  // namespace jwks::core
