#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace jwks::core {

/// Runs named background jobs (e.g. "key-rotation") on fixed intervals in a
/// single worker thread. Each job first runs right after start().
/// Class abbreviation: ms
class MaintenanceScheduler {
 public:
  MaintenanceScheduler();
  ~MaintenanceScheduler();

  MaintenanceScheduler(const MaintenanceScheduler&) = delete;
  MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

  /// Register a job. Throws std::invalid_argument for a non-positive
  /// interval or a name already in use, std::logic_error once started.
  void schedule(const std::string& sName, std::chrono::seconds durInterval,
                std::function<void()> fnJob);
  void start();
  void stop();

  bool isRunning() const;

 private:
  struct Job {
    std::string sName;
    std::chrono::seconds durInterval;
    std::function<void()> fn;
    std::chrono::steady_clock::time_point tpDue;
  };

  void runLoop(std::stop_token stToken);

  std::vector<Job> _vJobs;
  std::jthread _thread;
  mutable std::mutex _mtx;
  std::condition_variable_any _cv;
  bool _bRunning = false;
};

}  // namespace jwks::core
