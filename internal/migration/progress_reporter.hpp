#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace schedstore::migration {

/*
  Logs a shared counter on a fixed interval.

  Runs on its own thread and shares nothing with the writers except the
  counter it reads. Exits once the counter reaches total, or on Stop().
*/
class ProgressReporter {
 public:
  ProgressReporter(const std::atomic<int64_t>& counter, int64_t total, std::chrono::milliseconds interval);
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter&)            = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  void Start();
  void Stop();

  // number of progress lines written so far
  int64_t Reports() const {
    return reports_.load();
  }

 private:
  void Run();

  const std::atomic<int64_t>& counter_;
  const int64_t               total_;
  const std::chrono::milliseconds interval_;

  std::mutex              mu_;
  std::condition_variable cv_;
  bool                    stop_requested_ = false;

  std::thread          thread_;
  std::atomic<int64_t> reports_{0};
};

} // namespace schedstore::migration
