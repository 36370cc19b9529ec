#include "progress_reporter.hpp"

#include "internal/observability/logging.hpp"

namespace schedstore::migration {

ProgressReporter::ProgressReporter(const std::atomic<int64_t>& counter, int64_t total, std::chrono::milliseconds interval)
    : counter_(counter), total_(total), interval_(interval) {
}

ProgressReporter::~ProgressReporter() {
  Stop();
}

void ProgressReporter::Start() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&ProgressReporter::Run, this);
}

void ProgressReporter::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ProgressReporter::Run() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      break;
    }

    const int64_t processed = counter_.load();
    SCHEDSTORE_LOG_INFO("migration progress", {observability::IntField("processed", processed),
                                               observability::IntField("total", total_)});
    reports_.fetch_add(1);

    if (processed >= total_) {
      break;
    }
  }
}

} // namespace schedstore::migration
