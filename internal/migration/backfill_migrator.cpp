#include "backfill_migrator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <string>
#include <vector>

#include "internal/core/row_mapping.hpp"
#include "internal/migration/progress_reporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"

namespace schedstore::migration {

using Clock = std::chrono::steady_clock;

namespace {

std::chrono::milliseconds Since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

OffsetRange ParseOffsetRange(std::string_view text) {
  OffsetRange range;

  const auto dash = text.find('-');
  if (dash == std::string_view::npos) {
    range.from = util::ParseInt64(text, "range start");
  } else {
    range.from = util::ParseInt64(text.substr(0, dash), "range start");
    range.to   = util::ParseInt64(text.substr(dash + 1), "range end");
  }

  if (range.from < 0) {
    throw util::IntError("range start must not be negative: '" + std::string(text) + "'");
  }
  if (range.to && *range.to < range.from) {
    throw util::IntError("range end is before range start: '" + std::string(text) + "'");
  }
  return range;
}

BackfillMigrator::BackfillMigrator(std::shared_ptr<core::MessageStore> store, storage::BlobStorePtr blob_store, MigratorOptions options)
    : store_(std::move(store)), blob_store_(std::move(blob_store)), options_(options) {
  if (!store_ || !blob_store_) {
    throw util::DatabaseError("backfill requires a message store and an enabled blob tier");
  }
  if (options_.batch_size <= 0) {
    throw util::IntError("batch size must be positive");
  }
}

// ------------------------------------------------------------------
// Tail-sync
// ------------------------------------------------------------------

MigrationReport BackfillMigrator::SyncTail() {
  const auto start = Clock::now();

  MigrationReport report;
  const int64_t   count = store_->MessageCount();

  for (int64_t offset = 0; offset < count; ++offset) {
    std::optional<model::Message> message;
    try {
      message = store_->GetMessageFromEnd(offset);
    } catch (const util::StoreError& e) {
      SCHEDSTORE_LOG_ERROR("tail sync fetch failed", {observability::IntField("offset", offset),
                                                      observability::StringField("error", e.what())});
      continue;
    }

    if (!message) {
      break;
    }

    const auto key = core::BlobKeyFor(*message);
    if (blob_store_->Exists(key)) {
      report.stopped_early = true;
      break;
    }

    blob_store_->SaveBinary(key, message->bundle);
    ++report.processed;
  }

  report.elapsed = Since(start);
  SCHEDSTORE_LOG_INFO("tail sync complete", {observability::IntField("written", report.processed),
                                             observability::IntField("elapsed_ms", report.elapsed.count()),
                                             observability::BoolField("reached_synced_row", report.stopped_early)});
  return report;
}

// ------------------------------------------------------------------
// Range migration
// ------------------------------------------------------------------

MigrationReport BackfillMigrator::MigrateRange(const OffsetRange& range) {
  const auto start = Clock::now();

  const int64_t count = store_->MessageCount();
  const int64_t end   = range.to ? std::min(*range.to, count) : count;
  const int64_t total = std::max<int64_t>(0, end - range.from);

  SCHEDSTORE_LOG_INFO("range migration starting", {observability::IntField("from", range.from), observability::IntField("to", end),
                                                    observability::IntField("total", total),
                                                    observability::IntField("batch_size", options_.batch_size)});

  std::atomic<int64_t> processed{0};
  ProgressReporter     reporter(processed, total, options_.progress_interval);
  reporter.Start();

  for (int64_t batch_start = range.from; batch_start < end; batch_start += options_.batch_size) {
    const int64_t batch_end = std::min(batch_start + options_.batch_size, end);

    auto rows = store_->GetMessagesByOffset(batch_start, batch_end - batch_start);

    std::vector<std::future<void>> writes;
    writes.reserve(rows.size());
    for (auto& row : rows) {
      writes.push_back(std::async(std::launch::async, [this, &processed, message = std::move(row)] {
        blob_store_->SaveBinary(core::BlobKeyFor(message), message.bundle);
        processed.fetch_add(1);
      }));
    }

    // every write finishes before the batch is judged
    std::exception_ptr first_failure;
    for (auto& write : writes) {
      try {
        write.get();
      } catch (...) {
        if (!first_failure) first_failure = std::current_exception();
      }
    }
    if (first_failure) {
      reporter.Stop();
      SCHEDSTORE_LOG_ERROR("range migration aborted", {observability::IntField("batch_start", batch_start),
                                                       observability::IntField("processed", processed.load())});
      std::rethrow_exception(first_failure);
    }
  }

  reporter.Stop();

  MigrationReport report;
  report.processed = processed.load();
  report.elapsed   = Since(start);

  SCHEDSTORE_LOG_INFO("range migration complete", {observability::IntField("processed", report.processed),
                                                    observability::IntField("elapsed_ms", report.elapsed.count())});
  return report;
}

} // namespace schedstore::migration
