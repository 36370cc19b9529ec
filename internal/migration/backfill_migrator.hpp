#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/core/message_store.hpp"
#include "internal/storage/blob_store.hpp"

namespace schedstore::migration {

/*
  Logical offset range over the messages table (timestamp ascending).
  to is exclusive; empty means end of table.
*/
struct OffsetRange {
  int64_t                from = 0;
  std::optional<int64_t> to;
};

// "<from>" or "<from>-<to>". Throws util::IntError.
OffsetRange ParseOffsetRange(std::string_view text);

struct MigrationReport {
  int64_t                   processed = 0;
  std::chrono::milliseconds elapsed{0};

  // tail-sync reached a row the blob tier already had
  bool stopped_early = false;
};

struct MigratorOptions {
  int64_t                   batch_size        = 1000;
  std::chrono::milliseconds progress_interval = std::chrono::seconds(10);
};

/*
  Copies payload bytes from the relational store into the blob tier.

  SyncTail
    newest to oldest, stops at the first row the tier already has.
    Rows are assumed to be backfilled oldest-first, so everything older
    than a synced row is synced too. Fetch errors are logged and skipped.

  MigrateRange
    operator-driven bulk copy in fixed-size batches, one concurrent
    write per row. Any failure aborts the run; re-running is safe since
    puts overwrite with identical bytes.
*/
class BackfillMigrator {
 public:
  BackfillMigrator(std::shared_ptr<core::MessageStore> store, storage::BlobStorePtr blob_store, MigratorOptions options = {});

  MigrationReport SyncTail();
  MigrationReport MigrateRange(const OffsetRange& range);

 private:
  std::shared_ptr<core::MessageStore> store_;
  storage::BlobStorePtr               blob_store_;
  MigratorOptions                     options_;
};

} // namespace schedstore::migration
