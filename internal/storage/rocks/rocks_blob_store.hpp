#pragma once

#include <rocksdb/db.h>

#include <filesystem>
#include <memory>

#include "internal/storage/blob_store.hpp"

namespace schedstore::storage {

struct RocksBlobOptions {
  std::filesystem::path data_dir;
  uint64_t              min_blob_size  = 1024;
  uint64_t              blob_file_size = 5ULL * 1024 * 1024 * 1024;
};

/*
  RocksDB in integrated BlobDB mode.

  Values at or above min_blob_size are written to blob files instead of
  the LSM tree, which keeps compaction cheap for large payloads.
*/
class RocksBlobStore final : public BlobStore {
 public:
  explicit RocksBlobStore(const RocksBlobOptions& options);
  ~RocksBlobStore() override;

  RocksBlobStore(const RocksBlobStore&)            = delete;
  RocksBlobStore& operator=(const RocksBlobStore&) = delete;

  void    SaveBinary(const BlobKey& key, const std::string& bytes) override;
  bool    Exists(const BlobKey& key) override;
  BlobMap ReadBinaries(const std::vector<BlobKey>& keys) override;
  uint64_t CountEntries() override;

 private:
  std::unique_ptr<rocksdb::DB> db_;
};

} // namespace schedstore::storage
