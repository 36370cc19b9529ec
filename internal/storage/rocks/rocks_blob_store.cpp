#include "rocks_blob_store.hpp"

#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schedstore::storage {

namespace {

constexpr std::string_view kMessagePrefix = "message___";

[[noreturn]] void Fail(std::string_view op, const rocksdb::Status& s) {
  SCHEDSTORE_LOG_ERROR("blob tier operation failed", {observability::StringField("op", op),
                                                      observability::StringField("status", s.ToString())});
  throw util::DatabaseError("Blob store " + std::string(op) + " failed: " + s.ToString());
}

} // namespace

RocksBlobStore::RocksBlobStore(const RocksBlobOptions& opt) {
  if (opt.data_dir.empty()) {
    throw util::DatabaseError("Blob store data directory is empty");
  }

  std::error_code ec;
  std::filesystem::create_directories(opt.data_dir, ec);
  if (ec) {
    throw util::DatabaseError("Blob store directory " + opt.data_dir.string() + ": " + ec.message());
  }

  rocksdb::Options options;
  options.create_if_missing = true;
  options.enable_blob_files = true;
  options.min_blob_size     = opt.min_blob_size;
  options.blob_file_size    = opt.blob_file_size;

  rocksdb::DB* raw = nullptr;
  rocksdb::Status s = rocksdb::DB::Open(options, opt.data_dir.string(), &raw);
  if (!s.ok()) {
    Fail("open", s);
  }
  db_.reset(raw);

  SCHEDSTORE_LOG_INFO("blob tier opened", {observability::StringField("path", opt.data_dir.string()),
                                          observability::IntField("min_blob_size", static_cast<int64_t>(opt.min_blob_size))});
}

RocksBlobStore::~RocksBlobStore() {
  if (db_) {
    rocksdb::Status s = db_->Close();
    if (!s.ok()) {
      SCHEDSTORE_LOG_WARN("blob tier close failed", {observability::StringField("status", s.ToString())});
    }
  }
}

void RocksBlobStore::SaveBinary(const BlobKey& key, const std::string& bytes) {
  const std::string encoded = EncodeKey(key);
  rocksdb::Status   s       = db_->Put(rocksdb::WriteOptions(), rocksdb::Slice(encoded), rocksdb::Slice(bytes));
  if (!s.ok()) {
    Fail("put", s);
  }
}

bool RocksBlobStore::Exists(const BlobKey& key) {
  const std::string encoded = EncodeKey(key);

  rocksdb::PinnableSlice value;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), db_->DefaultColumnFamily(), rocksdb::Slice(encoded), &value);
  if (s.IsNotFound()) return false;
  if (!s.ok()) {
    Fail("get", s);
  }
  return true;
}

BlobMap RocksBlobStore::ReadBinaries(const std::vector<BlobKey>& keys) {
  BlobMap out;
  if (keys.empty()) return out;

  std::vector<std::string> encoded;
  encoded.reserve(keys.size());
  for (const auto& key : keys) {
    encoded.push_back(EncodeKey(key));
  }

  std::vector<rocksdb::Slice> slices(encoded.begin(), encoded.end());
  std::vector<std::string>    values;

  std::vector<rocksdb::Status> statuses = db_->MultiGet(rocksdb::ReadOptions(), slices, &values);

  out.reserve(keys.size());
  for (size_t i = 0; i < keys.size(); ++i) {
    if (statuses[i].IsNotFound()) continue;
    if (!statuses[i].ok()) {
      Fail("multiget", statuses[i]);
    }
    out.emplace(keys[i], std::move(values[i]));
  }
  return out;
}

uint64_t RocksBlobStore::CountEntries() {
  uint64_t count = 0;

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
  const rocksdb::Slice               prefix(kMessagePrefix.data(), kMessagePrefix.size());
  for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
    ++count;
  }
  if (!it->status().ok()) {
    Fail("scan", it->status());
  }
  return count;
}

} // namespace schedstore::storage
