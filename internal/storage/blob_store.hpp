#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace schedstore::storage {

/*
  Composite identity of a payload in the blob tier.

  timestamp is kept as text so the encoded key matches what existing
  data directories already contain (decimal, no padding).
*/
struct BlobKey {
  std::string                message_id;
  std::optional<std::string> assignment_id;
  std::string                process_id;
  std::string                timestamp;

  bool operator==(const BlobKey& other) const = default;
};

struct BlobKeyHash {
  size_t operator()(const BlobKey& key) const {
    size_t h = std::hash<std::string>{}(key.message_id);
    h ^= std::hash<std::string>{}(key.process_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(key.timestamp) + 0x9e3779b9 + (h << 6) + (h >> 2);
    if (key.assignment_id) {
      h ^= std::hash<std::string>{}(*key.assignment_id) + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
  }
};

using BlobMap = std::unordered_map<BlobKey, std::string, BlobKeyHash>;

// message___{process_id}___{timestamp}___{message_id}[___{assignment_id}]
std::string EncodeKey(const BlobKey& key);

/*
  Blob tier abstraction.

  Holds a derived copy of message payload bytes. Everything stored here
  can be rebuilt from the relational store, so writes are plain
  overwrite-puts and a missing key is never an error.

  Engine failures are thrown as util::DatabaseError.
*/
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  virtual void SaveBinary(const BlobKey& key, const std::string& bytes) = 0;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual bool Exists(const BlobKey& key) = 0;

  /*
    Bulk point-get.

    Keys that are not present are simply absent from the result; the
    caller decides how to fill the gaps.
  */
  virtual BlobMap ReadBinaries(const std::vector<BlobKey>& keys) = 0;

  // number of message entries, for operator checks
  virtual uint64_t CountEntries() = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace schedstore::storage
