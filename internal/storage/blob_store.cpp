#include "blob_store.hpp"

namespace schedstore::storage {

namespace {
constexpr const char* kKeyPrefix = "message";
constexpr const char* kSeparator = "___";
} // namespace

std::string EncodeKey(const BlobKey& key) {
  std::string out;
  out.reserve(32 + key.process_id.size() + key.timestamp.size() + key.message_id.size());

  out += kKeyPrefix;
  out += kSeparator;
  out += key.process_id;
  out += kSeparator;
  out += key.timestamp;
  out += kSeparator;
  out += key.message_id;

  if (key.assignment_id) {
    out += kSeparator;
    out += *key.assignment_id;
  }
  return out;
}

} // namespace schedstore::storage
