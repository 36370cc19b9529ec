#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace schedstore::db::model {

/*
  messages row.

  IMPORTANT:
  - Rows are append-only.
  - row_id is insertion order; only "latest" queries use it.
  - A header-only read (ListMessages with headers_only) leaves
    message_data and bundle empty.
*/

struct MessageRecord {
  int32_t row_id = 0;

  std::string                process_id;
  std::string                message_id;
  std::optional<std::string> assignment_id;

  // JSON text
  std::string message_data;

  int32_t epoch     = 0;
  int32_t nonce     = 0;
  int64_t timestamp = 0;

  std::string bundle;
  std::string hash_chain;
};

} // namespace schedstore::db::model
