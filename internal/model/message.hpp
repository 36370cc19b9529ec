#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>

namespace schedstore::model {

/*
  A message in a process sequence.

  Either a data item (carries the payload) or an assignment that references
  an existing data item by message_id. The scalar fields are the indexed
  columns; everything else lives in the opaque document.

  epoch/nonce/hash_chain are supplied by the caller and stored verbatim.
*/
struct Message {
  std::string                process_id;
  std::string                message_id;
  std::optional<std::string> assignment_id;

  int32_t     epoch     = 0;
  int32_t     nonce     = 0;
  int64_t     timestamp = 0;
  std::string hash_chain;

  google::protobuf::Struct document;

  // raw bundle bytes
  std::string bundle;

  // A data item carries a non-null "message" member in its document.
  bool HasPayload() const;
};

inline bool Message::HasPayload() const {
  auto it = document.fields().find("message");
  if (it == document.fields().end()) {
    return false;
  }
  return it->second.kind_case() != google::protobuf::Value::kNullValue &&
         it->second.kind_case() != google::protobuf::Value::KIND_NOT_SET;
}

} // namespace schedstore::model
