#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>

#include "internal/db/model/message_record.hpp"

namespace schedstore::core {

/*
  Rebuilds a message document from payload bytes.

  Used on the blob-tier read path, where the relational query returns
  header columns only. The bundle format belongs to the caller; plug in
  its codec here.
*/
class MessageDecoder {
 public:
  virtual ~MessageDecoder() = default;

  virtual google::protobuf::Struct Decode(const db::model::MessageRecord& header, const std::string& bundle) const = 0;
};

using MessageDecoderPtr = std::shared_ptr<const MessageDecoder>;

/*
  Default decoder.

  Knows nothing about the bundle format, so the document is synthesized
  from the indexed header columns.
*/
class HeaderDocumentDecoder final : public MessageDecoder {
 public:
  google::protobuf::Struct Decode(const db::model::MessageRecord& header, const std::string& bundle) const override;
};

} // namespace schedstore::core
