#include "message_decoder.hpp"

namespace schedstore::core {

google::protobuf::Struct HeaderDocumentDecoder::Decode(const db::model::MessageRecord& header, const std::string&) const {
  google::protobuf::Struct doc;
  auto&                    fields = *doc.mutable_fields();

  fields["process_id"].set_string_value(header.process_id);
  fields["message_id"].set_string_value(header.message_id);
  if (header.assignment_id) {
    fields["assignment_id"].set_string_value(*header.assignment_id);
  } else {
    fields["assignment_id"].set_null_value(google::protobuf::NULL_VALUE);
  }
  fields["epoch"].set_number_value(header.epoch);
  fields["nonce"].set_number_value(header.nonce);
  // JSON numbers lose precision past 2^53
  fields["timestamp"].set_string_value(std::to_string(header.timestamp));
  fields["hash_chain"].set_string_value(header.hash_chain);

  return doc;
}

} // namespace schedstore::core
