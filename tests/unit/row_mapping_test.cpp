#include "internal/core/row_mapping.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/core/message_decoder.hpp"
#include "internal/util/errors.hpp"

namespace {

using schedstore::core::BlobKeyFor;
using schedstore::core::DocumentFromJson;
using schedstore::core::FromRecord;
using schedstore::core::HeaderDocumentDecoder;
using schedstore::core::ToRecord;
using schedstore::db::model::MessageRecord;
using schedstore::model::Message;
using schedstore::model::Process;

void TestMessageRecordCarriesIndexedColumns() {
  Message m;
  m.process_id    = "proc";
  m.message_id    = "msg";
  m.assignment_id = "asg";
  m.epoch         = 3;
  m.nonce         = 17;
  m.timestamp     = 1700000000456;
  m.hash_chain    = "chain";
  (*m.document.mutable_fields())["message"].mutable_struct_value();

  auto r = ToRecord(m, std::string("\0raw", 4));
  assert(r.process_id == "proc");
  assert(r.message_id == "msg");
  assert(r.assignment_id.value() == "asg");
  assert(r.epoch == 3);
  assert(r.nonce == 17);
  assert(r.timestamp == 1700000000456);
  assert(r.hash_chain == "chain");
  assert(r.bundle == std::string("\0raw", 4));
  assert(r.message_data.find("\"message\"") != std::string::npos);

  auto back = FromRecord(r);
  assert(back.HasPayload());
  assert(back.bundle == r.bundle);
  assert(back.assignment_id == m.assignment_id);
}

void TestHasPayloadTreatsNullAsAbsent() {
  Message assignment;
  assert(!assignment.HasPayload());

  (*assignment.document.mutable_fields())["message"].set_null_value(google::protobuf::NULL_VALUE);
  assert(!assignment.HasPayload());

  (*assignment.document.mutable_fields())["message"].set_string_value("data");
  assert(assignment.HasPayload());
}

void TestProcessDocumentRoundTrip() {
  Process p;
  p.process_id = "proc";
  (*p.data.mutable_fields())["tags"].mutable_list_value()->add_values()->set_string_value("a");

  auto r = ToRecord(p, "bundle");
  assert(r.bundle == "bundle");

  auto back = FromRecord(r);
  assert(back.process_id == "proc");
  assert(back.data.fields().at("tags").list_value().values(0).string_value() == "a");
}

void TestMalformedDocumentIsJsonError() {
  bool threw = false;
  try {
    (void)DocumentFromJson("{not json");
  } catch (const schedstore::util::JsonError& e) {
    threw = true;
    assert(std::string(e.what()).find("data store json error") == 0);
  }
  assert(threw);

  // header-only rows carry no document
  assert(DocumentFromJson("").fields().empty());
}

void TestBlobKeyUsesDecimalTimestamp() {
  MessageRecord r;
  r.process_id = "p";
  r.message_id = "m";
  r.timestamp  = 90;

  auto key = BlobKeyFor(r);
  assert(key.timestamp == "90");
  assert(!key.assignment_id.has_value());
  assert(schedstore::storage::EncodeKey(key) == "message___p___90___m");
}

void TestHeaderDecoderSynthesizesDocument() {
  MessageRecord r;
  r.process_id    = "p";
  r.message_id    = "m";
  r.assignment_id = std::nullopt;
  r.epoch         = 1;
  r.nonce         = 2;
  r.timestamp     = 9007199254740993;
  r.hash_chain    = "h";

  HeaderDocumentDecoder decoder;
  auto                  doc = decoder.Decode(r, "bytes");
  assert(doc.fields().at("message_id").string_value() == "m");
  assert(doc.fields().at("assignment_id").kind_case() == google::protobuf::Value::kNullValue);
  assert(doc.fields().at("nonce").number_value() == 2);
  assert(doc.fields().at("timestamp").string_value() == "9007199254740993");
  assert(doc.fields().at("hash_chain").string_value() == "h");
}

} // namespace

int main() {
  TestMessageRecordCarriesIndexedColumns();
  TestHasPayloadTreatsNullAsAbsent();
  TestProcessDocumentRoundTrip();
  TestMalformedDocumentIsJsonError();
  TestBlobKeyUsesDecimalTimestamp();
  TestHeaderDecoderSynthesizesDocument();

  std::cout << "schedstore_unit_row_mapping: pass\n";
  return 0;
}
