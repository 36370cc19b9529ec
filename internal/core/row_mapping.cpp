#include "row_mapping.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace schedstore::core {

std::string DocumentToJson(const google::protobuf::Struct& document) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(document, &json);
  if (!status.ok()) {
    throw util::JsonError(std::string(status.message()));
  }
  return json;
}

google::protobuf::Struct DocumentFromJson(const std::string& json) {
  google::protobuf::Struct document;
  if (json.empty()) {
    return document;
  }

  auto status = google::protobuf::util::JsonStringToMessage(json, &document);
  if (!status.ok()) {
    throw util::JsonError(std::string(status.message()));
  }
  return document;
}

db::model::ProcessRecord ToRecord(const model::Process& process, const std::string& bundle) {
  db::model::ProcessRecord r;
  r.process_id   = process.process_id;
  r.process_data = DocumentToJson(process.data);
  r.bundle       = bundle;
  return r;
}

model::Process FromRecord(const db::model::ProcessRecord& record) {
  model::Process p;
  p.process_id = record.process_id;
  p.data       = DocumentFromJson(record.process_data);
  return p;
}

db::model::MessageRecord ToRecord(const model::Message& message, const std::string& bundle) {
  db::model::MessageRecord r;
  r.process_id    = message.process_id;
  r.message_id    = message.message_id;
  r.assignment_id = message.assignment_id;
  r.message_data  = DocumentToJson(message.document);
  r.epoch         = message.epoch;
  r.nonce         = message.nonce;
  r.timestamp     = message.timestamp;
  r.bundle        = bundle;
  r.hash_chain    = message.hash_chain;
  return r;
}

model::Message FromRecord(const db::model::MessageRecord& record) {
  model::Message m;
  m.process_id    = record.process_id;
  m.message_id    = record.message_id;
  m.assignment_id = record.assignment_id;
  m.epoch         = record.epoch;
  m.nonce         = record.nonce;
  m.timestamp     = record.timestamp;
  m.hash_chain    = record.hash_chain;
  m.document      = DocumentFromJson(record.message_data);
  m.bundle        = record.bundle;
  return m;
}

storage::BlobKey BlobKeyFor(const db::model::MessageRecord& record) {
  return storage::BlobKey{
      .message_id    = record.message_id,
      .assignment_id = record.assignment_id,
      .process_id    = record.process_id,
      .timestamp     = std::to_string(record.timestamp),
  };
}

storage::BlobKey BlobKeyFor(const model::Message& message) {
  return storage::BlobKey{
      .message_id    = message.message_id,
      .assignment_id = message.assignment_id,
      .process_id    = message.process_id,
      .timestamp     = std::to_string(message.timestamp),
  };
}

db::model::SchedulerRecord ToRecord(const model::Scheduler& scheduler) {
  db::model::SchedulerRecord r;
  r.row_id        = scheduler.row_id.value_or(0);
  r.url           = scheduler.url;
  r.process_count = scheduler.process_count;
  return r;
}

model::Scheduler FromRecord(const db::model::SchedulerRecord& record) {
  return model::Scheduler{.row_id = record.row_id, .url = record.url, .process_count = record.process_count};
}

db::model::ProcessSchedulerRecord ToRecord(const model::ProcessScheduler& process_scheduler) {
  db::model::ProcessSchedulerRecord r;
  r.row_id           = process_scheduler.row_id.value_or(0);
  r.process_id       = process_scheduler.process_id;
  r.scheduler_row_id = process_scheduler.scheduler_row_id;
  return r;
}

model::ProcessScheduler FromRecord(const db::model::ProcessSchedulerRecord& record) {
  return model::ProcessScheduler{
      .row_id = record.row_id, .process_id = record.process_id, .scheduler_row_id = record.scheduler_row_id};
}

} // namespace schedstore::core
