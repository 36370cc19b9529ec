#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/db/model/message_record.hpp"
#include "internal/db/model/process_record.hpp"
#include "internal/db/model/scheduler_record.hpp"
#include "internal/model/message.hpp"
#include "internal/model/process.hpp"
#include "internal/model/scheduler.hpp"
#include "internal/storage/blob_store.hpp"

namespace schedstore::core {

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

// Throws util::JsonError.
std::string DocumentToJson(const google::protobuf::Struct& document);
google::protobuf::Struct DocumentFromJson(const std::string& json);

// ------------------------------------------------------------------
// Processes
// ------------------------------------------------------------------

db::model::ProcessRecord ToRecord(const model::Process& process, const std::string& bundle);
model::Process FromRecord(const db::model::ProcessRecord& record);

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

db::model::MessageRecord ToRecord(const model::Message& message, const std::string& bundle);

// Full rows only; a header-only row has no document to parse.
model::Message FromRecord(const db::model::MessageRecord& record);

storage::BlobKey BlobKeyFor(const db::model::MessageRecord& record);
storage::BlobKey BlobKeyFor(const model::Message& message);

// ------------------------------------------------------------------
// Schedulers
// ------------------------------------------------------------------

db::model::SchedulerRecord ToRecord(const model::Scheduler& scheduler);
model::Scheduler FromRecord(const db::model::SchedulerRecord& record);

db::model::ProcessSchedulerRecord ToRecord(const model::ProcessScheduler& process_scheduler);
model::ProcessScheduler FromRecord(const db::model::ProcessSchedulerRecord& record);

} // namespace schedstore::core
