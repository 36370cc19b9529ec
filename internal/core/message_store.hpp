#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/message_decoder.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/message.hpp"
#include "internal/model/paginated_messages.hpp"
#include "internal/model/process.hpp"
#include "internal/model/scheduler.hpp"
#include "internal/storage/blob_store.hpp"

namespace schedstore::core {

/*
  MessageStore

  Sole entry point to the two storage tiers.

    relational store   source of truth for every entity
    blob tier          optional derived copy of message payload bytes

  Writes go to the relational store first, then (tier enabled) the
  payload is mirrored into the blob tier before the call returns. There
  is no transaction spanning both tiers: a blob write that fails after
  the relational commit is reported as DatabaseError and the row stays.
  BackfillMigrator repairs the gap.

  Reads use the replica connection except GetLatestMessage, which must
  see the newest committed row and therefore uses the primary.

  Every failure is a util::StoreError.
*/
class MessageStore {
 public:
  static constexpr int64_t kDefaultPageSize = 5000;

  // blob_store may be null: the blob tier is disabled.
  MessageStore(std::shared_ptr<db::Repository> repository, storage::BlobStorePtr blob_store,
               MessageDecoderPtr decoder = std::make_shared<HeaderDocumentDecoder>());

  bool BlobTierEnabled() const {
    return blob_store_ != nullptr;
  }

  // ------------------------------------------------------------------
  // Processes
  // ------------------------------------------------------------------
  // Insert-if-absent. Saving an existing process_id is a no-op.
  void           SaveProcess(const model::Process& process, const std::string& bundle);
  model::Process GetProcess(const std::string& process_id);

  // ------------------------------------------------------------------
  // Messages
  // ------------------------------------------------------------------
  /*
    Duplicate-payload guard.

    Assignments always pass. A data item fails with MessageExists when a
    row resolving to the same message_id already carries a payload.
  */
  void CheckExistingMessage(const model::Message& message);

  void SaveMessage(const model::Message& message, const std::string& bundle);

  // Earliest row whose message_id or assignment_id equals id.
  model::Message GetMessage(const std::string& id);

  // Highest insertion id for the process, read from the primary.
  std::optional<model::Message> GetLatestMessage(const std::string& process_id);

  /*
    One page ordered by timestamp ascending.

    from/to are decimal cursors: timestamp > from, timestamp <= to.
    limit defaults to kDefaultPageSize and must lie in [1, INT64_MAX).

    With the blob tier enabled, a message whose bundle came from the tier
    carries the document produced by the MessageDecoder, not the stored
    message_data. The default HeaderDocumentDecoder rebuilds it from the
    header columns only, so HasPayload() is false for those rows. Rows
    served by the relational fallback carry the stored document.
  */
  model::PaginatedMessages GetMessages(const std::string& process_id, const std::optional<std::string>& from,
                                       const std::optional<std::string>& to, std::optional<int64_t> limit);

  int64_t MessageCount();

  // Table-wide scans used by the backfill migrator (timestamp ordered).
  std::vector<model::Message>   GetMessagesByOffset(int64_t offset, std::optional<int64_t> count);
  std::optional<model::Message> GetMessageFromEnd(int64_t offset);

  // ------------------------------------------------------------------
  // Schedulers
  // ------------------------------------------------------------------
  void                           SaveScheduler(const model::Scheduler& scheduler);
  void                           UpdateScheduler(const model::Scheduler& scheduler);
  model::Scheduler               GetScheduler(int32_t row_id);
  model::Scheduler               GetSchedulerByUrl(const std::string& url);
  std::vector<model::Scheduler>  GetAllSchedulers();
  void                           SaveProcessScheduler(const model::ProcessScheduler& process_scheduler);
  model::ProcessScheduler        GetProcessScheduler(const std::string& process_id);

 private:
  std::vector<model::Message> ResolvePayloads(std::vector<db::model::MessageRecord> headers);

  std::shared_ptr<db::Repository> repository_;
  storage::BlobStorePtr           blob_store_;
  MessageDecoderPtr               decoder_;
};

} // namespace schedstore::core
