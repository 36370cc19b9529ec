#include "internal/core/message_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/row_mapping.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/store_fixture.hpp"

namespace {

using schedstore::core::MessageDecoder;
using schedstore::core::MessageStore;
using schedstore::db::ConnectionRole;
using schedstore::db::model::MessageRecord;
using schedstore::model::Message;
using schedstore::model::Process;
using schedstore::model::ProcessScheduler;
using schedstore::model::Scheduler;
using schedstore::testing::BundleFor;
using schedstore::testing::CountingBlobStore;
using schedstore::testing::MakeAssignment;
using schedstore::testing::MakeDataItem;
using schedstore::testing::RecordingRepository;
using schedstore::testing::StoreFixture;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void SaveTimeline(MessageStore& store, const std::string& process_id, const std::vector<int64_t>& timestamps) {
  for (auto ts : timestamps) {
    const auto id = process_id + "-" + std::to_string(ts);
    store.SaveMessage(MakeDataItem(process_id, id, ts), BundleFor(id));
  }
}

std::vector<int64_t> Timestamps(const schedstore::model::PaginatedMessages& page) {
  std::vector<int64_t> out;
  for (const auto& m : page.messages) {
    out.push_back(m.timestamp);
  }
  return out;
}

class RecordingDecoder final : public MessageDecoder {
 public:
  google::protobuf::Struct Decode(const MessageRecord& header, const std::string& bundle) const override {
    calls.fetch_add(1);
    google::protobuf::Struct doc;
    (*doc.mutable_fields())["decoded_from"].set_string_value(header.message_id);
    (*doc.mutable_fields())["bundle_size"].set_number_value(static_cast<double>(bundle.size()));
    return doc;
  }

  mutable std::atomic<int> calls{0};
};

// ------------------------------------------------------------------
// Processes
// ------------------------------------------------------------------

void TestSaveProcessTwiceKeepsFirstRow() {
  StoreFixture fixture("process_twice", false);
  auto&        store = fixture.Store();

  Process first;
  first.process_id = "proc-1";
  (*first.data.mutable_fields())["module"].set_string_value("first");
  store.SaveProcess(first, "bundle-1");

  Process second = first;
  (*second.data.mutable_fields())["module"].set_string_value("second");
  store.SaveProcess(second, "bundle-2");

  auto stored = store.GetProcess("proc-1");
  assert(stored.process_id == "proc-1");
  assert(stored.data.fields().at("module").string_value() == "first");

  assert(Throws<schedstore::util::NotFound>([&] { (void)store.GetProcess("proc-missing"); }));
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

void TestDuplicatePayloadIsRejectedButAssignmentsPass() {
  StoreFixture fixture("duplicate", false);
  auto&        store = fixture.Store();

  store.SaveMessage(MakeDataItem("p", "M", 100), BundleFor("M"));

  assert(Throws<schedstore::util::MessageExists>([&] { store.SaveMessage(MakeDataItem("p", "M", 200), BundleFor("M2")); }));
  store.SaveMessage(MakeAssignment("p", "M", "A1", 300), BundleFor("A1"));
  store.SaveMessage(MakeAssignment("p", "M", "A2", 400), BundleFor("A2"));

  assert(store.MessageCount() == 3);
}

void TestPayloadAfterAssignmentIsAccepted() {
  StoreFixture fixture("assignment_first", false);
  auto&        store = fixture.Store();

  store.SaveMessage(MakeAssignment("p", "M", "A", 50), BundleFor("A"));
  store.CheckExistingMessage(MakeDataItem("p", "M", 60));
  store.SaveMessage(MakeDataItem("p", "M", 60), BundleFor("M"));
  assert(store.MessageCount() == 2);
}

void TestGetMessageResolvesEarliestMatch() {
  StoreFixture fixture("resolve", false);
  auto&        store = fixture.Store();

  store.SaveMessage(MakeDataItem("p", "M", 200), BundleFor("M"));
  store.SaveMessage(MakeAssignment("p", "M", "A", 300), BundleFor("A"));
  store.SaveMessage(MakeAssignment("p", "M", "B", 150), BundleFor("B"));

  auto by_message = store.GetMessage("M");
  assert(by_message.timestamp == 150);
  assert(by_message.assignment_id.value() == "B");

  auto by_assignment = store.GetMessage("A");
  assert(by_assignment.timestamp == 300);
  assert(by_assignment.bundle == BundleFor("A"));
  assert(!by_assignment.HasPayload());

  assert(Throws<schedstore::util::NotFound>([&] { (void)store.GetMessage("unknown"); }));
}

void TestLatestFollowsInsertionOrder() {
  StoreFixture fixture("latest", false);
  auto&        store = fixture.Store();

  assert(!store.GetLatestMessage("p").has_value());

  store.SaveMessage(MakeDataItem("p", "late", 500), BundleFor("late"));
  store.SaveMessage(MakeDataItem("p", "early", 100), BundleFor("early"));
  store.SaveMessage(MakeDataItem("other", "x", 900), BundleFor("x"));

  auto latest = store.GetLatestMessage("p");
  assert(latest.has_value());
  assert(latest->message_id == "early");
  assert(latest->timestamp == 100);
  assert(latest->hash_chain == "hash-early");
}

void TestPaginationOverFetchesByOne(bool blob_tier) {
  StoreFixture fixture(blob_tier ? "page_tier" : "page_plain", blob_tier);
  auto&        store = fixture.Store();
  SaveTimeline(store, "p", {100, 200, 300, 400, 500});

  auto first = store.GetMessages("p", std::string("150"), std::nullopt, 2);
  assert((Timestamps(first) == std::vector<int64_t>{200, 300}));
  assert(first.has_next_page);

  auto second = store.GetMessages("p", std::string("300"), std::nullopt, 2);
  assert((Timestamps(second) == std::vector<int64_t>{400, 500}));
  assert(!second.has_next_page);

  auto bounded = store.GetMessages("p", std::string("100"), std::string("400"), std::nullopt);
  assert((Timestamps(bounded) == std::vector<int64_t>{200, 300, 400}));
  assert(!bounded.has_next_page);

  auto everything = store.GetMessages("p", std::nullopt, std::nullopt, std::nullopt);
  assert(everything.messages.size() == 5);
  assert(everything.messages[0].bundle == BundleFor("p-100"));
}

void TestPagesReconstructFullSet(bool blob_tier) {
  StoreFixture fixture(blob_tier ? "walk_tier" : "walk_plain", blob_tier);
  auto&        store = fixture.Store();

  std::vector<int64_t> expected;
  for (int64_t ts = 10; ts <= 170; ts += 10) {
    expected.push_back(ts);
  }
  SaveTimeline(store, "p", expected);
  const auto n = static_cast<int64_t>(expected.size());

  for (int64_t limit = 1; limit <= n + 3; ++limit) {
    auto single = store.GetMessages("p", std::nullopt, std::nullopt, limit);
    if (limit < n) {
      assert(static_cast<int64_t>(single.messages.size()) == limit);
      assert(single.has_next_page);
    } else {
      assert(static_cast<int64_t>(single.messages.size()) == n);
      assert(!single.has_next_page);
    }

    std::vector<int64_t>       seen;
    std::optional<std::string> cursor;
    while (true) {
      auto page = store.GetMessages("p", cursor, std::nullopt, limit);
      for (const auto& m : page.messages) {
        seen.push_back(m.timestamp);
      }
      if (!page.has_next_page) break;
      cursor = std::to_string(page.messages.back().timestamp);
    }
    assert(seen == expected);
  }
}

void TestInvalidCursorAndLimit() {
  StoreFixture fixture("cursor", false);
  auto&        store = fixture.Store();

  assert(Throws<schedstore::util::IntError>([&] { (void)store.GetMessages("p", std::string("abc"), std::nullopt, 10); }));
  assert(Throws<schedstore::util::IntError>([&] { (void)store.GetMessages("p", std::nullopt, std::string("12z"), 10); }));
  assert(Throws<schedstore::util::IntError>([&] { (void)store.GetMessages("p", std::nullopt, std::nullopt, 0); }));
  assert(Throws<schedstore::util::IntError>([&] { (void)store.GetMessages("p", std::nullopt, std::nullopt, -3); }));
  assert(Throws<schedstore::util::IntError>(
      [&] { (void)store.GetMessages("p", std::nullopt, std::nullopt, std::numeric_limits<int64_t>::max()); }));
}

// ------------------------------------------------------------------
// Blob tier
// ------------------------------------------------------------------

void TestSaveWritesThroughToBlobTier() {
  StoreFixture fixture("write_through", true);
  auto&        rt = fixture.Runtime();

  auto message = MakeDataItem("p", "m1", 1234);
  rt.store->SaveMessage(message, BundleFor("m1"));

  const auto key = schedstore::core::BlobKeyFor(message);
  assert(rt.blob_store->Exists(key));
  assert(rt.blob_store->ReadBinaries({key}).at(key) == BundleFor("m1"));

  auto assignment = MakeAssignment("p", "m1", "a1", 1300);
  rt.store->SaveMessage(assignment, BundleFor("a1"));
  assert(rt.blob_store->Exists(schedstore::core::BlobKeyFor(assignment)));
  assert(rt.blob_store->CountEntries() == 2);
}

void TestTierEnabledMatchesTierDisabled() {
  StoreFixture with_tier("parity_tier", true);
  StoreFixture without_tier("parity_plain", false);

  for (auto* fixture : {&with_tier, &without_tier}) {
    auto& store = fixture->Store();
    for (int64_t ts = 1; ts <= 12; ++ts) {
      const auto id = "m" + std::to_string(ts);
      if (ts % 3 == 0) {
        store.SaveMessage(MakeAssignment("p", "m" + std::to_string(ts - 1), "a" + std::to_string(ts), ts), BundleFor("a" + std::to_string(ts)));
      } else {
        store.SaveMessage(MakeDataItem("p", id, ts), BundleFor(id));
      }
    }
  }

  auto tiered = with_tier.Store().GetMessages("p", std::string("2"), std::nullopt, 6);
  auto plain  = without_tier.Store().GetMessages("p", std::string("2"), std::nullopt, 6);

  assert(tiered.has_next_page == plain.has_next_page);
  assert(tiered.messages.size() == plain.messages.size());
  for (size_t i = 0; i < plain.messages.size(); ++i) {
    assert(tiered.messages[i].message_id == plain.messages[i].message_id);
    assert(tiered.messages[i].assignment_id == plain.messages[i].assignment_id);
    assert(tiered.messages[i].timestamp == plain.messages[i].timestamp);
    assert(tiered.messages[i].hash_chain == plain.messages[i].hash_chain);
    assert(tiered.messages[i].bundle == plain.messages[i].bundle);

    // tier hits carry the header document, not the stored message_data
    assert(plain.messages[i].HasPayload() == !plain.messages[i].assignment_id.has_value());
    assert(!tiered.messages[i].HasPayload());
    assert(tiered.messages[i].document.fields().at("message_id").string_value() == plain.messages[i].message_id);
  }
}

void TestTierMissFallsBackToRelationalRow() {
  StoreFixture fixture("fallback", true);
  auto&        rt = fixture.Runtime();

  // rows written with the tier disabled have no blob copy
  MessageStore relational_only(rt.repository, nullptr);
  SaveTimeline(relational_only, "p", {10, 20});
  SaveTimeline(*rt.store, "p", {30});

  auto decoder = std::make_shared<RecordingDecoder>();
  MessageStore tiered(rt.repository, rt.blob_store, decoder);

  auto page = tiered.GetMessages("p", std::nullopt, std::nullopt, 10);
  assert(page.messages.size() == 3);
  assert(!page.has_next_page);

  // misses come back as full rows with their stored document
  assert(page.messages[0].bundle == BundleFor("p-10"));
  assert(page.messages[0].HasPayload());
  assert(page.messages[1].bundle == BundleFor("p-20"));

  // the hit is rebuilt through the decoder
  assert(decoder->calls.load() == 1);
  assert(page.messages[2].bundle == BundleFor("p-30"));
  assert(page.messages[2].document.fields().at("decoded_from").string_value() == "p-30");
}

void TestBlobFailureLeavesRelationalRow() {
  StoreFixture fixture("blob_failure", true);
  auto&        rt = fixture.Runtime();

  auto         counting = std::make_shared<CountingBlobStore>(rt.blob_store);
  MessageStore store(rt.repository, counting);

  counting->fail_writes = true;
  auto message          = MakeDataItem("p", "orphan", 77);
  assert(Throws<schedstore::util::DatabaseError>([&] { store.SaveMessage(message, BundleFor("orphan")); }));

  // the relational commit stands; only the blob copy is missing
  auto stored = store.GetMessage("orphan");
  assert(stored.bundle == BundleFor("orphan"));
  assert(!rt.blob_store->Exists(schedstore::core::BlobKeyFor(message)));

  // reads still serve it through the fallback
  counting->fail_writes = false;
  auto page             = store.GetMessages("p", std::nullopt, std::nullopt, 5);
  assert(page.messages.size() == 1);
  assert(page.messages[0].bundle == BundleFor("orphan"));
  assert(counting->bulk_reads.load() == 1);
}

// ------------------------------------------------------------------
// Connection routing
// ------------------------------------------------------------------

void TestWritesAndLatestUsePrimaryReadsUseReplica() {
  StoreFixture fixture("routing", false);
  auto         recording = std::make_shared<RecordingRepository>(fixture.Runtime().repository);
  MessageStore store(recording, nullptr);

  using Roles = std::vector<ConnectionRole>;

  Process process;
  process.process_id = "p";
  store.SaveProcess(process, "bundle");
  assert(recording->TakeRoles() == Roles{ConnectionRole::Primary});

  // the duplicate guard reads before the insert
  store.SaveMessage(MakeDataItem("p", "m1", 10), BundleFor("m1"));
  assert((recording->TakeRoles() == Roles{ConnectionRole::Replica, ConnectionRole::Primary}));

  store.SaveMessage(MakeAssignment("p", "m1", "a1", 11), BundleFor("a1"));
  assert(recording->TakeRoles() == Roles{ConnectionRole::Primary});

  auto latest = store.GetLatestMessage("p");
  assert(latest.has_value() && latest->assignment_id == std::optional<std::string>("a1"));
  assert(recording->TakeRoles() == Roles{ConnectionRole::Primary});

  (void)store.GetMessage("m1");
  assert(recording->TakeRoles() == Roles{ConnectionRole::Replica});

  (void)store.GetMessages("p", std::nullopt, std::nullopt, 10);
  assert(recording->TakeRoles() == Roles{ConnectionRole::Replica});

  (void)store.GetProcess("p");
  assert(recording->TakeRoles() == Roles{ConnectionRole::Replica});

  (void)store.MessageCount();
  assert(recording->TakeRoles() == Roles{ConnectionRole::Replica});

  store.SaveScheduler(Scheduler{.row_id = std::nullopt, .url = "https://su-routing", .process_count = 0});
  assert(recording->TakeRoles() == Roles{ConnectionRole::Primary});

  (void)store.GetSchedulerByUrl("https://su-routing");
  assert(recording->TakeRoles() == Roles{ConnectionRole::Replica});
}

// ------------------------------------------------------------------
// Schedulers
// ------------------------------------------------------------------

void TestSchedulerLifecycle() {
  StoreFixture fixture("schedulers", false);
  auto&        store = fixture.Store();

  store.SaveScheduler(Scheduler{.row_id = std::nullopt, .url = "https://su-1", .process_count = 0});
  store.SaveScheduler(Scheduler{.row_id = std::nullopt, .url = "https://su-2", .process_count = 3});
  store.SaveScheduler(Scheduler{.row_id = std::nullopt, .url = "https://su-1", .process_count = 99});

  auto su1 = store.GetSchedulerByUrl("https://su-1");
  assert(su1.row_id.has_value());
  assert(su1.process_count == 0);

  su1.process_count = 5;
  store.UpdateScheduler(su1);
  assert(store.GetScheduler(*su1.row_id).process_count == 5);

  assert(Throws<schedstore::util::DatabaseError>(
      [&] { store.UpdateScheduler(Scheduler{.row_id = std::nullopt, .url = "https://su-1", .process_count = 1}); }));
  assert(Throws<schedstore::util::NotFound>(
      [&] { store.UpdateScheduler(Scheduler{.row_id = 4242, .url = "https://ghost", .process_count = 1}); }));
  assert(Throws<schedstore::util::NotFound>([&] { (void)store.GetScheduler(4242); }));
  assert(Throws<schedstore::util::NotFound>([&] { (void)store.GetSchedulerByUrl("https://ghost"); }));

  auto all = store.GetAllSchedulers();
  assert(all.size() == 2);
  assert(all[0].url == "https://su-1");
  assert(all[1].url == "https://su-2");

  store.SaveProcessScheduler(ProcessScheduler{.row_id = std::nullopt, .process_id = "proc", .scheduler_row_id = *su1.row_id});
  store.SaveProcessScheduler(ProcessScheduler{.row_id = std::nullopt, .process_id = "proc", .scheduler_row_id = *all[1].row_id});

  auto owner = store.GetProcessScheduler("proc");
  assert(owner.scheduler_row_id == *su1.row_id);
  assert(Throws<schedstore::util::NotFound>([&] { (void)store.GetProcessScheduler("unowned"); }));
}

} // namespace

int main() {
  TestSaveProcessTwiceKeepsFirstRow();
  TestDuplicatePayloadIsRejectedButAssignmentsPass();
  TestPayloadAfterAssignmentIsAccepted();
  TestGetMessageResolvesEarliestMatch();
  TestLatestFollowsInsertionOrder();
  TestPaginationOverFetchesByOne(false);
  TestPaginationOverFetchesByOne(true);
  TestPagesReconstructFullSet(false);
  TestPagesReconstructFullSet(true);
  TestInvalidCursorAndLimit();
  TestSaveWritesThroughToBlobTier();
  TestTierEnabledMatchesTierDisabled();
  TestTierMissFallsBackToRelationalRow();
  TestBlobFailureLeavesRelationalRow();
  TestWritesAndLatestUsePrimaryReadsUseReplica();
  TestSchedulerLifecycle();

  std::cout << "schedstore_unit_message_store: pass\n";
  return 0;
}
