// =============================================================================
// json_file_store_test.cpp
// =============================================================================
// Durability tests for settle::JsonFileStore and the engine's commit/rollback.
//
// Validates:
//   - A snapshot saved to disk loads back field for field
//   - A missing file means "start empty"; a corrupt file is a StorageError
//   - An engine restarted on the same file resumes ids, queue, balances,
//     pause flag and event sequence
//   - A failing store rolls the operation back and publishes nothing
// =============================================================================

#include "settle/codec/json_codec.hpp"
#include "settle/domain/errors.hpp"
#include "settle/engine/settlement_engine.hpp"
#include "settle/persistence/json_file_store.hpp"
#include "settle/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

using settle::domain::SettlementState;

namespace {

// Store double that keeps the last snapshot in memory and can be told to
// fail the next save.
class FlakyStore : public settle::ISettlementStore {
 public:
  std::optional<settle::EngineSnapshot> load() override { return last; }

  void save(const settle::EngineSnapshot& snapshot) override {
    if (fail_next_save) {
      fail_next_save = false;
      throw settle::StorageError("disk full");
    }
    last = snapshot;
    ++saves;
  }

  std::optional<settle::EngineSnapshot> last;
  bool fail_next_save{false};
  int saves{0};
};

}  // namespace

class JsonFileStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    dir_ = fs::temp_directory_path() /
           ("settle_store_test_" + std::to_string(stamp));
    fs::create_directories(dir_);
    path_ = dir_ / "state.json";
    config_.admin = "admin";
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  fs::path path_;
  settle::domain::EscrowConfig config_;
  settle::SimulationTimeProvider clock_{1'000'000};
  settle::EventBus bus_;
};

// -----------------------------------------------------------------------------
// 1. No file yet: load() returns nullopt rather than throwing.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStoreTest, MissingFileLoadsAsEmpty) {
  settle::JsonFileStore store(path_);
  EXPECT_FALSE(store.load().has_value());
}

// -----------------------------------------------------------------------------
// 2. A garbage file must not be mistaken for an empty engine.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStoreTest, CorruptFileIsStorageError) {
  {
    std::ofstream out(path_);
    out << "{ not json";
  }
  settle::JsonFileStore store(path_);
  EXPECT_THROW(store.load(), settle::StorageError);

  {
    std::ofstream out(path_, std::ios::trunc);
    out << R"({"version":1,"settlements":[{"id":"seven"}]})";
  }
  EXPECT_THROW(store.load(), settle::StorageError);
}

// -----------------------------------------------------------------------------
// 3. Saved snapshot round-trips through the file.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStoreTest, SaveThenLoad) {
  settle::EngineSnapshot snap;
  settle::domain::Settlement s;
  s.id = 4;
  s.initiator = "alice";
  s.total_amount = 30;
  s.total_deposited = 30;
  s.state = SettlementState::Executing;
  s.created_at_ms = 500;
  s.timeout_ms = 1000;
  s.queue_position = 2;
  s.total_transfers = 2;
  s.executed_transfers = 1;
  s.requires_price = true;
  s.locked_price = 123;
  s.transfers = {{"alice", "bob", 10, true}, {"alice", "carol", 20, false}};
  snap.settlements.push_back(s);
  snap.next_settlement_id = 5;

  settle::domain::EscrowAccount acct;
  acct.total_amount = 30;
  acct.deposited = 30;
  acct.released = 10;
  acct.contributions = {{"alice", 30}};
  snap.accounts[4] = acct;
  snap.balances["bob"] = 10;
  snap.queue_entries = {{2, 4}};
  snap.next_queue_position = 3;
  snap.paused = true;
  snap.disputers = {"arbiter"};
  snap.next_event_sequence = 17;

  settle::JsonFileStore store(path_);
  store.save(snap);
  EXPECT_TRUE(fs::exists(path_));
  EXPECT_FALSE(fs::exists(fs::path(path_.string() + ".tmp")));

  auto loaded = store.load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->settlements.size(), 1u);
  const auto& r = loaded->settlements[0];
  EXPECT_EQ(r.id, 4u);
  EXPECT_EQ(r.state, SettlementState::Executing);
  EXPECT_EQ(r.queue_position, 2u);
  EXPECT_EQ(r.locked_price, 123);
  EXPECT_FALSE(r.manual_price.has_value());
  EXPECT_FALSE(r.state_before_dispute.has_value());
  ASSERT_EQ(r.transfers.size(), 2u);
  EXPECT_TRUE(r.transfers[0].executed);
  EXPECT_FALSE(r.transfers[1].executed);

  EXPECT_EQ(loaded->next_settlement_id, 5u);
  EXPECT_EQ(loaded->accounts.at(4).released, 10u);
  ASSERT_EQ(loaded->accounts.at(4).contributions.size(), 1u);
  EXPECT_EQ(loaded->balances.at("bob"), 10u);
  ASSERT_EQ(loaded->queue_entries.size(), 1u);
  EXPECT_EQ(loaded->queue_entries[0].first, 2u);
  EXPECT_EQ(loaded->next_queue_position, 3u);
  EXPECT_TRUE(loaded->paused);
  EXPECT_EQ(loaded->disputers.count("arbiter"), 1u);
  EXPECT_EQ(loaded->next_event_sequence, 17u);
}

// -----------------------------------------------------------------------------
// 4. Restart: a second engine on the same file continues where the first
//    stopped.
// Why: a crash between batches must not lose the queue or re-pay transfers.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStoreTest, EngineResumesAfterRestart) {
  settle::domain::SettlementId a = 0;
  settle::domain::SettlementId b = 0;
  {
    settle::JsonFileStore store(path_);
    settle::SettlementEngine engine(config_, clock_, bus_, nullptr, &store);
    a = engine.create("alice", {{"alice", "x", 10, false},
                                {"alice", "y", 20, false}});
    engine.deposit("alice", a, 30);
    engine.initiate("alice", a);
    engine.execute("alice", a, 1);

    b = engine.create("bob", {{"bob", "z", 5, false}});
    engine.deposit("bob", b, 5);
    engine.initiate("bob", b);
    engine.pause("admin");
  }

  settle::JsonFileStore store(path_);
  settle::SettlementEngine engine(config_, clock_, bus_, nullptr, &store);

  EXPECT_TRUE(engine.isPaused());
  EXPECT_EQ(engine.nextSettlementId(), 3u);
  EXPECT_EQ(engine.queueHead(), a);
  EXPECT_EQ(engine.queueLength(), 2u);
  EXPECT_EQ(engine.balanceOf("x"), 10u);
  EXPECT_EQ(engine.getSettlement(a).executed_transfers, 1u);
  EXPECT_TRUE(engine.checkInvariants().holds);

  std::vector<std::uint64_t> sequence_ids;
  bus_.subscribe([&sequence_ids](const settle::Event& e) {
    sequence_ids.push_back(
        std::visit([](const auto& ev) { return ev.sequence_id; }, e));
  });

  engine.unpause("admin");
  EXPECT_THROW(engine.execute("bob", b, 1), settle::QueueOrderError);
  engine.execute("alice", a, 1);
  engine.execute("bob", b, 1);

  EXPECT_EQ(engine.getSettlement(a).state, SettlementState::Finalized);
  EXPECT_EQ(engine.getSettlement(b).state, SettlementState::Finalized);
  EXPECT_EQ(engine.balanceOf("y"), 20u);
  EXPECT_EQ(engine.balanceOf("z"), 5u);

  // 8 notifications were committed before the restart.
  ASSERT_FALSE(sequence_ids.empty());
  EXPECT_EQ(sequence_ids.front(), 9u);
}

// -----------------------------------------------------------------------------
// 5. A failed save rolls the operation back: no state change, no event.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStoreTest, FailedCommitRollsBack) {
  FlakyStore store;
  settle::SettlementEngine engine(config_, clock_, bus_, nullptr, &store);
  int published = 0;
  bus_.subscribe([&published](const settle::Event&) { ++published; });

  auto id = engine.create("alice", {{"alice", "x", 10, false},
                                    {"alice", "y", 10, false}});
  engine.deposit("alice", id, 20);
  engine.initiate("alice", id);
  const int published_before = published;

  store.fail_next_save = true;
  EXPECT_THROW(engine.execute("alice", id, 1), settle::StorageError);

  auto s = engine.getSettlement(id);
  EXPECT_EQ(s.state, SettlementState::Initiated);
  EXPECT_EQ(s.executed_transfers, 0u);
  EXPECT_EQ(engine.balanceOf("x"), 0u);
  EXPECT_EQ(engine.getSettlementDetails(id).escrow_balance, 20u);
  EXPECT_EQ(published, published_before);
  EXPECT_TRUE(engine.checkInvariants().holds);

  store.fail_next_save = true;
  EXPECT_THROW(engine.create("bob", {{"bob", "q", 1, false}}),
               settle::StorageError);
  EXPECT_EQ(engine.nextSettlementId(), id + 1);

  EXPECT_EQ(engine.execute("alice", id, 2), 2u);
  EXPECT_EQ(engine.balanceOf("y"), 10u);
}

// -----------------------------------------------------------------------------
// 6. Notification JSON carries the type tag and the common trailer.
// -----------------------------------------------------------------------------
TEST_F(JsonFileStoreTest, EventJsonHasTypeAndTrailer) {
  settle::DepositReceivedEvent ev;
  ev.settlement_id = 3;
  ev.depositor = "alice";
  ev.amount = 7;
  ev.total_deposited = 7;
  ev.timestamp_ms = 42;
  ev.sequence_id = 9;

  nlohmann::json j = settle::eventToJson(settle::Event{ev});
  EXPECT_EQ(j.at("type"), "deposit_received");
  EXPECT_EQ(j.at("settlement_id"), 3);
  EXPECT_EQ(j.at("depositor"), "alice");
  EXPECT_EQ(j.at("timestamp_ms"), 42);
  EXPECT_EQ(j.at("sequence_id"), 9);
}
