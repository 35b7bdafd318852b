// =============================================================================
// settlement_registry_test.cpp
// =============================================================================
// Unit tests for settle::SettlementRegistry: creation rules, id assignment,
// batch bounds and restore.
// =============================================================================

#include "settle/domain/errors.hpp"
#include "settle/registry/settlement_registry.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <vector>

using settle::domain::SettlementState;
using settle::domain::Transfer;

namespace {

constexpr std::int64_t kDefaultTimeout = 3'600'000;
constexpr std::int64_t kMaxTimeout = 30LL * 24 * 3'600'000;

std::vector<Transfer> transfers(std::size_t n, settle::domain::Amount each) {
  std::vector<Transfer> out;
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(Transfer{"payer", "payee" + std::to_string(i), each, false});
  }
  return out;
}

}  // namespace

class SettlementRegistryTest : public ::testing::Test {
 protected:
  settle::SettlementRegistry registry{100, kDefaultTimeout, kMaxTimeout};
};

TEST_F(SettlementRegistryTest, CreateAssignsIncreasingIdsFromOne) {
  EXPECT_EQ(registry.nextSettlementId(), 1u);
  auto a = registry.create("alice", transfers(2, 10), 0, 1000, false);
  auto b = registry.create("bob", transfers(1, 5), 0, 1000, false);
  EXPECT_EQ(a, 1u);
  EXPECT_EQ(b, 2u);
  EXPECT_EQ(registry.nextSettlementId(), 3u);
}

TEST_F(SettlementRegistryTest, CreateFillsDerivedFields) {
  auto input = transfers(3, 100);
  input[1].executed = true;  // ignored
  auto id = registry.create("alice", input, 5000, 1000, true);

  const auto& s = registry.get(id);
  EXPECT_EQ(s.initiator, "alice");
  EXPECT_EQ(s.total_amount, 300u);
  EXPECT_EQ(s.total_deposited, 0u);
  EXPECT_EQ(s.state, SettlementState::Pending);
  EXPECT_EQ(s.total_transfers, 3u);
  EXPECT_EQ(s.executed_transfers, 0u);
  EXPECT_EQ(s.created_at_ms, 1000);
  EXPECT_EQ(s.deadline_ms(), 6000);
  EXPECT_TRUE(s.requires_price);
  EXPECT_FALSE(s.queue_position.has_value());
  for (const auto& t : s.transfers) {
    EXPECT_FALSE(t.executed);
  }
}

TEST_F(SettlementRegistryTest, ZeroTimeoutUsesDefault) {
  auto id = registry.create("alice", transfers(1, 1), 0, 0, false);
  EXPECT_EQ(registry.get(id).timeout_ms, kDefaultTimeout);
}

TEST_F(SettlementRegistryTest, RejectsMalformedSettlements) {
  EXPECT_THROW(registry.create("alice", {}, 0, 0, false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("", transfers(1, 1), 0, 0, false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("alice", transfers(101, 1), 0, 0, false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("alice", transfers(1, 0), 0, 0, false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("alice", {Transfer{"", "b", 1, false}}, 0, 0,
                               false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("alice", {Transfer{"a", "", 1, false}}, 0, 0,
                               false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("alice", transfers(1, 1), -1, 0, false),
               settle::ValidationError);
  EXPECT_THROW(registry.create("alice", transfers(1, 1), kMaxTimeout + 1, 0,
                               false),
               settle::ValidationError);

  // Nothing was stored and no id was consumed.
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(registry.nextSettlementId(), 1u);
}

TEST_F(SettlementRegistryTest, MaxTransfersIsAccepted) {
  auto id = registry.create("alice", transfers(100, 1), 0, 0, false);
  EXPECT_EQ(registry.get(id).total_transfers, 100u);
}

TEST_F(SettlementRegistryTest, TotalOverflowIsRejected) {
  const auto max = std::numeric_limits<settle::domain::Amount>::max();
  std::vector<Transfer> huge{{"a", "b", max, false}, {"a", "c", 1, false}};
  EXPECT_THROW(registry.create("alice", huge, 0, 0, false),
               settle::ArithmeticOverflowError);
}

TEST_F(SettlementRegistryTest, UnknownIdIsNotFound) {
  EXPECT_THROW(registry.get(42), settle::NotFoundError);
  EXPECT_FALSE(registry.contains(42));
}

// -----------------------------------------------------------------------------
// Batches consume transfers in array order; 3 then 2 covers all five.
// -----------------------------------------------------------------------------
TEST_F(SettlementRegistryTest, MarkExecutedAdvancesInOrder) {
  auto id = registry.create("alice", transfers(5, 10), 0, 0, false);

  auto batch = registry.peekBatch(id, 3);
  ASSERT_EQ(batch.size(), 3u);
  EXPECT_EQ(batch[0].to, "payee0");

  EXPECT_EQ(registry.markExecuted(id, 3), 0u);
  EXPECT_EQ(registry.get(id).executed_transfers, 3u);
  EXPECT_TRUE(registry.get(id).transfers[2].executed);
  EXPECT_FALSE(registry.get(id).transfers[3].executed);

  EXPECT_EQ(registry.peekBatch(id, 2)[0].to, "payee3");
  EXPECT_EQ(registry.markExecuted(id, 2), 3u);
  EXPECT_EQ(registry.get(id).remaining_transfers(), 0u);
}

TEST_F(SettlementRegistryTest, MarkExecutedRejectsBadCounts) {
  auto id = registry.create("alice", transfers(2, 10), 0, 0, false);
  EXPECT_THROW(registry.markExecuted(id, 0), settle::InvalidBatchError);
  EXPECT_THROW(registry.markExecuted(id, 3), settle::InvalidBatchError);
  EXPECT_EQ(registry.get(id).executed_transfers, 0u);
}

TEST_F(SettlementRegistryTest, RestoreKeepsIdsUnique) {
  registry.create("alice", transfers(1, 1), 0, 0, false);
  std::vector<settle::domain::Settlement> saved;
  for (const auto& [id, s] : registry.settlements()) {
    saved.push_back(s);
  }

  settle::SettlementRegistry restored{100, kDefaultTimeout, kMaxTimeout};
  restored.restore(saved, registry.nextSettlementId());

  EXPECT_TRUE(restored.contains(1));
  EXPECT_EQ(restored.create("bob", transfers(1, 1), 0, 0, false), 2u);
}
