#pragma once

#include "settle/domain/escrow_account.hpp"
#include "settle/domain/settlement.hpp"
#include "settle/domain/transfer.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <utility>
#include <vector>

namespace settle {

// -----------------------------------------------------------------------------
// EngineSnapshot
// -----------------------------------------------------------------------------
//
// @brief  Complete durable state of a SettlementEngine.
//
// @details
// Everything needed to resume after a restart with identical behaviour:
//   - every Settlement with its transfers, including terminal ones
//   - the id counter (ids are never reused across restarts)
//   - ledger accounts and payout balances
//   - queue entries and the position counter
//   - pause flag and the runtime disputer set
//   - the notification sequence counter
//
// The engine also uses a snapshot in memory as its rollback point when a
// durable commit fails.
// -----------------------------------------------------------------------------
struct EngineSnapshot {
  std::vector<domain::Settlement> settlements;
  domain::SettlementId next_settlement_id{1};

  std::map<domain::SettlementId, domain::EscrowAccount> accounts;
  std::map<domain::Address, domain::Amount> balances;

  std::vector<std::pair<std::uint64_t, domain::SettlementId>> queue_entries;
  std::uint64_t next_queue_position{0};

  bool paused{false};
  std::set<domain::Address> disputers;

  std::uint64_t next_event_sequence{1};
};

}  // namespace settle
