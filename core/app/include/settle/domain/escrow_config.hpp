#pragma once

#include "settle/domain/transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// EscrowConfig: engine-wide parameters
// -----------------------------------------------------------------------------
//
// @brief  Roles, limits, price-guard thresholds and process endpoints.
//
// @details
// Passed by value into SettlementEngine / EscrowService at construction and
// constant afterwards. The defaults are usable for tests and local runs;
// loadConfig() (settle/config/config_loader.hpp) overrides any subset of
// them from a JSON file.
//
// Roles:
//   admin                 may pause/unpause, resolve disputes, set manual
//                         prices and manage the disputer set.
//   authorized_disputers  initial set of identities (besides each
//                         settlement's initiator) allowed to dispute.
// -----------------------------------------------------------------------------
struct EscrowConfig {
  Address admin{"admin"};
  std::vector<Address> authorized_disputers;

  /// Upper bound on line items per settlement.
  std::size_t max_transfers_per_settlement{100};

  /// Timeout applied when create() is called without one (or with 0).
  std::int64_t default_timeout_ms{3'600'000};

  /// Largest timeout create() accepts.
  std::int64_t max_timeout_ms{30LL * 24 * 3'600'000};

  // --- Price guard thresholds (applied at initiate for price-denominated
  //     settlements) ----------------------------------------------------------
  int min_confidence_score{70};
  std::int64_t max_price_staleness_ms{60'000};
  /// How far ahead of the engine clock a price timestamp may be.
  std::int64_t max_price_clock_skew_ms{5'000};
  std::int64_t max_twap_deviation_bps{500};
  Price min_price{1};
  Price max_price{1'000'000'000'000'000'000};

  // --- Process wiring (daemon only) ------------------------------------------
  std::string snapshot_path{"settlement_state.json"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::string price_feed_endpoint{"tcp://127.0.0.1:5555"};
};

}  // namespace domain
}  // namespace settle
