#pragma once

#include "settle/domain/escrow_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace settle {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Builds an EscrowConfig from a JSON document.
//
// @details
// Every key is optional; a missing key keeps the EscrowConfig default.
// Recognised keys match the field names of EscrowConfig:
//
//   {
//     "admin": "0xAD",
//     "authorized_disputers": ["0xD1", "0xD2"],
//     "max_transfers_per_settlement": 100,
//     "default_timeout_ms": 3600000,
//     "max_timeout_ms": 2592000000,
//     "min_confidence_score": 70,
//     "max_price_staleness_ms": 60000,
//     "max_price_clock_skew_ms": 5000,
//     "max_twap_deviation_bps": 500,
//     "min_price": 1,
//     "max_price": 1000000000000000000,
//     "snapshot_path": "settlement_state.json",
//     "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//     "ipc_pub_endpoint": "tcp://127.0.0.1:5557",
//     "price_feed_endpoint": "tcp://127.0.0.1:5555"
//   }
//
// Errors: ValidationError for unreadable files, malformed JSON, wrongly
// typed values and inconsistent limits (e.g. default timeout above the max,
// min_price > max_price, empty admin).
// -----------------------------------------------------------------------------
domain::EscrowConfig loadConfig(const std::string& path);

domain::EscrowConfig configFromJson(const nlohmann::json& doc);

}  // namespace settle
