#pragma once

#include "settle/domain/escrow_account.hpp"
#include "settle/domain/secured_price.hpp"
#include "settle/domain/settlement.hpp"
#include "settle/domain/transfer.hpp"
#include "settle/events/event.hpp"
#include "settle/persistence/engine_snapshot.hpp"

#include <nlohmann/json.hpp>

namespace settle {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json conversions shared by JsonFileStore (snapshots),
//         EscrowService (command responses) and IpcServer (telemetry).
//
// @details
// The to_json/from_json pairs live in the namespace of the type they convert
// so nlohmann's ADL hooks pick them up: `nlohmann::json j = settlement;` and
// `j.get<domain::Settlement>()` both work.
//
// Conventions:
//   - States and outcomes are written as their upper-case names.
//   - Absent optionals are written as null and read back as std::nullopt.
//   - from_json throws nlohmann::json::exception on a missing key or a type
//     mismatch, and ValidationError on an unknown state name.
// -----------------------------------------------------------------------------

namespace domain {

void to_json(nlohmann::json& j, const Transfer& t);
void from_json(const nlohmann::json& j, Transfer& t);

void to_json(nlohmann::json& j, const Contribution& c);
void from_json(const nlohmann::json& j, Contribution& c);

void to_json(nlohmann::json& j, const Settlement& s);
void from_json(const nlohmann::json& j, Settlement& s);

void to_json(nlohmann::json& j, const EscrowAccount& a);
void from_json(const nlohmann::json& j, EscrowAccount& a);

void to_json(nlohmann::json& j, const SecuredPrice& p);

}  // namespace domain

void to_json(nlohmann::json& j, const EngineSnapshot& s);
void from_json(const nlohmann::json& j, EngineSnapshot& s);

// -----------------------------------------------------------------------------
// eventToJson(event)
// -----------------------------------------------------------------------------
// Flat JSON object for a notification. The "type" field names the event
// ("settlement_created", "transfers_executed", ...); the remaining fields
// mirror the event struct.
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event);

}  // namespace settle
