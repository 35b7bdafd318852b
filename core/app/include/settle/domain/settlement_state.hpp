#pragma once

#include <optional>
#include <string>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// SettlementState: settlement lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Every state a Settlement can occupy. Transitions are enforced by
//         SettlementEngine; nothing else writes Settlement::state.
//
// @details
//
//   Pending ──initiate──> Initiated ──execute──> Executing ──execute──> Finalized
//     │  │                  │   │                   │
//     │  │                  │   └──execute (whole batch)──────────────> Finalized
//     │  └──refund──┐       └──refund──┐            │
//     │             ▼                  ▼            │
//     │           Failed <──────────── Failed       │
//     │             ▲                               │
//     └──dispute──> Disputed <──dispute─────────────┘
//                    │   ▲
//                    │   └── (also from Initiated)
//                    ├── resolve(Resume)   -> state before the dispute
//                    └── resolve(ForceFail) -> Failed
//
// Terminal states: Finalized, Failed. A terminal record is kept for audit and
// never mutated again.
// -----------------------------------------------------------------------------
enum class SettlementState {
  Pending,    // Created, accepting deposits
  Initiated,  // Fully funded, holds a queue position
  Executing,  // At least one transfer batch executed
  Finalized,  // All transfers executed: terminal
  Disputed,   // Halted pending an admin resolution
  Failed,     // Refunded (timeout or forced): terminal
};

// Finalized or Failed.
bool isTerminal(SettlementState state);

// Initiated or Executing: the states in which a settlement competes for the
// queue head.
bool isQueued(SettlementState state);

// Upper-case wire name ("PENDING", "INITIATED", ...). Used by the JSON codec
// and log lines.
const char* settlementStateToString(SettlementState state);

// Inverse of settlementStateToString(). std::nullopt for an unknown name.
std::optional<SettlementState> settlementStateFromString(const std::string& name);

}  // namespace domain
}  // namespace settle
