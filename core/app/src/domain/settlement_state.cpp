#include "settle/domain/settlement_state.hpp"

namespace settle {
namespace domain {

bool isTerminal(SettlementState state) {
  return state == SettlementState::Finalized ||
         state == SettlementState::Failed;
}

bool isQueued(SettlementState state) {
  return state == SettlementState::Initiated ||
         state == SettlementState::Executing;
}

const char* settlementStateToString(SettlementState state) {
  using S = SettlementState;
  switch (state) {
    case S::Pending:   return "PENDING";
    case S::Initiated: return "INITIATED";
    case S::Executing: return "EXECUTING";
    case S::Finalized: return "FINALIZED";
    case S::Disputed:  return "DISPUTED";
    case S::Failed:    return "FAILED";
  }
  return "UNKNOWN";
}

std::optional<SettlementState> settlementStateFromString(
    const std::string& name) {
  using S = SettlementState;
  for (S s : {S::Pending, S::Initiated, S::Executing, S::Finalized,
              S::Disputed, S::Failed}) {
    if (name == settlementStateToString(s)) {
      return s;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace settle
