#include "settle/domain/settlement.hpp"

namespace settle {
namespace domain {

const char* disputeOutcomeToString(DisputeOutcome outcome) {
  switch (outcome) {
    case DisputeOutcome::Resume:    return "RESUME";
    case DisputeOutcome::ForceFail: return "FORCE_FAIL";
  }
  return "UNKNOWN";
}

std::optional<DisputeOutcome> disputeOutcomeFromString(const std::string& name) {
  if (name == "RESUME") {
    return DisputeOutcome::Resume;
  }
  if (name == "FORCE_FAIL") {
    return DisputeOutcome::ForceFail;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace settle
