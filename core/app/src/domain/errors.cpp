#include "settle/domain/errors.hpp"

namespace settle {

const char* errorCodeName(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::NotFound:           return "NotFoundError";
    case E::Unauthorized:       return "UnauthorizedError";
    case E::NotFullyFunded:     return "NotFullyFundedError";
    case E::Overfunded:         return "OverfundedError";
    case E::InsufficientFunds:  return "InsufficientFundsError";
    case E::InvalidBatch:       return "InvalidBatchError";
    case E::QueueOrder:         return "QueueOrderError";
    case E::AlreadyTerminal:    return "AlreadyTerminalError";
    case E::PriceGuard:         return "PriceGuardError";
    case E::TimeoutNotReached:  return "TimeoutNotReachedError";
    case E::InvalidState:       return "InvalidStateError";
    case E::Validation:         return "ValidationError";
    case E::Paused:             return "PausedError";
    case E::ArithmeticOverflow: return "ArithmeticOverflowError";
    case E::Storage:            return "StorageError";
  }
  return "UnknownError";
}

}  // namespace settle
