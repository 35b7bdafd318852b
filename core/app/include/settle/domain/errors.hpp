#pragma once

#include <stdexcept>
#include <string>

namespace settle {

// -----------------------------------------------------------------------------
// ErrorCode
// -----------------------------------------------------------------------------
// Stable identifier for every failure the settlement core reports. The name
// returned by errorCodeName() is what the IPC layer sends back in the
// "error" field of a failed command.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  NotFound,            // Unknown settlement id
  Unauthorized,        // Caller lacks the role the transition requires
  NotFullyFunded,      // initiate() before deposits reach total_amount
  Overfunded,          // Deposit would exceed total_amount
  InsufficientFunds,   // Release/debit larger than the escrow balance
  InvalidBatch,        // Bad execute() count
  QueueOrder,          // execute() on a settlement that is not the queue head
  AlreadyTerminal,     // Mutation of a Finalized/Failed settlement
  PriceGuard,          // Price unavailable, insecure, stale or out of bounds
  TimeoutNotReached,   // refund() before the deadline
  InvalidState,        // Transition not allowed from the current state
  Validation,          // Malformed input (empty batch, zero amount, ...)
  Paused,              // Mutation attempted while the admin pause is active
  ArithmeticOverflow,  // Checked add/sub would wrap
  Storage,             // Durable commit failed; state rolled back
};

const char* errorCodeName(ErrorCode code);

// -----------------------------------------------------------------------------
// SettlementError: base of the exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Every error surfaced by the core derives from SettlementError.
//
// @details
// Operations are all-or-nothing: when one of these is thrown out of a
// SettlementEngine call, no settlement, ledger or queue field has changed.
// Callers may catch a concrete subclass, or catch SettlementError and switch
// on code().
// -----------------------------------------------------------------------------
class SettlementError : public std::runtime_error {
 public:
  SettlementError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class NotFoundError : public SettlementError {
 public:
  explicit NotFoundError(const std::string& message)
      : SettlementError(ErrorCode::NotFound, message) {}
};

class UnauthorizedError : public SettlementError {
 public:
  explicit UnauthorizedError(const std::string& message)
      : SettlementError(ErrorCode::Unauthorized, message) {}
};

class NotFullyFundedError : public SettlementError {
 public:
  explicit NotFullyFundedError(const std::string& message)
      : SettlementError(ErrorCode::NotFullyFunded, message) {}
};

class OverfundedError : public SettlementError {
 public:
  explicit OverfundedError(const std::string& message)
      : SettlementError(ErrorCode::Overfunded, message) {}
};

class InsufficientFundsError : public SettlementError {
 public:
  explicit InsufficientFundsError(const std::string& message)
      : SettlementError(ErrorCode::InsufficientFunds, message) {}
};

class InvalidBatchError : public SettlementError {
 public:
  explicit InvalidBatchError(const std::string& message)
      : SettlementError(ErrorCode::InvalidBatch, message) {}
};

class QueueOrderError : public SettlementError {
 public:
  explicit QueueOrderError(const std::string& message)
      : SettlementError(ErrorCode::QueueOrder, message) {}
};

class AlreadyTerminalError : public SettlementError {
 public:
  explicit AlreadyTerminalError(const std::string& message)
      : SettlementError(ErrorCode::AlreadyTerminal, message) {}
};

class PriceGuardError : public SettlementError {
 public:
  explicit PriceGuardError(const std::string& message)
      : SettlementError(ErrorCode::PriceGuard, message) {}
};

class TimeoutNotReachedError : public SettlementError {
 public:
  explicit TimeoutNotReachedError(const std::string& message)
      : SettlementError(ErrorCode::TimeoutNotReached, message) {}
};

class InvalidStateError : public SettlementError {
 public:
  explicit InvalidStateError(const std::string& message)
      : SettlementError(ErrorCode::InvalidState, message) {}
};

class ValidationError : public SettlementError {
 public:
  explicit ValidationError(const std::string& message)
      : SettlementError(ErrorCode::Validation, message) {}
};

class PausedError : public SettlementError {
 public:
  explicit PausedError(const std::string& message)
      : SettlementError(ErrorCode::Paused, message) {}
};

class ArithmeticOverflowError : public SettlementError {
 public:
  explicit ArithmeticOverflowError(const std::string& message)
      : SettlementError(ErrorCode::ArithmeticOverflow, message) {}
};

class StorageError : public SettlementError {
 public:
  explicit StorageError(const std::string& message)
      : SettlementError(ErrorCode::Storage, message) {}
};

}  // namespace settle
