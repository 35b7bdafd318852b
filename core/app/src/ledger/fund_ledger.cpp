#include "settle/ledger/fund_ledger.hpp"

#include "settle/domain/checked_amount.hpp"
#include "settle/domain/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace settle {

using domain::Address;
using domain::Amount;
using domain::Contribution;
using domain::EscrowAccount;
using domain::SettlementId;

namespace {

std::string accountName(SettlementId id) {
  return "escrow account " + std::to_string(id);
}

}  // namespace

// -----------------------------------------------------------------------------
// open()
// -----------------------------------------------------------------------------
void FundLedger::open(SettlementId id, Amount total_amount) {
  if (accounts_.count(id) != 0) {
    throw InvalidStateError(accountName(id) + " already exists");
  }
  EscrowAccount account;
  account.total_amount = total_amount;
  accounts_.emplace(id, std::move(account));
}

bool FundLedger::contains(SettlementId id) const {
  return accounts_.count(id) != 0;
}

// -----------------------------------------------------------------------------
// credit(): bounded deposit
// -----------------------------------------------------------------------------
Amount FundLedger::credit(SettlementId id, const Address& depositor,
                          Amount amount) {
  if (amount == 0) {
    throw ValidationError("Deposit amount must be positive");
  }
  if (depositor.empty()) {
    throw ValidationError("Depositor must not be empty");
  }

  EscrowAccount& acct = openAccount(id);
  Amount new_total = domain::checkedAdd(acct.deposited, amount, "deposit total");
  if (new_total > acct.total_amount) {
    throw OverfundedError("Deposit of " + std::to_string(amount) +
                          " would bring " + accountName(id) + " to " +
                          std::to_string(new_total) + " (limit " +
                          std::to_string(acct.total_amount) + ")");
  }

  auto it = std::find_if(
      acct.contributions.begin(), acct.contributions.end(),
      [&depositor](const Contribution& c) { return c.party == depositor; });
  if (it == acct.contributions.end()) {
    acct.contributions.push_back(Contribution{depositor, amount});
  } else {
    it->amount += amount;  // bounded by new_total
  }
  acct.deposited = new_total;
  return new_total;
}

// -----------------------------------------------------------------------------
// debit()
// -----------------------------------------------------------------------------
Amount FundLedger::debit(SettlementId id, Amount amount) {
  EscrowAccount& acct = openAccount(id);
  Amount balance =
      domain::checkedSub(acct.deposited, acct.released, "escrow balance");
  if (amount > balance) {
    throw InsufficientFundsError("Debit of " + std::to_string(amount) +
                                 " exceeds balance " + std::to_string(balance) +
                                 " of " + accountName(id));
  }
  acct.deposited -= amount;
  return balance - amount;
}

// -----------------------------------------------------------------------------
// checkRelease(): dry run of a batch of release() calls
// -----------------------------------------------------------------------------
void FundLedger::checkRelease(SettlementId id,
                              const std::vector<domain::Transfer>& payouts) const {
  const EscrowAccount& acct = account(id);
  if (acct.closed) {
    throw InvalidStateError(accountName(id) + " is closed");
  }

  Amount released = acct.released;
  std::map<Address, Amount> projected;
  for (const auto& payout : payouts) {
    released = domain::checkedAdd(released, payout.amount, "released total");
    if (released > acct.deposited) {
      throw InsufficientFundsError(
          "Releasing " + std::to_string(payout.amount) + " to " + payout.to +
          " exceeds the funds deposited in " + accountName(id));
    }

    auto it = projected.find(payout.to);
    if (it == projected.end()) {
      it = projected.emplace(payout.to, balanceOf(payout.to)).first;
    }
    it->second = domain::checkedAdd(it->second, payout.amount,
                                    "recipient balance");
  }
}

// -----------------------------------------------------------------------------
// release()
// -----------------------------------------------------------------------------
void FundLedger::release(SettlementId id, const Address& to, Amount amount) {
  checkRelease(id, {domain::Transfer{"", to, amount, false}});

  EscrowAccount& acct = openAccount(id);
  acct.released += amount;
  creditBalance(to, amount);
}

// -----------------------------------------------------------------------------
// refundAll(): unreleased remainder back to depositors, account closed
// -----------------------------------------------------------------------------
std::vector<Contribution> FundLedger::refundAll(SettlementId id) {
  EscrowAccount& acct = openAccount(id);

  // Attribute released funds to the earliest contributions first.
  std::vector<Contribution> refunds;
  Amount spent = acct.released;
  Amount total_refund = 0;
  for (const auto& c : acct.contributions) {
    Amount consumed = std::min(spent, c.amount);
    spent -= consumed;
    Amount remainder = c.amount - consumed;
    if (remainder > 0) {
      refunds.push_back(Contribution{c.party, remainder});
      total_refund += remainder;
    }
  }

  // Validate every balance credit before writing anything.
  std::map<Address, Amount> projected;
  for (const auto& r : refunds) {
    auto it = projected.find(r.party);
    if (it == projected.end()) {
      it = projected.emplace(r.party, balanceOf(r.party)).first;
    }
    it->second = domain::checkedAdd(it->second, r.amount, "depositor balance");
  }

  debit(id, total_refund);
  for (const auto& r : refunds) {
    creditBalance(r.party, r.amount);
  }
  acct.deposited = 0;
  acct.closed = true;
  return refunds;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
Amount FundLedger::deposited(SettlementId id) const {
  return account(id).deposited;
}

Amount FundLedger::released(SettlementId id) const {
  return account(id).released;
}

Amount FundLedger::escrowBalance(SettlementId id) const {
  const EscrowAccount& acct = account(id);
  if (acct.closed) {
    return 0;
  }
  return domain::checkedSub(acct.deposited, acct.released, "escrow balance");
}

const std::vector<Contribution>& FundLedger::contributions(
    SettlementId id) const {
  return account(id).contributions;
}

bool FundLedger::isDepositor(SettlementId id, const Address& address) const {
  const auto& list = account(id).contributions;
  return std::any_of(list.begin(), list.end(), [&address](const Contribution& c) {
    return c.party == address && c.amount > 0;
  });
}

const EscrowAccount& FundLedger::account(SettlementId id) const {
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    throw NotFoundError("No " + accountName(id));
  }
  return it->second;
}

Amount FundLedger::balanceOf(const Address& address) const {
  auto it = balances_.find(address);
  return it == balances_.end() ? 0 : it->second;
}

void FundLedger::restore(std::map<SettlementId, EscrowAccount> accounts,
                         std::map<Address, Amount> balances) {
  accounts_ = std::move(accounts);
  balances_ = std::move(balances);
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------

// Mutable access for an account that still accepts movement.
EscrowAccount& FundLedger::openAccount(SettlementId id) {
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    throw NotFoundError("No " + accountName(id));
  }
  if (it->second.closed) {
    throw InvalidStateError(accountName(id) + " is closed");
  }
  return it->second;
}

// Caller has already checked the addition.
void FundLedger::creditBalance(const Address& to, Amount amount) {
  balances_[to] += amount;
}

}  // namespace settle
