#pragma once

#include "settle/domain/escrow_account.hpp"
#include "settle/domain/transfer.hpp"

#include <map>
#include <vector>

namespace settle {

// -----------------------------------------------------------------------------
// FundLedger
// -----------------------------------------------------------------------------
//
// @brief  Escrow accounting: one EscrowAccount per settlement plus the payout
//         balance of every address that has received funds.
//
// @details
// Funds enter an account through credit() (a deposit) and leave it in one of
// two ways:
//   - release()    pays a single executed transfer to its recipient.
//   - refundAll()  returns the unreleased remainder to the depositors.
// Both land in balances_, which is what balanceOf() reports. The ledger never
// moves funds between settlements.
//
// Every mutating method validates completely before it writes, so a throw
// leaves the ledger untouched. checkRelease() exposes the validation part of
// a batch release so SettlementEngine can reject a whole execute() batch
// before paying the first transfer.
//
// Thread model:
//   Not internally synchronized. Owned by SettlementEngine and only touched
//   under the engine mutex.
// -----------------------------------------------------------------------------
class FundLedger {
 public:
  FundLedger() = default;

  // -------------------------------------------------------------------------
  // open(id, total_amount)
  // -------------------------------------------------------------------------
  // Creates the escrow account for a new settlement. total_amount caps the
  // sum of deposits. InvalidStateError if the account already exists.
  // -------------------------------------------------------------------------
  void open(domain::SettlementId id, domain::Amount total_amount);

  bool contains(domain::SettlementId id) const;

  // -------------------------------------------------------------------------
  // credit(id, depositor, amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Records a deposit and returns the new deposited total.
  //
  // @throws ValidationError          amount == 0 or empty depositor.
  // @throws OverfundedError          deposited + amount > total_amount.
  // @throws ArithmeticOverflowError  deposited + amount wraps.
  // @throws InvalidStateError        account closed by a refund.
  //
  // @details
  // The depositor's contribution is accumulated; a first-time depositor is
  // appended, so contributions stay in first-deposit order.
  // -------------------------------------------------------------------------
  domain::Amount credit(domain::SettlementId id,
                        const domain::Address& depositor,
                        domain::Amount amount);

  // -------------------------------------------------------------------------
  // debit(id, amount)
  // -------------------------------------------------------------------------
  // Removes `amount` of unreleased funds from the account and returns the
  // remaining escrow balance. InsufficientFundsError if amount exceeds
  // deposited - released. The funds are not credited anywhere; callers that
  // hand them to someone (refundAll) do so themselves.
  // -------------------------------------------------------------------------
  domain::Amount debit(domain::SettlementId id, domain::Amount amount);

  // -------------------------------------------------------------------------
  // checkRelease(id, payouts)
  // -------------------------------------------------------------------------
  // Validates that every payout in `payouts` could be released in order:
  // the summed amount fits in the escrow balance and no recipient balance
  // would overflow. Throws exactly what release() would throw for the first
  // offending payout. Writes nothing.
  // -------------------------------------------------------------------------
  void checkRelease(domain::SettlementId id,
                    const std::vector<domain::Transfer>& payouts) const;

  // -------------------------------------------------------------------------
  // release(id, to, amount)
  // -------------------------------------------------------------------------
  // Pays `amount` out of escrow into the payout balance of `to`.
  // InsufficientFundsError if released + amount > deposited.
  // -------------------------------------------------------------------------
  void release(domain::SettlementId id, const domain::Address& to,
               domain::Amount amount);

  // -------------------------------------------------------------------------
  // refundAll(id)
  // -------------------------------------------------------------------------
  //
  // @brief  Returns every depositor's unreleased contribution and closes the
  //         account.
  //
  // @return One entry per depositor that received something, in deposit
  //         order. Empty if nothing was left in escrow.
  //
  // @details
  // Funds already released to transfer recipients are attributed to the
  // contributions in deposit order: the earliest depositors' funds are
  // considered spent first. What remains of each contribution is debited
  // from escrow and credited to the depositor's payout balance. Afterwards
  // deposited == 0 and the account is closed.
  // -------------------------------------------------------------------------
  std::vector<domain::Contribution> refundAll(domain::SettlementId id);

  // --- Queries ---------------------------------------------------------------
  domain::Amount deposited(domain::SettlementId id) const;
  domain::Amount released(domain::SettlementId id) const;
  domain::Amount escrowBalance(domain::SettlementId id) const;
  const std::vector<domain::Contribution>& contributions(
      domain::SettlementId id) const;
  bool isDepositor(domain::SettlementId id,
                   const domain::Address& address) const;
  const domain::EscrowAccount& account(domain::SettlementId id) const;

  // Payout balance of `address`; 0 for an address never paid.
  domain::Amount balanceOf(const domain::Address& address) const;

  // --- Persistence -----------------------------------------------------------
  const std::map<domain::SettlementId, domain::EscrowAccount>& accounts() const {
    return accounts_;
  }
  const std::map<domain::Address, domain::Amount>& balances() const {
    return balances_;
  }
  void restore(std::map<domain::SettlementId, domain::EscrowAccount> accounts,
               std::map<domain::Address, domain::Amount> balances);

 private:
  domain::EscrowAccount& openAccount(domain::SettlementId id);
  void creditBalance(const domain::Address& to, domain::Amount amount);

  std::map<domain::SettlementId, domain::EscrowAccount> accounts_;
  std::map<domain::Address, domain::Amount> balances_;
};

}  // namespace settle
