// MINTGATE - Multi-Approval Withdrawals
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Holds the collection's funds and the ledger of withdrawal transactions.
//
// Each transaction moves through:
//   Proposed -> Executable (confirmations >= quorum) -> Executed
// Executed is terminal. Revoking a confirmation can move an executable
// transaction back to proposed. Transactions are never removed; the index
// returned by Submit() identifies a transaction permanently.
//
// This class does not know about roles. The caller decides who may submit,
// confirm and execute.

#ifndef MINTGATE_TREASURY_WITHDRAWAL_H
#define MINTGATE_TREASURY_WITHDRAWAL_H

#include <mintgate/core/status.h>
#include <mintgate/core/types.h>

#include <set>
#include <string>
#include <vector>

namespace mintgate {
namespace treasury {

// ============================================================================
// Withdrawal Transaction
// ============================================================================

struct WithdrawalTransaction {
    /// Recipient of the funds
    Address to;

    /// Amount to transfer
    Amount value{0};

    /// Opaque payload handed to the transfer handler
    std::vector<Byte> data;

    /// Set once the transfer has gone through
    bool executed{false};

    /// Approvers that currently confirm this transaction
    std::set<Address> confirmations;

    size_t ConfirmationCount() const { return confirmations.size(); }

    bool IsConfirmedBy(const Address& approver) const {
        return confirmations.count(approver) > 0;
    }

    std::string ToString() const;
};

// ============================================================================
// Treasury
// ============================================================================

class MultiApprovalTreasury {
public:
    /// @throws std::invalid_argument if quorum is zero
    explicit MultiApprovalTreasury(size_t quorum);

    size_t GetQuorum() const { return quorum_; }

    // ========================================================================
    // Funds
    // ========================================================================

    Amount GetBalance() const { return balance_; }

    /// True if `amount` can be credited without overflowing
    bool CanDeposit(Amount amount) const;

    /// Credit incoming payment. ArithmeticOverflow leaves the balance unchanged.
    Status Deposit(Amount amount);

    // ========================================================================
    // Transactions
    // ========================================================================

    /// Append a new transaction with no confirmations, returning its index
    uint64_t Submit(const Address& to, Amount value, std::vector<Byte> data);

    /// IndexOutOfRange, AlreadyExecuted, AlreadyConfirmed
    Status Confirm(uint64_t index, const Address& approver);

    /// IndexOutOfRange, AlreadyExecuted, NotConfirmed
    Status Revoke(uint64_t index, const Address& approver);

    /// IndexOutOfRange, AlreadyExecuted, QuorumNotMet
    Status CheckExecutable(uint64_t index) const;

    /**
     * Mark the transaction executed and debit its value.
     *
     * Runs CheckExecutable(), then fails with InsufficientBalance if the
     * value exceeds the balance. The transfer itself is the caller's job;
     * if it fails, RollbackExecution() restores the previous state.
     */
    Status MarkExecuted(uint64_t index);

    /// Undo a MarkExecuted() whose transfer did not go through
    void RollbackExecution(uint64_t index);

    /// Transaction at `index`, or nullptr
    const WithdrawalTransaction* Get(uint64_t index) const;

    uint64_t Count() const { return transactions_.size(); }

    /// Indices of transactions that are not executed yet
    std::vector<uint64_t> GetPending() const;

private:
    Status CheckIndex(uint64_t index) const;

    size_t quorum_;
    Amount balance_{0};
    std::vector<WithdrawalTransaction> transactions_;
};

} // namespace treasury
} // namespace mintgate

#endif // MINTGATE_TREASURY_WITHDRAWAL_H
