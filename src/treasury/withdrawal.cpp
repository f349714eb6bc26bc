// MINTGATE - Multi-Approval Withdrawals Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/treasury/withdrawal.h>

#include <mintgate/core/hex.h>

#include <sstream>
#include <stdexcept>

namespace mintgate {
namespace treasury {

// ============================================================================
// WithdrawalTransaction
// ============================================================================

std::string WithdrawalTransaction::ToString() const {
    std::ostringstream oss;
    oss << "WithdrawalTransaction("
        << "to=" << to.ToString()
        << ", value=" << FormatAmount(value)
        << ", data=0x" << BytesToHex(data)
        << ", confirmations=" << confirmations.size()
        << ", executed=" << (executed ? "true" : "false")
        << ")";
    return oss.str();
}

// ============================================================================
// MultiApprovalTreasury
// ============================================================================

MultiApprovalTreasury::MultiApprovalTreasury(size_t quorum) : quorum_(quorum) {
    if (quorum_ == 0) {
        throw std::invalid_argument("withdrawal quorum must be at least 1");
    }
}

bool MultiApprovalTreasury::CanDeposit(Amount amount) const {
    return CheckedAdd(balance_, amount).has_value();
}

Status MultiApprovalTreasury::Deposit(Amount amount) {
    auto sum = CheckedAdd(balance_, amount);
    if (!sum) {
        return Status::Error(CollectionError::ArithmeticOverflow, "balance overflow");
    }
    balance_ = *sum;
    return Status::Ok();
}

uint64_t MultiApprovalTreasury::Submit(const Address& to, Amount value,
                                       std::vector<Byte> data) {
    WithdrawalTransaction tx;
    tx.to = to;
    tx.value = value;
    tx.data = std::move(data);
    transactions_.push_back(std::move(tx));
    return transactions_.size() - 1;
}

Status MultiApprovalTreasury::CheckIndex(uint64_t index) const {
    if (index >= transactions_.size()) {
        return Status::Error(CollectionError::IndexOutOfRange,
                             "no transaction " + std::to_string(index));
    }
    if (transactions_[index].executed) {
        return Status::Error(CollectionError::AlreadyExecuted,
                             "transaction " + std::to_string(index) + " already executed");
    }
    return Status::Ok();
}

Status MultiApprovalTreasury::Confirm(uint64_t index, const Address& approver) {
    Status status = CheckIndex(index);
    if (!status.ok()) {
        return status;
    }
    if (!transactions_[index].confirmations.insert(approver).second) {
        return Status::Error(CollectionError::AlreadyConfirmed,
                             approver.ToString() + " already confirmed");
    }
    return Status::Ok();
}

Status MultiApprovalTreasury::Revoke(uint64_t index, const Address& approver) {
    Status status = CheckIndex(index);
    if (!status.ok()) {
        return status;
    }
    if (transactions_[index].confirmations.erase(approver) == 0) {
        return Status::Error(CollectionError::NotConfirmed,
                             approver.ToString() + " has not confirmed");
    }
    return Status::Ok();
}

Status MultiApprovalTreasury::CheckExecutable(uint64_t index) const {
    Status status = CheckIndex(index);
    if (!status.ok()) {
        return status;
    }
    const auto& tx = transactions_[index];
    if (tx.confirmations.size() < quorum_) {
        return Status::Error(CollectionError::QuorumNotMet,
                             std::to_string(tx.confirmations.size()) + " of " +
                             std::to_string(quorum_) + " confirmations");
    }
    return Status::Ok();
}

Status MultiApprovalTreasury::MarkExecuted(uint64_t index) {
    Status status = CheckExecutable(index);
    if (!status.ok()) {
        return status;
    }
    auto& tx = transactions_[index];
    if (tx.value > balance_) {
        return Status::Error(CollectionError::InsufficientBalance,
                             "balance " + FormatAmount(balance_) + ", requested " +
                             FormatAmount(tx.value));
    }
    tx.executed = true;
    balance_ -= tx.value;
    return Status::Ok();
}

void MultiApprovalTreasury::RollbackExecution(uint64_t index) {
    if (index >= transactions_.size() || !transactions_[index].executed) {
        return;
    }
    auto& tx = transactions_[index];
    tx.executed = false;
    balance_ += tx.value;
}

const WithdrawalTransaction* MultiApprovalTreasury::Get(uint64_t index) const {
    if (index >= transactions_.size()) {
        return nullptr;
    }
    return &transactions_[index];
}

std::vector<uint64_t> MultiApprovalTreasury::GetPending() const {
    std::vector<uint64_t> pending;
    for (uint64_t i = 0; i < transactions_.size(); ++i) {
        if (!transactions_[i].executed) {
            pending.push_back(i);
        }
    }
    return pending;
}

} // namespace treasury
} // namespace mintgate
