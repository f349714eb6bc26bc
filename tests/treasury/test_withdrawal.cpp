// MINTGATE - Multi-Approval Withdrawal Tests
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <gtest/gtest.h>
#include <mintgate/treasury/withdrawal.h>

#include <limits>
#include <stdexcept>

namespace mintgate {
namespace treasury {
namespace {

Address MakeAddress(Byte tag) {
    Address addr;
    addr[0] = tag;
    addr[19] = tag;
    return addr;
}

class WithdrawalTest : public ::testing::Test {
protected:
    WithdrawalTest() : treasury_(2) {}

    void SetUp() override {
        alice_ = MakeAddress(0xA1);
        bob_ = MakeAddress(0xB0);
        carol_ = MakeAddress(0xC0);
        recipient_ = MakeAddress(0xEE);
        ASSERT_TRUE(treasury_.Deposit(10 * UNIT).ok());
    }

    MultiApprovalTreasury treasury_;
    Address alice_;
    Address bob_;
    Address carol_;
    Address recipient_;
};

TEST(WithdrawalConstructTest, ZeroQuorumThrows) {
    EXPECT_THROW(MultiApprovalTreasury(0), std::invalid_argument);
    EXPECT_NO_THROW(MultiApprovalTreasury(1));
}

TEST_F(WithdrawalTest, SubmitAssignsSequentialIndices) {
    EXPECT_EQ(treasury_.Submit(recipient_, UNIT, {}), 0u);
    EXPECT_EQ(treasury_.Submit(recipient_, 2 * UNIT, {0xde, 0xad}), 1u);
    EXPECT_EQ(treasury_.Count(), 2u);

    const WithdrawalTransaction* tx = treasury_.Get(1);
    ASSERT_NE(tx, nullptr);
    EXPECT_EQ(tx->to, recipient_);
    EXPECT_EQ(tx->value, 2 * UNIT);
    EXPECT_EQ(tx->data.size(), 2u);
    EXPECT_FALSE(tx->executed);
    EXPECT_EQ(tx->ConfirmationCount(), 0u);
    EXPECT_EQ(treasury_.Get(2), nullptr);
}

TEST_F(WithdrawalTest, ConfirmAndRevoke) {
    uint64_t index = treasury_.Submit(recipient_, UNIT, {});

    EXPECT_TRUE(treasury_.Confirm(index, alice_).ok());
    EXPECT_TRUE(treasury_.Confirm(index, alice_).Is(CollectionError::AlreadyConfirmed));
    EXPECT_TRUE(treasury_.Get(index)->IsConfirmedBy(alice_));

    EXPECT_TRUE(treasury_.Revoke(index, bob_).Is(CollectionError::NotConfirmed));
    EXPECT_TRUE(treasury_.Revoke(index, alice_).ok());
    EXPECT_FALSE(treasury_.Get(index)->IsConfirmedBy(alice_));
    EXPECT_TRUE(treasury_.Revoke(index, alice_).Is(CollectionError::NotConfirmed));

    // Confirming again after a revoke is allowed
    EXPECT_TRUE(treasury_.Confirm(index, alice_).ok());
}

TEST_F(WithdrawalTest, UnknownIndex) {
    EXPECT_TRUE(treasury_.Confirm(0, alice_).Is(CollectionError::IndexOutOfRange));
    EXPECT_TRUE(treasury_.Revoke(0, alice_).Is(CollectionError::IndexOutOfRange));
    EXPECT_TRUE(treasury_.CheckExecutable(0).Is(CollectionError::IndexOutOfRange));
    EXPECT_TRUE(treasury_.MarkExecuted(0).Is(CollectionError::IndexOutOfRange));
}

TEST_F(WithdrawalTest, QuorumGatesExecution) {
    uint64_t index = treasury_.Submit(recipient_, 3 * UNIT, {});
    ASSERT_TRUE(treasury_.Confirm(index, alice_).ok());
    EXPECT_TRUE(treasury_.CheckExecutable(index).Is(CollectionError::QuorumNotMet));
    EXPECT_TRUE(treasury_.MarkExecuted(index).Is(CollectionError::QuorumNotMet));
    EXPECT_EQ(treasury_.GetBalance(), 10 * UNIT);

    ASSERT_TRUE(treasury_.Confirm(index, bob_).ok());
    EXPECT_TRUE(treasury_.CheckExecutable(index).ok());

    // Revoking drops it back below quorum
    ASSERT_TRUE(treasury_.Revoke(index, bob_).ok());
    EXPECT_TRUE(treasury_.CheckExecutable(index).Is(CollectionError::QuorumNotMet));

    ASSERT_TRUE(treasury_.Confirm(index, carol_).ok());
    EXPECT_TRUE(treasury_.MarkExecuted(index).ok());
    EXPECT_TRUE(treasury_.Get(index)->executed);
    EXPECT_EQ(treasury_.GetBalance(), 7 * UNIT);
}

TEST_F(WithdrawalTest, ExecutedIsTerminal) {
    uint64_t index = treasury_.Submit(recipient_, UNIT, {});
    ASSERT_TRUE(treasury_.Confirm(index, alice_).ok());
    ASSERT_TRUE(treasury_.Confirm(index, bob_).ok());
    ASSERT_TRUE(treasury_.MarkExecuted(index).ok());

    EXPECT_TRUE(treasury_.MarkExecuted(index).Is(CollectionError::AlreadyExecuted));
    EXPECT_TRUE(treasury_.Confirm(index, carol_).Is(CollectionError::AlreadyExecuted));
    EXPECT_TRUE(treasury_.Revoke(index, alice_).Is(CollectionError::AlreadyExecuted));
    EXPECT_EQ(treasury_.GetBalance(), 9 * UNIT);
    EXPECT_EQ(treasury_.Get(index)->ConfirmationCount(), 2u);
}

TEST_F(WithdrawalTest, InsufficientBalanceLeavesStateUnchanged) {
    uint64_t index = treasury_.Submit(recipient_, 11 * UNIT, {});
    ASSERT_TRUE(treasury_.Confirm(index, alice_).ok());
    ASSERT_TRUE(treasury_.Confirm(index, bob_).ok());

    EXPECT_TRUE(treasury_.MarkExecuted(index).Is(CollectionError::InsufficientBalance));
    EXPECT_FALSE(treasury_.Get(index)->executed);
    EXPECT_EQ(treasury_.GetBalance(), 10 * UNIT);

    // Becomes executable once funds arrive
    ASSERT_TRUE(treasury_.Deposit(UNIT).ok());
    EXPECT_TRUE(treasury_.MarkExecuted(index).ok());
    EXPECT_EQ(treasury_.GetBalance(), 0u);
}

TEST_F(WithdrawalTest, RollbackRestoresState) {
    uint64_t index = treasury_.Submit(recipient_, 4 * UNIT, {});
    ASSERT_TRUE(treasury_.Confirm(index, alice_).ok());
    ASSERT_TRUE(treasury_.Confirm(index, bob_).ok());
    ASSERT_TRUE(treasury_.MarkExecuted(index).ok());

    treasury_.RollbackExecution(index);
    EXPECT_FALSE(treasury_.Get(index)->executed);
    EXPECT_EQ(treasury_.GetBalance(), 10 * UNIT);

    // Rolling back a pending transaction does nothing
    treasury_.RollbackExecution(index);
    EXPECT_EQ(treasury_.GetBalance(), 10 * UNIT);
}

TEST_F(WithdrawalTest, ZeroValueWithdrawal) {
    uint64_t index = treasury_.Submit(recipient_, 0, {});
    ASSERT_TRUE(treasury_.Confirm(index, alice_).ok());
    ASSERT_TRUE(treasury_.Confirm(index, bob_).ok());
    EXPECT_TRUE(treasury_.MarkExecuted(index).ok());
    EXPECT_EQ(treasury_.GetBalance(), 10 * UNIT);
}

TEST_F(WithdrawalTest, DepositOverflow) {
    Amount max = std::numeric_limits<Amount>::max();
    EXPECT_FALSE(treasury_.CanDeposit(max));
    EXPECT_TRUE(treasury_.Deposit(max).Is(CollectionError::ArithmeticOverflow));
    EXPECT_EQ(treasury_.GetBalance(), 10 * UNIT);
}

TEST_F(WithdrawalTest, PendingList) {
    treasury_.Submit(recipient_, UNIT, {});
    uint64_t second = treasury_.Submit(recipient_, UNIT, {});
    treasury_.Submit(recipient_, UNIT, {});
    ASSERT_TRUE(treasury_.Confirm(second, alice_).ok());
    ASSERT_TRUE(treasury_.Confirm(second, bob_).ok());
    ASSERT_TRUE(treasury_.MarkExecuted(second).ok());

    auto pending = treasury_.GetPending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0], 0u);
    EXPECT_EQ(pending[1], 2u);
}

TEST_F(WithdrawalTest, TransactionToString) {
    uint64_t index = treasury_.Submit(recipient_, UNIT / 2, {0x01});
    std::string text = treasury_.Get(index)->ToString();
    EXPECT_NE(text.find("value=0.5"), std::string::npos);
    EXPECT_NE(text.find("data=0x01"), std::string::npos);
    EXPECT_NE(text.find("executed=false"), std::string::npos);
}

} // namespace
} // namespace treasury
} // namespace mintgate
