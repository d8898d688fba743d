#include <gtest/gtest.h>
#include <limits>
#include "validator.hpp"

using ledger::Amount;
using ledger::EntryKind;
using ledger::ErrorKind;
using ledger::Validator;

TEST(ValidatorTest, AcceptsPositiveDeposit) {
    EXPECT_FALSE(Validator::validate(EntryKind::Deposit, 100, 0).has_value());
}

TEST(ValidatorTest, RejectsZeroAndNegativeAmounts) {
    for (Amount amount : {Amount{0}, Amount{-5}, std::numeric_limits<Amount>::min()}) {
        for (auto kind : {EntryKind::Deposit, EntryKind::Withdrawal}) {
            auto error = Validator::validate(kind, amount, 1000);
            ASSERT_TRUE(error.has_value()) << "amount " << amount;
            EXPECT_EQ(error->kind, ErrorKind::InvalidAmount);
            EXPECT_EQ(error->requested, amount);
        }
    }
}

TEST(ValidatorTest, WithdrawalBeyondBalanceIsInsufficientFunds) {
    auto error = Validator::validate(EntryKind::Withdrawal, 150, 100);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InsufficientFunds);
    EXPECT_EQ(error->requested, 150);
    EXPECT_EQ(error->available, 100);
}

TEST(ValidatorTest, WithdrawalOfExactBalanceIsAllowed) {
    EXPECT_FALSE(Validator::validate(EntryKind::Withdrawal, 100, 100).has_value());
}

TEST(ValidatorTest, WithdrawalFromEmptyWallet) {
    auto error = Validator::validate(EntryKind::Withdrawal, 1, 0);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InsufficientFunds);
}

TEST(ValidatorTest, DepositThatWouldOverflowIsInvalidAmount) {
    const Amount max = std::numeric_limits<Amount>::max();

    EXPECT_FALSE(Validator::validate(EntryKind::Deposit, 1, max - 1).has_value());

    auto error = Validator::validate(EntryKind::Deposit, 2, max - 1);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InvalidAmount);

    error = Validator::validate(EntryKind::Deposit, max, max);
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::InvalidAmount);
}

TEST(ValidatorTest, SameInputsSameVerdict) {
    auto first = Validator::validate(EntryKind::Withdrawal, 75, 50);
    auto second = Validator::validate(EntryKind::Withdrawal, 75, 50);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(ValidatorTest, ErrorMessages) {
    ledger::LedgerError invalid{ErrorKind::InvalidAmount, -100, 0};
    EXPECT_EQ(invalid.message(), "Invalid transaction amount: -100");

    ledger::LedgerError insufficient{ErrorKind::InsufficientFunds, 100, 50};
    EXPECT_EQ(insufficient.message(), "Insufficient funds for withdrawal of 100. Available balance: 50");

    EXPECT_STREQ(ledger::to_string(ErrorKind::InvalidAmount), "InvalidAmount");
    EXPECT_STREQ(ledger::to_string(ErrorKind::InsufficientFunds), "InsufficientFunds");
}
