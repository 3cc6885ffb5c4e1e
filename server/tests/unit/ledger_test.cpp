#include <atomic>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "wallet/ledger.hpp"

namespace {

TEST(LedgerTest, DebitSubtractsWhenBalanceSuffices) {
  wallet::Ledger ledger(1000, 0);
  auto result = ledger.Debit(150);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.snapshot.balance, 850);
  EXPECT_EQ(result.snapshot.bank, 0);
  EXPECT_EQ(ledger.Snapshot().balance, 850);
}

TEST(LedgerTest, DebitOfWholeBalanceLeavesZero) {
  wallet::Ledger ledger(1000, 0);
  auto result = ledger.Debit(1000);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.snapshot.balance, 0);
}

TEST(LedgerTest, DebitRejectsOverdraftWithoutChange) {
  wallet::Ledger ledger(1000, 25);
  auto result = ledger.Debit(1500);
  EXPECT_EQ(result.status, wallet::LedgerStatus::kInsufficientFunds);
  EXPECT_EQ(result.snapshot.balance, 1000);
  EXPECT_EQ(result.snapshot.bank, 25);
  auto snapshot = ledger.Snapshot();
  EXPECT_EQ(snapshot.balance, 1000);
  EXPECT_EQ(snapshot.bank, 25);
}

TEST(LedgerTest, TransferMovesFundsToBank) {
  wallet::Ledger ledger(1000, 0);
  auto result = ledger.Transfer(200);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.snapshot.balance, 800);
  EXPECT_EQ(result.snapshot.bank, 200);
}

TEST(LedgerTest, TransferRejectsOverdraftWithoutChange) {
  wallet::Ledger ledger(1000, 0);
  auto result = ledger.Transfer(1001);
  EXPECT_EQ(result.status, wallet::LedgerStatus::kInsufficientFunds);
  auto snapshot = ledger.Snapshot();
  EXPECT_EQ(snapshot.balance, 1000);
  EXPECT_EQ(snapshot.bank, 0);
}

TEST(LedgerTest, ZeroAmountIsAppliedAsNoop) {
  wallet::Ledger ledger(1000, 0);
  EXPECT_TRUE(ledger.Debit(0).ok());
  EXPECT_TRUE(ledger.Transfer(0).ok());
  auto snapshot = ledger.Snapshot();
  EXPECT_EQ(snapshot.balance, 1000);
  EXPECT_EQ(snapshot.bank, 0);
}

TEST(LedgerTest, NegativeAmountNeverIncreasesBalance) {
  wallet::Ledger ledger(1000, 0);
  EXPECT_EQ(ledger.Debit(-100).status, wallet::LedgerStatus::kInvalidAmount);
  EXPECT_EQ(ledger.Transfer(-100).status, wallet::LedgerStatus::kInvalidAmount);
  auto snapshot = ledger.Snapshot();
  EXPECT_EQ(snapshot.balance, 1000);
  EXPECT_EQ(snapshot.bank, 0);
}

TEST(LedgerTest, RejectsNegativeInitialCounters) {
  EXPECT_THROW(wallet::Ledger(-1, 0), std::invalid_argument);
  EXPECT_THROW(wallet::Ledger(0, -1), std::invalid_argument);
  EXPECT_THROW(wallet::Ledger(std::numeric_limits<std::int64_t>::max(), 1), std::invalid_argument);
}

TEST(LedgerConcurrencyTest, ConcurrentDebitsNeverOverspend) {
  wallet::Ledger ledger(1000, 0);
  std::atomic<bool> done{false};
  std::atomic<int> violations{0};

  // 잔액은 음수가 되지 않고, 차감만 있으므로 늘어나지도 않는다.
  std::thread observer([&]() {
    std::int64_t previous = 1000;
    while (!done.load()) {
      auto snapshot = ledger.Snapshot();
      if (snapshot.balance < 0 || snapshot.balance > previous || snapshot.bank != 0) {
        violations.fetch_add(1);
      }
      previous = snapshot.balance;
    }
  });

  std::atomic<int> applied{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 50; ++i) {
        if (ledger.Debit(7).ok()) {
          applied.fetch_add(1);
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  done = true;
  observer.join();

  EXPECT_EQ(violations.load(), 0);
  auto snapshot = ledger.Snapshot();
  EXPECT_GE(snapshot.balance, 0);
  EXPECT_LT(snapshot.balance, 7);
  EXPECT_EQ(snapshot.balance, 1000 - 7 * applied.load());
}

TEST(LedgerConcurrencyTest, TransfersConserveTotalForEveryObserver) {
  wallet::Ledger ledger(1000, 0);
  std::atomic<bool> done{false};
  std::atomic<int> violations{0};

  std::thread observer([&]() {
    while (!done.load()) {
      auto snapshot = ledger.Snapshot();
      if (snapshot.balance < 0 || snapshot.bank < 0 || snapshot.balance + snapshot.bank != 1000) {
        violations.fetch_add(1);
      }
    }
  });

  std::atomic<int> applied{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 200; ++i) {
        if (ledger.Transfer(1).ok()) {
          applied.fetch_add(1);
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  done = true;
  observer.join();

  EXPECT_EQ(violations.load(), 0);
  EXPECT_EQ(applied.load(), 1000);
  auto snapshot = ledger.Snapshot();
  EXPECT_EQ(snapshot.balance, 0);
  EXPECT_EQ(snapshot.bank, 1000);
}

TEST(LedgerConcurrencyTest, MixedDebitAndTransferStayConsistent) {
  wallet::Ledger ledger(1000, 0);
  std::atomic<int> debits{0};
  std::atomic<int> transfers{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 100; ++t) {
    threads.emplace_back([&, t]() {
      if (t % 2 == 0) {
        if (ledger.Debit(10).ok()) {
          debits.fetch_add(1);
        }
      } else if (ledger.Transfer(10).ok()) {
        transfers.fetch_add(1);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  auto snapshot = ledger.Snapshot();
  EXPECT_GE(snapshot.balance, 0);
  EXPECT_EQ(snapshot.bank, 10 * transfers.load());
  EXPECT_EQ(snapshot.balance, 1000 - 10 * (debits.load() + transfers.load()));
}

}  // namespace
