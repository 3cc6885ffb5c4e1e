/*
 * 설명: 잔액 확인과 갱신을 같은 임계 구역에서 수행해 이중 지출과 음수 잔액을 막는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ledger_test.cpp, server/tests/unit/transaction_handlers_test.cpp
 */
#include "wallet/ledger.hpp"

#include <limits>
#include <stdexcept>

namespace wallet {

Ledger::Ledger(std::int64_t balance, std::int64_t bank) : balance_(balance), bank_(bank) {
  if (balance < 0 || bank < 0) {
    throw std::invalid_argument("ledger counters must be non-negative");
  }
  if (bank > std::numeric_limits<std::int64_t>::max() - balance) {
    throw std::invalid_argument("ledger total overflows int64");
  }
}

LedgerResult Ledger::Debit(std::int64_t amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (amount < 0) {
    return LedgerResult{LedgerStatus::kInvalidAmount, {balance_, bank_}};
  }
  if (balance_ < amount) {
    return LedgerResult{LedgerStatus::kInsufficientFunds, {balance_, bank_}};
  }
  balance_ -= amount;
  return LedgerResult{LedgerStatus::kApplied, {balance_, bank_}};
}

LedgerResult Ledger::Transfer(std::int64_t amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (amount < 0) {
    return LedgerResult{LedgerStatus::kInvalidAmount, {balance_, bank_}};
  }
  if (balance_ < amount) {
    return LedgerResult{LedgerStatus::kInsufficientFunds, {balance_, bank_}};
  }
  // balance + bank 합계는 보존되므로 bank 덧셈은 넘치지 않는다.
  balance_ -= amount;
  bank_ += amount;
  return LedgerResult{LedgerStatus::kApplied, {balance_, bank_}};
}

LedgerSnapshot Ledger::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return LedgerSnapshot{balance_, bank_};
}

}  // namespace wallet
