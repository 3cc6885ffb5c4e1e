/*
 * 설명: 잔액(balance)과 저축(bank) 카운터를 하나의 락으로 보호하며 차감/이체를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ledger_test.cpp
 */
#pragma once

#include <cstdint>
#include <mutex>

namespace wallet {

enum class LedgerStatus { kApplied, kInsufficientFunds, kInvalidAmount };

struct LedgerSnapshot {
  std::int64_t balance{0};
  std::int64_t bank{0};
};

// 실패 시 snapshot은 변경되지 않은 현재 값이다.
struct LedgerResult {
  LedgerStatus status{LedgerStatus::kApplied};
  LedgerSnapshot snapshot;

  bool ok() const { return status == LedgerStatus::kApplied; }
};

class Ledger {
 public:
  // 음수 초기값이나 합계 오버플로는 std::invalid_argument.
  Ledger(std::int64_t balance, std::int64_t bank);

  LedgerResult Debit(std::int64_t amount);
  LedgerResult Transfer(std::int64_t amount);
  LedgerSnapshot Snapshot() const;

 private:
  mutable std::mutex mutex_;
  std::int64_t balance_;
  std::int64_t bank_;
};

}  // namespace wallet
