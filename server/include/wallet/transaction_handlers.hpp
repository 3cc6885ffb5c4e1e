/*
 * 설명: /pay, /save 요청 본문을 금액으로 해석해 원장 연산을 호출하고 텍스트 결과를 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transaction_handlers_test.cpp, server/tests/e2e/payment_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "wallet/handler.hpp"
#include "wallet/ledger.hpp"
#include "wallet/observability.hpp"

namespace wallet {

inline constexpr char kInvalidAmountMessage[] = "invalid amount";
inline constexpr char kLowBalanceMessage[] = "low balance";
inline constexpr char kLowBalanceForTransferMessage[] = "low balance for bank transfer";

// 부호를 허용하는 10진 정수. 다른 문자가 섞이거나 int64 범위를 넘으면 nullopt.
std::optional<std::int64_t> ParseAmount(std::string_view text);

// "current balance: X, current bank: Y"
std::string FormatBalances(const LedgerSnapshot& snapshot);

Handler MakePayHandler(std::shared_ptr<Ledger> ledger, std::shared_ptr<const Observability> observability);
Handler MakeSaveHandler(std::shared_ptr<Ledger> ledger, std::shared_ptr<const Observability> observability);

}  // namespace wallet
