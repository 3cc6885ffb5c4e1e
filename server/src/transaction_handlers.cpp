/*
 * 설명: 결제(차감)와 저축(이체) 핸들러를 구현한다. 업무 결과는 항상 200 + 본문 텍스트로 알린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/transaction_handlers_test.cpp, server/tests/e2e/payment_flow_test.cpp
 */
#include "wallet/transaction_handlers.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

#include "wallet/request_id.hpp"

namespace wallet {
namespace {

struct TransactionKind {
  const char* name;
  LedgerResult (Ledger::*apply)(std::int64_t);
  const char* low_balance_message;
};

constexpr TransactionKind kPay{"pay", &Ledger::Debit, kLowBalanceMessage};
constexpr TransactionKind kSave{"save", &Ledger::Transfer, kLowBalanceForTransferMessage};

void WriteText(ResponseWriter& w, std::string_view text) {
  w.SetHeader("Content-Type", "text/plain; charset=utf-8");
  w.WriteHeader(200);
  w.Write(text);
}

void RunTransaction(const TransactionKind& kind, Ledger& ledger, const Observability* observability,
                    ResponseWriter& w, const Request& r) {
  const auto request_id = GetRequestId(r.context);
  auto emit = [&](LogLevel level, const std::string& event, nlohmann::json fields) {
    if (observability) {
      observability->Log(LogContext{level, request_id, event, std::move(fields)});
    }
  };

  auto amount = ParseAmount(r.Body());
  if (!amount) {
    emit(LogLevel::kInfo, "amount.invalid", {{"op", kind.name}, {"reason", "parse error"}});
    return WriteText(w, kInvalidAmountMessage);
  }
  if (*amount < 0) {
    emit(LogLevel::kInfo, "amount.invalid", {{"op", kind.name}, {"reason", "negative amount"}, {"amount", *amount}});
    return WriteText(w, kInvalidAmountMessage);
  }

  auto result = (ledger.*kind.apply)(*amount);
  switch (result.status) {
    case LedgerStatus::kApplied:
      emit(LogLevel::kInfo, std::string(kind.name) + ".success",
          {{"amount", *amount}, {"balance", result.snapshot.balance}, {"bank", result.snapshot.bank}});
      return WriteText(w, FormatBalances(result.snapshot));
    case LedgerStatus::kInsufficientFunds:
      emit(LogLevel::kInfo, std::string(kind.name) + ".low_balance",
          {{"amount", *amount}, {"balance", result.snapshot.balance}});
      return WriteText(w, kind.low_balance_message);
    case LedgerStatus::kInvalidAmount:
      break;
  }
  emit(LogLevel::kInfo, "amount.invalid", {{"op", kind.name}, {"reason", "rejected by ledger"}, {"amount", *amount}});
  WriteText(w, kInvalidAmountMessage);
}

Handler MakeTransactionHandler(const TransactionKind& kind, std::shared_ptr<Ledger> ledger,
                               std::shared_ptr<const Observability> observability) {
  return [kind = &kind, ledger = std::move(ledger), observability = std::move(observability)](ResponseWriter& w,
                                                                                               const Request& r) {
    RunTransaction(*kind, *ledger, observability.get(), w, r);
  };
}

}  // namespace

std::optional<std::int64_t> ParseAmount(std::string_view text) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
      return std::nullopt;
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value, 10);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::string FormatBalances(const LedgerSnapshot& snapshot) {
  std::ostringstream oss;
  oss << "current balance: " << snapshot.balance << ", current bank: " << snapshot.bank;
  return oss.str();
}

Handler MakePayHandler(std::shared_ptr<Ledger> ledger, std::shared_ptr<const Observability> observability) {
  return MakeTransactionHandler(kPay, std::move(ledger), std::move(observability));
}

Handler MakeSaveHandler(std::shared_ptr<Ledger> ledger, std::shared_ptr<const Observability> observability) {
  return MakeTransactionHandler(kSave, std::move(ledger), std::move(observability));
}

}  // namespace wallet
