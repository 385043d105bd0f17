#pragma once

#include "ILedgerStore.hpp"
#include "IPriceOracle.hpp"
#include "Clock.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace brokerage {

struct TradeRequest {
    std::string userId;
    std::string symbol;
    TransactionType type = TransactionType::Unknown;
    std::int64_t quantity = 0;
    std::optional<TimePoint> deadline;   // Проверяется до открытия сессии и перед коммитом
};

struct TradeReceipt {
    std::int64_t transactionId = 0;
    std::string symbol;
    TransactionType type = TransactionType::Unknown;
    std::int64_t quantity = 0;
    double price = 0.0;
    Cents totalAmount = 0;
    Cents newBalance = 0;
    TimePoint executedAt;
};

// ═══════════════════════════════════════════════════════════════════════════════
// TradeExecutionEngine - одна сделка BUY/SELL как атомарная единица
// ═══════════════════════════════════════════════════════════════════════════════
//
// Успех: ровно одно изменение баланса и одна запись в журнал.
// Ошибка: ни одного изменения. Повторов внутри нет.

class TradeExecutionEngine {
public:
    TradeExecutionEngine(
        std::shared_ptr<ILedgerStore> store,
        std::shared_ptr<IPriceOracle> oracle,
        std::shared_ptr<const IClock> clock = nullptr);

    LedgerResult<TradeReceipt> executeTrade(const TradeRequest& request);

    LedgerResult<TradeReceipt> executeTrade(
        std::string_view userId,
        std::string_view symbol,
        TransactionType type,
        std::int64_t quantity);

private:
    std::shared_ptr<ILedgerStore> store_;
    std::shared_ptr<IPriceOracle> oracle_;
    std::shared_ptr<const IClock> clock_;

    LedgerResult<double> fetchPrice(const std::string& symbol);
    bool deadlinePassed(const TradeRequest& request) const;
};

}  // namespace brokerage
