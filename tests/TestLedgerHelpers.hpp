#pragma once

#include "LedgerTypes.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace brokerage::test {

// 2024-01-01T00:00:00Z + days/hours
inline TimePoint at(int days, int hours = 12) {
    using namespace std::chrono;
    return sys_days{year{2024} / January / 1} + std::chrono::days(days) +
           std::chrono::hours(hours);
}

inline Transaction makeTransaction(
    std::int64_t id,
    const std::string& symbol,
    TransactionType type,
    std::int64_t quantity,
    double price,
    std::optional<TimePoint> createdAt)
{
    Transaction txn;
    txn.id = id;
    txn.userId = "alice";
    txn.symbol = symbol;
    txn.type = type;
    txn.quantity = quantity;
    txn.price = price;
    txn.totalAmount = toCents(static_cast<double>(quantity) * price);
    txn.createdAt = createdAt;
    return txn;
}

inline Transaction buy(std::int64_t id, const std::string& symbol,
                       std::int64_t quantity, double price, TimePoint createdAt) {
    return makeTransaction(id, symbol, TransactionType::Buy, quantity, price, createdAt);
}

inline Transaction sell(std::int64_t id, const std::string& symbol,
                        std::int64_t quantity, double price, TimePoint createdAt) {
    return makeTransaction(id, symbol, TransactionType::Sell, quantity, price, createdAt);
}

}  // namespace brokerage::test
