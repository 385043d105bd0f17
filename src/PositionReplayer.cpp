#include "PositionReplayer.hpp"
#include <algorithm>
#include <iostream>

namespace brokerage {

namespace {

struct RunningPosition {
    std::int64_t quantity = 0;
    double totalCost = 0.0;
};

bool earlierThan(const Transaction& a, const Transaction& b)
{
    if (!a.createdAt) {
        return b.createdAt.has_value();
    }
    if (!b.createdAt) {
        return false;
    }
    return *a.createdAt < *b.createdAt;
}

}  // namespace

bool PositionReplayer::isReplayable(const Transaction& transaction) noexcept
{
    return transaction.quantity >= 1 &&
           (transaction.type == TransactionType::Buy ||
            transaction.type == TransactionType::Sell);
}

std::vector<Transaction> PositionReplayer::orderedForReplay(
    const std::vector<Transaction>& transactions)
{
    std::vector<Transaction> ordered = transactions;
    std::stable_sort(ordered.begin(), ordered.end(), earlierThan);
    return ordered;
}

PositionMap PositionReplayer::replay(const std::vector<Transaction>& transactions)
{
    std::map<std::string, RunningPosition> running;

    for (const auto& txn : orderedForReplay(transactions)) {
        if (!isReplayable(txn)) {
            std::cerr << "⚠ Skipping malformed transaction #" << txn.id
                      << " (" << txn.symbol << ", type " << toString(txn.type)
                      << ", quantity " << txn.quantity << ")" << std::endl;
            continue;
        }

        if (txn.type == TransactionType::Buy) {
            auto& state = running[txn.symbol];
            state.quantity += txn.quantity;
            state.totalCost += fromCents(txn.totalAmount);
            continue;
        }

        // SELL без открытой позиции игнорируется
        auto it = running.find(txn.symbol);
        if (it == running.end()) {
            continue;
        }

        auto& state = it->second;
        double avgCostBeforeSell = state.quantity > 0
            ? state.totalCost / static_cast<double>(state.quantity)
            : 0.0;

        state.totalCost -= avgCostBeforeSell * static_cast<double>(txn.quantity);
        state.quantity -= txn.quantity;

        if (state.quantity <= 0) {
            running.erase(it);
        }
    }

    PositionMap positions;
    for (const auto& [symbol, state] : running) {
        if (state.quantity <= 0) {
            continue;
        }
        positions[symbol] = PositionState{
            state.quantity,
            state.totalCost / static_cast<double>(state.quantity)
        };
    }
    return positions;
}

std::int64_t PositionReplayer::netQuantity(
    const std::vector<Transaction>& transactions,
    std::string_view symbol) noexcept
{
    std::int64_t net = 0;
    for (const auto& txn : transactions) {
        if (txn.symbol != symbol) {
            continue;
        }
        if (txn.type == TransactionType::Buy) {
            net += txn.quantity;
        } else if (txn.type == TransactionType::Sell) {
            net -= txn.quantity;
        }
    }
    return net;
}

}  // namespace brokerage
