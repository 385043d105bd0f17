#include "EquityCurveBuilder.hpp"
#include "PositionReplayer.hpp"
#include "RiskMetrics.hpp"
#include <iostream>
#include <map>
#include <string>

namespace brokerage {

EquityCurveBuilder::EquityCurveBuilder(std::shared_ptr<const IClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
{
}

bool EquityCurveBuilder::isValidForCurve(const Transaction& transaction) noexcept
{
    return transaction.createdAt.has_value() &&
           transaction.totalAmount > 0 &&
           (transaction.type == TransactionType::Buy ||
            transaction.type == TransactionType::Sell);
}

std::vector<EquityPoint> EquityCurveBuilder::build(
    Cents startingBalance,
    const std::vector<Transaction>& transactions) const
{
    std::vector<EquityPoint> curve;

    if (transactions.empty()) {
        curve.push_back({clock_->now(), fromCents(startingBalance)});
        return curve;
    }

    Cents cash = startingBalance;
    std::map<std::string, std::int64_t> holdings;
    std::map<std::string, double> lastPrice;
    std::size_t skipped = 0;

    curve.reserve(transactions.size());

    for (const auto& txn : PositionReplayer::orderedForReplay(transactions)) {
        if (!isValidForCurve(txn)) {
            ++skipped;
            std::cerr << "⚠ Equity curve: skipping transaction #" << txn.id
                      << " (" << txn.symbol << ")" << std::endl;
            continue;
        }

        if (txn.type == TransactionType::Buy) {
            cash -= txn.totalAmount;
            holdings[txn.symbol] += txn.quantity;
        } else {
            cash += txn.totalAmount;
            auto it = holdings.find(txn.symbol);
            if (it != holdings.end()) {
                it->second -= txn.quantity;
                if (it->second <= 0) {
                    holdings.erase(it);
                }
            }
        }

        lastPrice[txn.symbol] = txn.price;

        double holdingsValue = 0.0;
        for (const auto& [symbol, quantity] : holdings) {
            auto priceIt = lastPrice.find(symbol);
            if (priceIt != lastPrice.end()) {
                holdingsValue += static_cast<double>(quantity) * priceIt->second;
            }
        }

        curve.push_back({*txn.createdAt, fromCents(cash) + holdingsValue});
    }

    if (skipped > 0) {
        std::cerr << "⚠ Equity curve: " << skipped
                  << " transaction(s) skipped" << std::endl;
    }

    return curve;
}

std::vector<PnLPoint> EquityCurveBuilder::buildPnL(
    Cents startingBalance,
    const std::vector<Transaction>& transactions) const
{
    std::vector<PnLPoint> pnl;

    if (transactions.empty()) {
        pnl.push_back({clock_->now(), 0.0});
        return pnl;
    }

    double start = fromCents(startingBalance);
    for (const auto& point : build(startingBalance, transactions)) {
        pnl.push_back({point.timestamp, RiskMetrics::roundTo(point.equity - start, 2)});
    }
    return pnl;
}

}  // namespace brokerage
