#include "SnapshotSerializer.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace brokerage {

std::string SnapshotSerializer::formatTimestamp(const TimePoint& timestamp)
{
    auto millis = std::chrono::floor<std::chrono::milliseconds>(timestamp);
    auto seconds = std::chrono::floor<std::chrono::seconds>(millis);
    auto fraction = (millis - seconds).count();

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return oss.str();
}

json SnapshotSerializer::toJson(const Account& account)
{
    json j;
    j["userId"] = account.userId;
    j["cashBalance"] = fromCents(account.cashBalance);
    j["startingBalance"] = fromCents(account.startingBalance);
    j["createdAt"] = formatTimestamp(account.createdAt);
    return j;
}

json SnapshotSerializer::toJson(const Transaction& transaction)
{
    json j;
    j["id"] = transaction.id;
    j["userId"] = transaction.userId;
    j["symbol"] = transaction.symbol;
    j["type"] = std::string(toString(transaction.type));
    j["quantity"] = transaction.quantity;
    j["price"] = transaction.price;
    j["totalAmount"] = fromCents(transaction.totalAmount);
    j["createdAt"] = transaction.createdAt
        ? json(formatTimestamp(*transaction.createdAt))
        : json(nullptr);
    return j;
}

json SnapshotSerializer::toJson(const std::vector<Transaction>& transactions)
{
    json j = json::array();
    for (const auto& transaction : transactions) {
        j.push_back(toJson(transaction));
    }
    return j;
}

json SnapshotSerializer::toJson(const TradeReceipt& receipt)
{
    json j;
    j["transactionId"] = receipt.transactionId;
    j["symbol"] = receipt.symbol;
    j["type"] = std::string(toString(receipt.type));
    j["quantity"] = receipt.quantity;
    j["price"] = receipt.price;
    j["totalAmount"] = fromCents(receipt.totalAmount);
    j["newBalance"] = fromCents(receipt.newBalance);
    j["executedAt"] = formatTimestamp(receipt.executedAt);
    return j;
}

json SnapshotSerializer::toJson(const PortfolioView& portfolio)
{
    json positions = json::array();
    for (const auto& position : portfolio.positions) {
        positions.push_back({
            {"symbol", position.symbol},
            {"netQuantity", position.netQuantity},
            {"avgCost", position.avgCost},
            {"currentPrice", position.currentPrice},
            {"marketValue", position.marketValue},
            {"unrealizedPnL", position.unrealizedPnL},
            {"gainPercent", position.gainPercent},
            {"allocationPercent", position.allocationPercent}
        });
    }

    json j;
    j["balance"] = fromCents(portfolio.balance);
    j["startingBalance"] = fromCents(portfolio.startingBalance);
    j["positions"] = positions;
    j["totalMarketValue"] = portfolio.totalMarketValue;
    j["totalUnrealizedPnL"] = portfolio.totalUnrealizedPnL;
    j["totalEquity"] = portfolio.totalEquity;
    j["totalReturn"] = portfolio.totalReturn;
    j["totalReturnPercent"] = portfolio.totalReturnPercent;
    j["degradedSymbols"] = portfolio.degradedSymbols;
    return j;
}

json SnapshotSerializer::toJson(const std::vector<EquityPoint>& curve)
{
    json j = json::array();
    for (const auto& point : curve) {
        j.push_back({
            {"date", formatTimestamp(point.timestamp)},
            {"equity", point.equity}
        });
    }
    return j;
}

json SnapshotSerializer::toJson(const std::vector<PnLPoint>& curve)
{
    json j = json::array();
    for (const auto& point : curve) {
        j.push_back({
            {"date", formatTimestamp(point.timestamp)},
            {"pnl", point.pnl}
        });
    }
    return j;
}

json SnapshotSerializer::toJson(const PortfolioSnapshot& snapshot)
{
    json sectors = json::array();
    for (const auto& sector : snapshot.sectorBreakdown) {
        sectors.push_back({
            {"sector", sector.sector},
            {"allocationPct", sector.allocationPct}
        });
    }

    json j;
    j["totalEquity"] = snapshot.totalEquity;
    j["totalReturnPct"] = snapshot.totalReturnPct;
    j["displayTotalReturnPct"] = snapshot.displayTotalReturnPct;
    j["cashAllocationPct"] = snapshot.cashAllocationPct;

    if (snapshot.largestPosition) {
        j["largestPosition"] = {
            {"symbol", snapshot.largestPosition->symbol},
            {"allocationPct", snapshot.largestPosition->allocationPct}
        };
    } else {
        j["largestPosition"] = nullptr;
    }

    j["concentrationRiskLevel"] = std::string(toString(snapshot.concentrationRiskLevel));
    j["sectorBreakdown"] = sectors;
    j["volatility"] = snapshot.volatility;
    j["sharpeRatio"] = snapshot.sharpeRatio;
    j["topGainer"] = snapshot.topGainer ? json(*snapshot.topGainer) : json(nullptr);
    j["topLoser"] = snapshot.topLoser ? json(*snapshot.topLoser) : json(nullptr);
    return j;
}

json SnapshotSerializer::toJson(const Error& error)
{
    json j;
    j["error"] = std::string(toString(error.kind));
    j["message"] = error.message;
    return j;
}

}  // namespace brokerage
