#pragma once

#include "AnalyticsEngine.hpp"
#include "TradeExecutionEngine.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace brokerage {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════════
// SnapshotSerializer - JSON-представление результатов для вывода --json
// ═══════════════════════════════════════════════════════════════════════════════
//
// Деньги в JSON - десятичные числа, время - ISO 8601 UTC с миллисекундами.

class SnapshotSerializer {
public:
    static json toJson(const Account& account);
    static json toJson(const Transaction& transaction);
    static json toJson(const std::vector<Transaction>& transactions);
    static json toJson(const TradeReceipt& receipt);
    static json toJson(const PortfolioView& portfolio);
    static json toJson(const std::vector<EquityPoint>& curve);
    static json toJson(const std::vector<PnLPoint>& curve);
    static json toJson(const PortfolioSnapshot& snapshot);
    static json toJson(const Error& error);

    // 2024-01-15T10:30:00.000Z
    static std::string formatTimestamp(const TimePoint& timestamp);
};

}  // namespace brokerage
