#pragma once

#include "LedgerTypes.hpp"
#include "Clock.hpp"
#include <memory>
#include <vector>

namespace brokerage {

struct EquityPoint {
    TimePoint timestamp;
    double equity = 0.0;
};

struct PnLPoint {
    TimePoint timestamp;
    double pnl = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// EquityCurveBuilder - капитал (cash + позиции по последней цене сделки)
// после каждой сделки журнала
// ═══════════════════════════════════════════════════════════════════════════════

class EquityCurveBuilder {
public:
    explicit EquityCurveBuilder(std::shared_ptr<const IClock> clock = nullptr);

    // Одна точка на каждую корректную сделку в порядке createdAt.
    // Пустой журнал дает одну точку {now, startingBalance}.
    std::vector<EquityPoint> build(
        Cents startingBalance,
        const std::vector<Transaction>& transactions) const;

    // pnl = equity - startingBalance, округлено до цента.
    // Пустой журнал дает одну точку {now, 0}.
    std::vector<PnLPoint> buildPnL(
        Cents startingBalance,
        const std::vector<Transaction>& transactions) const;

    // Есть метка времени, totalAmount > 0, тип BUY или SELL
    static bool isValidForCurve(const Transaction& transaction) noexcept;

private:
    std::shared_ptr<const IClock> clock_;
};

}  // namespace brokerage
