#pragma once

#include "ILedgerStore.hpp"
#include "IPriceOracle.hpp"
#include "EquityCurveBuilder.hpp"
#include "PositionReplayer.hpp"
#include "Clock.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace brokerage {

// Позиция, оцененная по текущей рыночной цене
struct Position {
    std::string symbol;
    std::int64_t netQuantity = 0;
    double avgCost = 0.0;
    double currentPrice = 0.0;
    double marketValue = 0.0;
    double unrealizedPnL = 0.0;
    double gainPercent = 0.0;
    double allocationPercent = 0.0;
};

struct PortfolioView {
    Cents balance = 0;
    Cents startingBalance = 0;
    std::vector<Position> positions;
    double totalMarketValue = 0.0;
    double totalUnrealizedPnL = 0.0;
    double totalEquity = 0.0;
    double totalReturn = 0.0;
    double totalReturnPercent = 0.0;

    // Инструменты, исключенные из-за недоступной цены (MarketDataDegraded)
    std::vector<std::string> degradedSymbols;
};

// ═══════════════════════════════════════════════════════════════════════════════
// PortfolioService - чтение портфеля: позиции, кривая капитала, журнал
// ═══════════════════════════════════════════════════════════════════════════════

class PortfolioService {
public:
    PortfolioService(
        std::shared_ptr<ILedgerStore> store,
        std::shared_ptr<IPriceOracle> oracle,
        std::shared_ptr<const IClock> clock = nullptr);

    LedgerResult<PortfolioView> getPortfolio(std::string_view userId);
    LedgerResult<std::vector<EquityPoint>> getEquityCurve(std::string_view userId);
    LedgerResult<std::vector<PnLPoint>> getPnLCurve(std::string_view userId);
    LedgerResult<std::vector<Transaction>> getTransactions(std::string_view userId);

    // Согласованный снимок счета и журнала
    LedgerResult<LedgerSnapshot> loadLedger(std::string_view userId);

    // Оценка по живым ценам; позиция без цены пропускается
    PortfolioView valuate(const LedgerSnapshot& ledger);

    std::vector<EquityPoint> equityCurve(const LedgerSnapshot& ledger) const;

private:
    std::shared_ptr<ILedgerStore> store_;
    std::shared_ptr<IPriceOracle> oracle_;
    EquityCurveBuilder curveBuilder_;
};

}  // namespace brokerage
