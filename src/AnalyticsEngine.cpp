#include "AnalyticsEngine.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <map>
#include <stdexcept>

namespace brokerage {

AnalyticsEngine::AnalyticsEngine(
    std::shared_ptr<PortfolioService> portfolioService,
    std::shared_ptr<SectorCache> sectorCache,
    AnalyticsConfig config)
    : portfolioService_(std::move(portfolioService))
    , sectorCache_(std::move(sectorCache))
    , config_(config)
{
    if (!portfolioService_) {
        throw std::invalid_argument("AnalyticsEngine: portfolio service is required");
    }
    if (!sectorCache_) {
        throw std::invalid_argument("AnalyticsEngine: sector cache is required");
    }
}

LedgerResult<PortfolioSnapshot> AnalyticsEngine::buildSnapshot(std::string_view userId)
{
    // Позиции и кривая из одного снимка журнала
    auto ledger = portfolioService_->loadLedger(userId);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }

    PortfolioView portfolio = portfolioService_->valuate(*ledger);
    std::vector<EquityPoint> curve = portfolioService_->equityCurve(*ledger);

    return composeSnapshot(portfolio, curve);
}

PortfolioSnapshot AnalyticsEngine::composeSnapshot(
    const PortfolioView& portfolio,
    const std::vector<EquityPoint>& curve)
{
    PortfolioSnapshot snapshot;
    const double totalEquity = portfolio.totalEquity;

    snapshot.totalEquity = totalEquity;

    // ════════════════════════════════════════════════════════════════════════
    // Доходность и доля кэша
    // ════════════════════════════════════════════════════════════════════════

    snapshot.totalReturnPct = RiskMetrics::roundTo(portfolio.totalReturnPercent, 2);
    snapshot.displayTotalReturnPct = formatPercent(snapshot.totalReturnPct);

    snapshot.cashAllocationPct = totalEquity > 0.0
        ? RiskMetrics::roundTo(fromCents(portfolio.balance) / totalEquity * 100.0, 2)
        : 0.0;

    // ════════════════════════════════════════════════════════════════════════
    // Концентрация
    // ════════════════════════════════════════════════════════════════════════

    if (!portfolio.positions.empty()) {
        const Position* largest = &portfolio.positions.front();
        for (const auto& position : portfolio.positions) {
            if (position.marketValue >= largest->marketValue) {
                largest = &position;
            }
        }

        snapshot.largestPosition = LargestPosition{
            largest->symbol,
            totalEquity > 0.0
                ? RiskMetrics::roundTo(largest->marketValue / totalEquity * 100.0, 2)
                : 0.0
        };
    }

    snapshot.concentrationRiskLevel = RiskMetrics::classifyConcentration(
        snapshot.largestPosition ? snapshot.largestPosition->allocationPct : 0.0);

    // ════════════════════════════════════════════════════════════════════════
    // Секторы (знаменатель - весь капитал, как и у largestPosition)
    // ════════════════════════════════════════════════════════════════════════

    std::map<std::string, double> bySector;
    for (const auto& position : portfolio.positions) {
        bySector[sectorCache_->sectorFor(position.symbol)] += position.marketValue;
    }

    for (const auto& [sector, value] : bySector) {
        snapshot.sectorBreakdown.push_back({
            sector,
            totalEquity > 0.0 ? RiskMetrics::roundTo(value / totalEquity * 100.0, 2) : 0.0
        });
    }

    std::stable_sort(snapshot.sectorBreakdown.begin(), snapshot.sectorBreakdown.end(),
                     [](const SectorAllocation& a, const SectorAllocation& b) {
                         return a.allocationPct > b.allocationPct;
                     });

    // ════════════════════════════════════════════════════════════════════════
    // Волатильность и Шарп
    // ════════════════════════════════════════════════════════════════════════

    std::vector<double> returns = RiskMetrics::dailyReturns(curve);
    double volatility = RiskMetrics::annualizedVolatility(returns);
    double annualized = RiskMetrics::annualizedReturn(
        RiskMetrics::totalReturn(curve), returns.size());

    snapshot.volatility = RiskMetrics::roundTo(volatility, 4);
    snapshot.sharpeRatio = RiskMetrics::roundTo(
        RiskMetrics::sharpeRatio(annualized, volatility, config_.riskFreeRate), 4);

    // ════════════════════════════════════════════════════════════════════════
    // Лидер и аутсайдер по gainPercent
    // ════════════════════════════════════════════════════════════════════════

    if (!portfolio.positions.empty()) {
        std::vector<const Position*> sorted;
        for (const auto& position : portfolio.positions) {
            sorted.push_back(&position);
        }
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const Position* a, const Position* b) {
                             return a->gainPercent < b->gainPercent;
                         });

        snapshot.topGainer = sorted.back()->symbol;
        if (sorted.front()->symbol != sorted.back()->symbol) {
            snapshot.topLoser = sorted.front()->symbol;
        }
    }

    return snapshot;
}

std::string AnalyticsEngine::formatPercent(double value)
{
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return "0%";
    }
    return std::string(buffer.data(), end) + "%";
}

}  // namespace brokerage
