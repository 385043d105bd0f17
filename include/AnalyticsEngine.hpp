#pragma once

#include "PortfolioService.hpp"
#include "RiskMetrics.hpp"
#include "SectorCache.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brokerage {

struct SectorAllocation {
    std::string sector;
    double allocationPct = 0.0;
};

struct LargestPosition {
    std::string symbol;
    double allocationPct = 0.0;
};

// Производный снимок, никогда не сохраняется
struct PortfolioSnapshot {
    double totalEquity = 0.0;
    double totalReturnPct = 0.0;
    std::string displayTotalReturnPct;
    double cashAllocationPct = 0.0;
    std::optional<LargestPosition> largestPosition;
    ConcentrationRisk concentrationRiskLevel = ConcentrationRisk::Low;
    std::vector<SectorAllocation> sectorBreakdown;
    double volatility = 0.0;
    double sharpeRatio = 0.0;
    std::optional<std::string> topGainer;
    std::optional<std::string> topLoser;
};

struct AnalyticsConfig {
    double riskFreeRate = RiskMetrics::kDefaultRiskFreeRate;
};

// ═══════════════════════════════════════════════════════════════════════════════
// AnalyticsEngine - риск-аналитика портфеля
// ═══════════════════════════════════════════════════════════════════════════════

class AnalyticsEngine {
public:
    AnalyticsEngine(
        std::shared_ptr<PortfolioService> portfolioService,
        std::shared_ptr<SectorCache> sectorCache,
        AnalyticsConfig config = {});

    LedgerResult<PortfolioSnapshot> buildSnapshot(std::string_view userId);

    // Сборка снимка из уже оцененного портфеля и кривой капитала
    PortfolioSnapshot composeSnapshot(
        const PortfolioView& portfolio,
        const std::vector<EquityPoint>& curve);

    const AnalyticsConfig& config() const noexcept { return config_; }

    // "12.5%": значение без лишних нулей
    static std::string formatPercent(double value);

private:
    std::shared_ptr<PortfolioService> portfolioService_;
    std::shared_ptr<SectorCache> sectorCache_;
    AnalyticsConfig config_;
};

}  // namespace brokerage
