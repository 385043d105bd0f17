#include "RiskMetrics.hpp"
#include <chrono>
#include <cmath>
#include <map>
#include <numeric>

namespace brokerage {

std::string_view toString(ConcentrationRisk risk) noexcept
{
    switch (risk) {
        case ConcentrationRisk::High:   return "HIGH";
        case ConcentrationRisk::Medium: return "MEDIUM";
        default:                        return "LOW";
    }
}

std::vector<double> RiskMetrics::dailyReturns(const std::vector<EquityPoint>& curve)
{
    std::vector<double> returns;
    if (curve.size() < 2) {
        return returns;
    }

    // Одно значение на день UTC, последнее значение дня побеждает
    std::map<std::chrono::sys_days, double> byDay;
    for (const auto& point : curve) {
        byDay[std::chrono::floor<std::chrono::days>(point.timestamp)] = point.equity;
    }

    if (byDay.size() < 2) {
        return returns;
    }

    returns.reserve(byDay.size() - 1);

    auto prev = byDay.begin();
    for (auto it = std::next(byDay.begin()); it != byDay.end(); ++it, ++prev) {
        if (prev->second == 0.0) {
            continue;
        }
        returns.push_back((it->second - prev->second) / prev->second);
    }

    return returns;
}

double RiskMetrics::annualizedVolatility(const std::vector<double>& dailyReturns)
{
    if (dailyReturns.size() < 2) {
        return 0.0;
    }

    double n = static_cast<double>(dailyReturns.size());
    double mean = std::accumulate(dailyReturns.begin(), dailyReturns.end(), 0.0) / n;

    double variance = 0.0;
    for (double ret : dailyReturns) {
        variance += (ret - mean) * (ret - mean);
    }
    variance /= (n - 1.0);

    return std::sqrt(variance) * std::sqrt(kTradingDaysPerYear);
}

double RiskMetrics::totalReturn(const std::vector<EquityPoint>& curve)
{
    if (curve.empty()) {
        return 0.0;
    }

    double first = curve.front().equity;
    double last = curve.back().equity;

    if (first <= 0.0) {
        return 0.0;
    }
    return (last - first) / first;
}

double RiskMetrics::annualizedReturn(double totalReturn, std::size_t returnDays)
{
    if (returnDays == 0) {
        return 0.0;
    }
    return std::pow(1.0 + totalReturn,
                    kTradingDaysPerYear / static_cast<double>(returnDays)) - 1.0;
}

double RiskMetrics::sharpeRatio(
    double annualizedReturn,
    double annualizedVolatility,
    double riskFreeRate)
{
    if (annualizedVolatility == 0.0) {
        return 0.0;
    }
    return (annualizedReturn - riskFreeRate) / annualizedVolatility;
}

ConcentrationRisk RiskMetrics::classifyConcentration(double largestAllocationPct) noexcept
{
    if (largestAllocationPct > kHighConcentrationPct) {
        return ConcentrationRisk::High;
    }
    if (largestAllocationPct > kMediumConcentrationPct) {
        return ConcentrationRisk::Medium;
    }
    return ConcentrationRisk::Low;
}

double RiskMetrics::roundTo(double value, int decimals)
{
    double factor = std::pow(10.0, decimals);
    double rounded = std::round(value * factor) / factor;
    // -0.0 -> 0.0
    return rounded == 0.0 ? 0.0 : rounded;
}

}  // namespace brokerage
