#pragma once

#include "EquityCurveBuilder.hpp"
#include <string_view>
#include <vector>
#include <cstddef>

namespace brokerage {

enum class ConcentrationRisk {
    Low,
    Medium,
    High
};

std::string_view toString(ConcentrationRisk risk) noexcept;

/**
 * @brief Риск-метрики по кривой капитала
 *
 * Все функции чистые: на вход кривая или ряд доходностей,
 * на выход число без округления (округление делает AnalyticsEngine).
 */
class RiskMetrics {
public:
    static constexpr double kTradingDaysPerYear = 252.0;
    static constexpr double kDefaultRiskFreeRate = 0.03;
    static constexpr double kHighConcentrationPct = 40.0;
    static constexpr double kMediumConcentrationPct = 25.0;

    /**
     * @brief Дневные доходности
     *
     * Кривая сворачивается до одного значения на календарный день UTC
     * (побеждает последнее значение дня). День, которому предшествует
     * нулевое значение, пропускается.
     * @param curve Кривая капитала
     * @return Пустой вектор, если точек меньше двух
     */
    static std::vector<double> dailyReturns(const std::vector<EquityPoint>& curve);

    /**
     * @brief Годовая волатильность: выборочное СКО (n-1) * sqrt(252)
     * @return 0, если доходностей меньше двух
     */
    static double annualizedVolatility(const std::vector<double>& dailyReturns);

    /**
     * @brief Доходность за весь период (last - first) / first
     * @return 0 для пустой кривой или first <= 0
     */
    static double totalReturn(const std::vector<EquityPoint>& curve);

    /**
     * @brief Годовая доходность (1 + totalReturn)^(252/n) - 1
     * @param returnDays Количество дневных доходностей n
     */
    static double annualizedReturn(double totalReturn, std::size_t returnDays);

    /**
     * @brief Коэффициент Шарпа, 0 при нулевой волатильности
     */
    static double sharpeRatio(
        double annualizedReturn,
        double annualizedVolatility,
        double riskFreeRate = kDefaultRiskFreeRate);

    static ConcentrationRisk classifyConcentration(double largestAllocationPct) noexcept;

    static double roundTo(double value, int decimals);
};

}  // namespace brokerage
