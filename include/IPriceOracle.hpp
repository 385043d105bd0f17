#pragma once

#include "LedgerTypes.hpp"
#include <string>
#include <string_view>
#include <expected>
#include <boost/program_options.hpp>

namespace brokerage {

inline constexpr std::string_view kUnknownSector = "Unknown";

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: IPriceOracle
// ═══════════════════════════════════════════════════════════════════════════════

// Источник рыночных данных: текущая цена и сектор инструмента
class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    virtual Result initializeFromOptions(
        [[maybe_unused]] const boost::program_options::variables_map& options) {
        return {};
    }

    // Текущая цена инструмента. Ошибка, если цена недоступна.
    // Возвращенное значение еще проверяется вызывающей стороной (> 0, конечное).
    virtual std::expected<double, std::string> getPrice(std::string_view symbol) = 0;

    // Сектор инструмента, kUnknownSector если сектор неизвестен
    virtual std::string getSector(std::string_view symbol) = 0;
};

}  // namespace brokerage
