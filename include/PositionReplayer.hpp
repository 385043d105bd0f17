#pragma once

#include "LedgerTypes.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace brokerage {

// Открытая позиция, восстановленная из журнала
struct PositionState {
    std::int64_t netQuantity = 0;
    double avgCost = 0.0;
};

using PositionMap = std::map<std::string, PositionState>;

// ═══════════════════════════════════════════════════════════════════════════════
// PositionReplayer - восстановление позиций по журналу сделок
// ═══════════════════════════════════════════════════════════════════════════════
//
// Учет по средневзвешенной стоимости (не FIFO-лоты).
// Полное закрытие позиции сбрасывает себестоимость: повторная покупка
// начинает новое среднее.

class PositionReplayer {
public:
    // Позиции с netQuantity > 0 и их средняя стоимость
    static PositionMap replay(const std::vector<Transaction>& transactions);

    // Знаковая сумма количеств (BUY +, SELL -) по одному инструменту
    static std::int64_t netQuantity(
        const std::vector<Transaction>& transactions,
        std::string_view symbol) noexcept;

    // Копия журнала, устойчиво отсортированная по createdAt.
    // Записи без метки времени идут первыми.
    static std::vector<Transaction> orderedForReplay(
        const std::vector<Transaction>& transactions);

    static bool isReplayable(const Transaction& transaction) noexcept;
};

}  // namespace brokerage
