#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <expected>

namespace brokerage {

using TimePoint = std::chrono::system_clock::time_point;
using Result = std::expected<void, std::string>;

// Денежные суммы (баланс, стоимость сделки) храним в центах,
// чтобы баланс точно совпадал с суммой по журналу сделок
using Cents = std::int64_t;

inline constexpr Cents kDefaultStartingBalance = 100000 * 100;

// ═══════════════════════════════════════════════════════════════════════════════
// Тип сделки
// ═══════════════════════════════════════════════════════════════════════════════

enum class TransactionType {
    Buy,
    Sell,
    Unknown   // Нераспознанное значение из хранилища
};

std::string_view toString(TransactionType type) noexcept;

// "BUY" / "SELL" без учета регистра, все остальное -> Unknown
TransactionType parseTransactionType(std::string_view text) noexcept;

// ═══════════════════════════════════════════════════════════════════════════════
// Счет пользователя
// ═══════════════════════════════════════════════════════════════════════════════

struct Account {
    std::string userId;
    Cents cashBalance = 0;
    Cents startingBalance = 0;   // Не меняется после создания счета
    TimePoint createdAt;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Запись журнала сделок (неизменяемая, только добавление)
// ═══════════════════════════════════════════════════════════════════════════════

struct Transaction {
    std::int64_t id = 0;
    std::string userId;
    std::string symbol;
    TransactionType type = TransactionType::Unknown;
    std::int64_t quantity = 0;
    double price = 0.0;                  // Цена исполнения на момент коммита
    Cents totalAmount = 0;               // quantity * price, округлено до цента
    std::optional<TimePoint> createdAt;  // Ключ упорядочивания при воспроизведении
};

// Согласованное чтение: счет и журнал из одного снимка хранилища
struct LedgerSnapshot {
    Account account;
    std::vector<Transaction> transactions;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Вспомогательные функции
// ═══════════════════════════════════════════════════════════════════════════════

Cents toCents(double amount) noexcept;
double fromCents(Cents cents) noexcept;

// Изменение денежного баланса от сделки: BUY уменьшает, SELL увеличивает
Cents cashEffect(const Transaction& transaction) noexcept;

// Обрезает пробелы и переводит в верхний регистр
std::string normalizeSymbol(std::string_view symbol);

}  // namespace brokerage
