#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <utility>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// Типы ошибок операций с журналом
// ═══════════════════════════════════════════════════════════════════════════════

enum class ErrorKind {
    InvalidInput,
    PriceUnavailable,
    InsufficientBalance,
    InsufficientHoldings,
    AccountNotFound,
    AccountExists,
    StoreFailure,
    MarketDataDegraded,
    Timeout
};

struct Error {
    ErrorKind kind = ErrorKind::StoreFailure;
    std::string message;
};

template <typename T>
using LedgerResult = std::expected<T, Error>;

std::string_view toString(ErrorKind kind) noexcept;

inline std::unexpected<Error> makeError(ErrorKind kind, std::string message) {
    return std::unexpected(Error{kind, std::move(message)});
}

// Для мест, где наружу уходит только текст ошибки (CLI, плагины)
inline std::string describe(const Error& error) {
    return std::string(toString(error.kind)) + ": " + error.message;
}

}  // namespace brokerage
