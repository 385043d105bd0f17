#include "LedgerTypes.hpp"
#include "LedgerError.hpp"
#include "ILedgerStore.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace brokerage {

std::string_view toString(TransactionType type) noexcept
{
    switch (type) {
        case TransactionType::Buy:  return "BUY";
        case TransactionType::Sell: return "SELL";
        default:                    return "UNKNOWN";
    }
}

TransactionType parseTransactionType(std::string_view text) noexcept
{
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    if (upper == "BUY") {
        return TransactionType::Buy;
    }
    if (upper == "SELL") {
        return TransactionType::Sell;
    }
    return TransactionType::Unknown;
}

std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::InvalidInput:         return "InvalidInput";
        case ErrorKind::PriceUnavailable:     return "PriceUnavailable";
        case ErrorKind::InsufficientBalance:  return "InsufficientBalance";
        case ErrorKind::InsufficientHoldings: return "InsufficientHoldings";
        case ErrorKind::AccountNotFound:      return "AccountNotFound";
        case ErrorKind::AccountExists:        return "AccountExists";
        case ErrorKind::StoreFailure:         return "StoreFailure";
        case ErrorKind::MarketDataDegraded:   return "MarketDataDegraded";
        case ErrorKind::Timeout:              return "Timeout";
    }
    return "Unknown";
}

Cents toCents(double amount) noexcept
{
    return static_cast<Cents>(std::llround(amount * 100.0));
}

double fromCents(Cents cents) noexcept
{
    return static_cast<double>(cents) / 100.0;
}

Cents cashEffect(const Transaction& transaction) noexcept
{
    switch (transaction.type) {
        case TransactionType::Buy:  return -transaction.totalAmount;
        case TransactionType::Sell: return transaction.totalAmount;
        default:                    return 0;
    }
}

LedgerResult<void> validateCommit(
    const Account& original,
    const Account& updated,
    const Transaction& transaction)
{
    if (updated.userId != original.userId ||
        (!transaction.userId.empty() && transaction.userId != original.userId)) {
        return makeError(ErrorKind::StoreFailure, "Commit does not belong to session account");
    }
    if (updated.startingBalance != original.startingBalance) {
        return makeError(ErrorKind::StoreFailure, "Starting balance is immutable");
    }
    if (updated.cashBalance < 0) {
        return makeError(ErrorKind::StoreFailure, "Cash balance must not be negative");
    }
    if (updated.cashBalance - original.cashBalance != cashEffect(transaction)) {
        return makeError(ErrorKind::StoreFailure, "Balance change does not match transaction");
    }
    return {};
}

std::string normalizeSymbol(std::string_view symbol)
{
    auto start = symbol.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = symbol.find_last_not_of(" \t\r\n");

    std::string result(symbol.substr(start, end - start + 1));
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

}  // namespace brokerage
