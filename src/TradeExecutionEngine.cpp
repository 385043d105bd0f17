#include "TradeExecutionEngine.hpp"
#include "PositionReplayer.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace brokerage {

TradeExecutionEngine::TradeExecutionEngine(
    std::shared_ptr<ILedgerStore> store,
    std::shared_ptr<IPriceOracle> oracle,
    std::shared_ptr<const IClock> clock)
    : store_(std::move(store))
    , oracle_(std::move(oracle))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
{
    if (!store_) {
        throw std::invalid_argument("TradeExecutionEngine: ledger store is required");
    }
    if (!oracle_) {
        throw std::invalid_argument("TradeExecutionEngine: price oracle is required");
    }
}

LedgerResult<TradeReceipt> TradeExecutionEngine::executeTrade(
    std::string_view userId,
    std::string_view symbol,
    TransactionType type,
    std::int64_t quantity)
{
    TradeRequest request;
    request.userId = std::string(userId);
    request.symbol = std::string(symbol);
    request.type = type;
    request.quantity = quantity;
    return executeTrade(request);
}

bool TradeExecutionEngine::deadlinePassed(const TradeRequest& request) const
{
    return request.deadline && clock_->now() >= *request.deadline;
}

LedgerResult<double> TradeExecutionEngine::fetchPrice(const std::string& symbol)
{
    auto price = oracle_->getPrice(symbol);
    if (!price) {
        std::cerr << "⚠ Price unavailable for " << symbol << ": "
                  << price.error() << std::endl;
        return makeError(ErrorKind::PriceUnavailable, "Unable to fetch current stock price");
    }
    if (!std::isfinite(*price) || *price <= 0.0) {
        return makeError(ErrorKind::PriceUnavailable, "Unable to fetch current stock price");
    }
    return *price;
}

LedgerResult<TradeReceipt> TradeExecutionEngine::executeTrade(const TradeRequest& request)
{
    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 0: Проверка параметров до любого I/O
    // ═════════════════════════════════════════════════════════════════════════

    std::string symbol = normalizeSymbol(request.symbol);

    if (request.userId.empty() || symbol.empty() || request.quantity < 1 ||
        (request.type != TransactionType::Buy && request.type != TransactionType::Sell)) {
        return makeError(ErrorKind::InvalidInput, "Invalid trade parameters");
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 1: Цена исполнения
    // ═════════════════════════════════════════════════════════════════════════

    auto price = fetchPrice(symbol);
    if (!price) {
        return std::unexpected(price.error());
    }

    double amount = *price * static_cast<double>(request.quantity);
    if (!std::isfinite(amount) ||
        amount * 100.0 >= static_cast<double>(std::numeric_limits<Cents>::max())) {
        return makeError(ErrorKind::InvalidInput, "Invalid trade parameters");
    }

    Cents totalAmount = toCents(amount);
    if (totalAmount <= 0) {
        return makeError(ErrorKind::InvalidInput, "Trade amount rounds to zero");
    }

    if (deadlinePassed(request)) {
        return makeError(ErrorKind::Timeout, "Trade deadline exceeded before execution");
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 2: Сессия по счету (эксклюзивно до commit/abort)
    // ═════════════════════════════════════════════════════════════════════════

    auto sessionResult = store_->beginSession(request.userId);
    if (!sessionResult) {
        return std::unexpected(sessionResult.error());
    }
    auto& session = *sessionResult;

    Account updated = session->account();

    if (request.type == TransactionType::Buy) {
        if (updated.cashBalance < totalAmount) {
            return makeError(ErrorKind::InsufficientBalance, "Insufficient balance");
        }
        updated.cashBalance -= totalAmount;
    } else {
        auto history = session->transactions(symbol);
        if (!history) {
            return std::unexpected(history.error());
        }

        std::int64_t netQuantity = PositionReplayer::netQuantity(*history, symbol);
        if (netQuantity < request.quantity) {
            return makeError(ErrorKind::InsufficientHoldings, "Insufficient holdings");
        }
        if (totalAmount > std::numeric_limits<Cents>::max() - updated.cashBalance) {
            return makeError(ErrorKind::InvalidInput, "Trade amount overflows cash balance");
        }
        updated.cashBalance += totalAmount;
    }

    if (deadlinePassed(request)) {
        return makeError(ErrorKind::Timeout, "Trade deadline exceeded before commit");
    }

    // ═════════════════════════════════════════════════════════════════════════
    // Шаг 3: Коммит баланса и записи журнала одной единицей
    // ═════════════════════════════════════════════════════════════════════════

    Transaction transaction;
    transaction.userId = request.userId;
    transaction.symbol = symbol;
    transaction.type = request.type;
    transaction.quantity = request.quantity;
    transaction.price = *price;
    transaction.totalAmount = totalAmount;
    transaction.createdAt = clock_->now();

    auto committed = session->commit(updated, transaction);
    if (!committed) {
        std::cerr << "✗ Trade rolled back for " << request.userId << ": "
                  << committed.error().message << std::endl;
        return std::unexpected(committed.error());
    }

    TradeReceipt receipt;
    receipt.transactionId = committed->id;
    receipt.symbol = committed->symbol;
    receipt.type = committed->type;
    receipt.quantity = committed->quantity;
    receipt.price = committed->price;
    receipt.totalAmount = committed->totalAmount;
    receipt.newBalance = updated.cashBalance;
    receipt.executedAt = committed->createdAt.value_or(transaction.createdAt.value());
    return receipt;
}

}  // namespace brokerage
