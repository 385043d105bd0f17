#include "PortfolioService.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace brokerage {

PortfolioService::PortfolioService(
    std::shared_ptr<ILedgerStore> store,
    std::shared_ptr<IPriceOracle> oracle,
    std::shared_ptr<const IClock> clock)
    : store_(std::move(store))
    , oracle_(std::move(oracle))
    , curveBuilder_(std::move(clock))
{
    if (!store_) {
        throw std::invalid_argument("PortfolioService: ledger store is required");
    }
    if (!oracle_) {
        throw std::invalid_argument("PortfolioService: price oracle is required");
    }
}

LedgerResult<LedgerSnapshot> PortfolioService::loadLedger(std::string_view userId)
{
    if (userId.empty()) {
        return makeError(ErrorKind::InvalidInput, "User id is empty");
    }
    return store_->readSnapshot(userId);
}

// ═════════════════════════════════════════════════════════════════════════════
// Оценка портфеля
// ═════════════════════════════════════════════════════════════════════════════

PortfolioView PortfolioService::valuate(const LedgerSnapshot& ledger)
{
    PortfolioView view;
    view.balance = ledger.account.cashBalance;
    view.startingBalance = ledger.account.startingBalance;

    PositionMap replayed = PositionReplayer::replay(ledger.transactions);

    for (const auto& [symbol, state] : replayed) {
        auto price = oracle_->getPrice(symbol);
        if (!price || !std::isfinite(*price) || *price <= 0.0) {
            std::cerr << "⚠ Skipping position " << symbol
                      << ": invalid or unavailable price" << std::endl;
            view.degradedSymbols.push_back(symbol);
            continue;
        }

        Position position;
        position.symbol = symbol;
        position.netQuantity = state.netQuantity;
        position.avgCost = state.avgCost;
        position.currentPrice = *price;

        double quantity = static_cast<double>(state.netQuantity);
        position.marketValue = quantity * position.currentPrice;
        position.unrealizedPnL = (position.currentPrice - position.avgCost) * quantity;
        position.gainPercent = position.avgCost > 0.0
            ? (position.currentPrice - position.avgCost) / position.avgCost * 100.0
            : 0.0;

        view.positions.push_back(std::move(position));
    }

    for (const auto& position : view.positions) {
        view.totalMarketValue += position.marketValue;
        view.totalUnrealizedPnL += position.unrealizedPnL;
    }

    for (auto& position : view.positions) {
        position.allocationPercent = view.totalMarketValue > 0.0
            ? position.marketValue / view.totalMarketValue * 100.0
            : 0.0;
    }

    double balance = fromCents(view.balance);
    double startingBalance = fromCents(view.startingBalance);

    view.totalEquity = balance + view.totalMarketValue;
    view.totalReturn = view.totalEquity - startingBalance;
    view.totalReturnPercent = startingBalance > 0.0
        ? view.totalReturn / startingBalance * 100.0
        : 0.0;

    return view;
}

std::vector<EquityPoint> PortfolioService::equityCurve(const LedgerSnapshot& ledger) const
{
    return curveBuilder_.build(ledger.account.startingBalance, ledger.transactions);
}

// ═════════════════════════════════════════════════════════════════════════════
// Операции чтения по userId
// ═════════════════════════════════════════════════════════════════════════════

LedgerResult<PortfolioView> PortfolioService::getPortfolio(std::string_view userId)
{
    auto ledger = loadLedger(userId);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }
    return valuate(*ledger);
}

LedgerResult<std::vector<EquityPoint>> PortfolioService::getEquityCurve(std::string_view userId)
{
    auto ledger = loadLedger(userId);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }
    return equityCurve(*ledger);
}

LedgerResult<std::vector<PnLPoint>> PortfolioService::getPnLCurve(std::string_view userId)
{
    auto ledger = loadLedger(userId);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }
    return curveBuilder_.buildPnL(ledger->account.startingBalance, ledger->transactions);
}

LedgerResult<std::vector<Transaction>> PortfolioService::getTransactions(std::string_view userId)
{
    auto ledger = loadLedger(userId);
    if (!ledger) {
        return std::unexpected(ledger.error());
    }
    return std::move(ledger->transactions);
}

}  // namespace brokerage
