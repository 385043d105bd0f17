#include "CommandExecutor.hpp"
#include "TradeExecutionEngine.hpp"
#include "PortfolioService.hpp"
#include "AnalyticsEngine.hpp"
#include "SectorCache.hpp"
#include "EquityCurveBuilder.hpp"
#include "SnapshotSerializer.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <cmath>
#include <limits>
#include <sstream>

namespace brokerage {

namespace {

std::string formatMoney(double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string formatMoney(Cents value)
{
    return formatMoney(fromCents(value));
}

}  // namespace

CommandExecutor::CommandExecutor(
    std::shared_ptr<ILedgerStore> ledger,
    std::shared_ptr<IPriceOracle> oracle,
    std::shared_ptr<const IClock> clock)
    : ledgerPluginManager_(std::make_unique<PluginManager<ILedgerStore>>())
    , oraclePluginManager_(std::make_unique<PluginManager<IPriceOracle>>())
    , ledger_(std::move(ledger))
    , oracle_(std::move(oracle))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
{
}

CommandExecutor::~CommandExecutor() {
    // Экземпляры плагинов уничтожаются до dlclose
    ledger_.reset();
    oracle_.reset();

    if (ledgerPluginManager_) {
        ledgerPluginManager_->unloadAll();
    }
    if (oraclePluginManager_) {
        oraclePluginManager_->unloadAll();
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═════════════════════════════════════════════════════════════════════════════

bool CommandExecutor::wantsJson(const ParsedCommand& cmd)
{
    return cmd.options.count("json") && cmd.options.at("json").as<bool>();
}

std::expected<void, std::string> CommandExecutor::reportError(
    const ParsedCommand& cmd,
    const Error& error) const
{
    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(error).dump(2) << std::endl;
    }
    return std::unexpected(describe(error));
}

// ═════════════════════════════════════════════════════════════════════════════
// Backend Initialization
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::ensureLedger(const ParsedCommand& cmd)
{
    if (ledger_) {
        return {};
    }

    auto pluginName = getRequiredOption<std::string>(cmd, "ledger");
    if (!pluginName) {
        return std::unexpected(pluginName.error());
    }

    auto ledgerResult = ledgerPluginManager_->load(*pluginName);
    if (!ledgerResult) {
        std::string errorMsg = "Failed to load ledger plugin '" + *pluginName +
                               "': " + ledgerResult.error();

        auto availablePlugins = ledgerPluginManager_->scanAvailablePlugins();
        if (!availablePlugins.empty()) {
            errorMsg += "\n\nAvailable ledger plugins:";
            for (const auto& p : availablePlugins) {
                errorMsg += "\n  - " + p.displayName + " v" + p.version +
                            " (use: " + p.systemName + ")";
            }
        } else {
            errorMsg += "\n\nNo ledger plugins found in: " +
                        ledgerPluginManager_->getPluginPath();
            errorMsg += "\nPlease check BROKERAGE_PLUGIN_PATH environment variable.";
        }
        return std::unexpected(errorMsg);
    }

    auto initResult = ledgerResult.value()->initializeFromOptions(cmd.options);
    if (!initResult) {
        return std::unexpected(
            "Failed to initialize ledger '" + *pluginName + "': " + initResult.error());
    }

    ledger_ = ledgerResult.value();
    return {};
}

std::expected<void, std::string> CommandExecutor::ensureOracle(const ParsedCommand& cmd)
{
    if (oracle_) {
        return {};
    }

    auto pluginName = getRequiredOption<std::string>(cmd, "oracle");
    if (!pluginName) {
        return std::unexpected(pluginName.error());
    }

    auto oracleResult = oraclePluginManager_->load(*pluginName);
    if (!oracleResult) {
        std::string errorMsg = "Failed to load oracle plugin '" + *pluginName +
                               "': " + oracleResult.error();

        auto availablePlugins = oraclePluginManager_->scanAvailablePlugins();
        if (!availablePlugins.empty()) {
            errorMsg += "\n\nAvailable oracle plugins:";
            for (const auto& p : availablePlugins) {
                errorMsg += "\n  - " + p.displayName + " v" + p.version +
                            " (use: " + p.systemName + ")";
            }
        } else {
            errorMsg += "\n\nNo oracle plugins found in: " +
                        oraclePluginManager_->getPluginPath();
        }
        return std::unexpected(errorMsg);
    }

    auto initResult = oracleResult.value()->initializeFromOptions(cmd.options);
    if (!initResult) {
        return std::unexpected(
            "Failed to initialize oracle '" + *pluginName + "': " + initResult.error());
    }

    oracle_ = oracleResult.value();
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Маршрутизация
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::execute(const ParsedCommand& cmd)
{
    if (cmd.command == "help") {
        return executeHelp(cmd);
    } else if (cmd.command == "version") {
        return executeVersion(cmd);
    } else if (cmd.command == "account") {
        return executeAccount(cmd);
    } else if (cmd.command == "trade") {
        return executeTrade(cmd);
    } else if (cmd.command == "portfolio") {
        return executePortfolio(cmd);
    } else if (cmd.command == "equity") {
        return executeEquity(cmd);
    } else if (cmd.command == "pnl") {
        return executePnL(cmd);
    } else if (cmd.command == "snapshot") {
        return executeSnapshot(cmd);
    } else if (cmd.command == "transactions") {
        return executeTransactions(cmd);
    } else if (cmd.command == "plugin") {
        return executePlugin(cmd);
    } else {
        return std::unexpected("Unknown command: " + cmd.command);
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Help & Version
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeHelp(const ParsedCommand& cmd)
{
    printHelp(cmd);
    return {};
}

std::expected<void, std::string> CommandExecutor::executeVersion(const ParsedCommand& /*cmd*/)
{
    printVersion();
    return {};
}

void CommandExecutor::printHelp(const ParsedCommand& cmd)
{
    std::string topic = cmd.positional.empty() ? "" : cmd.positional[0];

    if (topic.empty()) {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "Brokerage Ledger" << std::endl;
        std::cout << "Usage: brokerage <command> [subcommand] [options]" << std::endl << std::endl;

        std::cout << "COMMANDS:" << std::endl;
        std::cout << "  account                 Create and inspect accounts" << std::endl;
        std::cout << "  trade                   Execute BUY/SELL at the current price" << std::endl;
        std::cout << "  portfolio               Positions valued at live prices" << std::endl;
        std::cout << "  equity                  Equity curve from the journal" << std::endl;
        std::cout << "  pnl                     Profit/loss curve" << std::endl;
        std::cout << "  snapshot                Risk analytics snapshot" << std::endl;
        std::cout << "  transactions            Transaction journal" << std::endl;
        std::cout << "  plugin                  Manage plugins" << std::endl;
        std::cout << "  help <command>          Show detailed help for a command" << std::endl;
        std::cout << "  version                 Show version information" << std::endl;
        std::cout << std::endl;

        std::cout << "For more information on a specific command, use:" << std::endl;
        std::cout << "  brokerage help <command> [--with <plugin>]" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "account") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: account" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "SUBCOMMANDS:" << std::endl;
        std::cout << "  create -u USER          Open an account with a starting balance" << std::endl;
        std::cout << "  show -u USER            Show cash and starting balance" << std::endl;
        std::cout << "  list                    List all account ids" << std::endl;
        std::cout << std::endl;

        std::cout << "OPTIONS:" << std::endl;
        std::cout << "  --starting-balance N    Initial cash (default: 100000)" << std::endl;
        std::cout << "  --ledger NAME           Ledger plugin (default: sqlite_ledger)" << std::endl;
        std::cout << "  --json                  Print result as JSON" << std::endl;
        std::cout << std::endl;

        std::cout << "EXAMPLES:" << std::endl;
        std::cout << "  brokerage account create -u alice --sqlite-path ./ledger.db" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "trade") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: trade" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "USAGE:" << std::endl;
        std::cout << "  brokerage trade buy|sell -u USER -s SYMBOL -q QTY [OPTIONS]" << std::endl;
        std::cout << std::endl;

        std::cout << "OPTIONS:" << std::endl;
        std::cout << "  --timeout-ms MS         Abort if not committed in time" << std::endl;
        std::cout << "  --ledger NAME           Ledger plugin (default: sqlite_ledger)" << std::endl;
        std::cout << "  --oracle NAME           Price oracle plugin (default: csv_quotes)" << std::endl;
        std::cout << "  --json                  Print receipt as JSON" << std::endl;
        std::cout << std::endl;

        std::cout << "EXAMPLES:" << std::endl;
        std::cout << "  brokerage trade buy -u alice -s AAPL -q 10 \\" << std::endl;
        std::cout << "    --sqlite-path ./ledger.db --quotes-file quotes.csv" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "portfolio" || topic == "equity" || topic == "pnl" ||
               topic == "snapshot" || topic == "transactions") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: " << topic << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "USAGE:" << std::endl;
        std::cout << "  brokerage " << topic << " -u USER [OPTIONS]" << std::endl;
        std::cout << std::endl;

        std::cout << "OPTIONS:" << std::endl;
        std::cout << "  --json                  Print result as JSON" << std::endl;
        std::cout << "  --ledger NAME           Ledger plugin (default: sqlite_ledger)" << std::endl;
        if (topic == "portfolio" || topic == "snapshot") {
            std::cout << "  --oracle NAME           Price oracle plugin (default: csv_quotes)" << std::endl;
        }
        if (topic == "snapshot") {
            std::cout << "  --risk-free-rate R      Annual rate for Sharpe (default: 0.03)" << std::endl;
            std::cout << "  --sector-cache-ttl S    Sector cache lifetime, seconds" << std::endl;
        }
        std::cout << std::string(70, '=') << std::endl;

    } else if (topic == "plugin") {
        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << "COMMAND: plugin" << std::endl;
        std::cout << std::string(70, '=') << std::endl << std::endl;

        std::cout << "SUBCOMMANDS:" << std::endl;
        std::cout << "  list [-t TYPE]          List plugins (ledger, oracle)" << std::endl;
        std::cout << "  info -n NAME            Show plugin details and options" << std::endl;
        std::cout << std::string(70, '=') << std::endl;

    } else {
        std::cout << "Unknown help topic: " << topic << std::endl;
        std::cout << "Available topics: account, trade, portfolio, equity, pnl, "
                  << "snapshot, transactions, plugin" << std::endl;
    }

    if (!cmd.pluginNames.empty()) {
        printPluginOptions(cmd.pluginNames, topic);
    }

    std::cout << std::endl;
}

void CommandExecutor::printPluginOptions(
    const std::vector<std::string>& pluginNames,
    std::string_view command)
{
    if (!parser_) {
        return;
    }

    for (const auto& pluginName : pluginNames) {
        auto pluginType = parser_->getPluginType(pluginName);
        if (!pluginType) {
            std::cout << "⚠ " << pluginType.error() << std::endl;
            continue;
        }

        if (!command.empty() &&
            !parser_->commandUsesPluginType(command, "", *pluginType)) {
            std::cout << "⚠ Command '" << command << "' does not use "
                      << *pluginType << " plugins" << std::endl;
            continue;
        }

        auto options = parser_->getPluginOptions(pluginName);
        if (!options) {
            std::cout << "⚠ " << options.error() << std::endl;
            continue;
        }

        std::cout << "\n" << std::string(70, '-') << std::endl;
        std::cout << "PLUGIN OPTIONS (" << pluginName << "):" << std::endl;
        std::cout << std::string(70, '-') << std::endl;
        std::cout << *options << std::endl;
    }
}

void CommandExecutor::printVersion() const
{
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << "Brokerage Ledger" << std::endl;
    std::cout << "Version: 1.0.0" << std::endl;
    std::cout << "Build Date: " << __DATE__ << std::endl;
    std::cout << std::string(50, '=') << "\n" << std::endl;
}

// ═════════════════════════════════════════════════════════════════════════════
// Account
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeAccount(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'brokerage help account' for usage information" << std::endl;
        return {};
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }

    if (cmd.subcommand == "create") {
        return executeAccountCreate(cmd);
    } else if (cmd.subcommand == "show") {
        return executeAccountShow(cmd);
    } else if (cmd.subcommand == "list") {
        return executeAccountList(cmd);
    } else {
        return std::unexpected("Unknown account subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executeAccountCreate(const ParsedCommand& cmd)
{
    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }
    auto startingBalance = getRequiredOption<double>(cmd, "starting-balance");
    if (!startingBalance) {
        return std::unexpected(startingBalance.error());
    }

    // llround вне диапазона Cents не определен
    if (!std::isfinite(*startingBalance) || *startingBalance < 0.0 ||
        *startingBalance * 100.0 >= static_cast<double>(std::numeric_limits<Cents>::max())) {
        return reportError(cmd, Error{ErrorKind::InvalidInput,
                                      "Starting balance must be a finite non-negative amount"});
    }

    auto account = ledger_->createAccount(*userId, toCents(*startingBalance), clock_->now());
    if (!account) {
        return reportError(cmd, account.error());
    }

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(*account).dump(2) << std::endl;
        return {};
    }

    std::cout << "✓ Account '" << account->userId << "' created" << std::endl;
    std::cout << "  Cash balance: " << formatMoney(account->cashBalance) << std::endl;
    return {};
}

std::expected<void, std::string> CommandExecutor::executeAccountShow(const ParsedCommand& cmd)
{
    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }

    auto account = ledger_->readAccount(*userId);
    if (!account) {
        return reportError(cmd, account.error());
    }

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(*account).dump(2) << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "Account: " << account->userId << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Cash balance:     " << formatMoney(account->cashBalance) << std::endl;
    std::cout << "Starting balance: " << formatMoney(account->startingBalance) << std::endl;
    std::cout << "Created at:       "
              << SnapshotSerializer::formatTimestamp(account->createdAt) << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    return {};
}

std::expected<void, std::string> CommandExecutor::executeAccountList(const ParsedCommand& cmd)
{
    auto accounts = ledger_->listAccounts();
    if (!accounts) {
        return reportError(cmd, accounts.error());
    }

    if (wantsJson(cmd)) {
        std::cout << json(*accounts).dump(2) << std::endl;
        return {};
    }

    if (accounts->empty()) {
        std::cout << "No accounts found." << std::endl;
        return {};
    }

    std::cout << "Accounts (" << accounts->size() << "):" << std::endl;
    for (const auto& userId : *accounts) {
        std::cout << "  " << userId << std::endl;
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Trade
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executeTrade(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'brokerage help trade' for usage information" << std::endl;
        return {};
    }

    TransactionType type = parseTransactionType(cmd.subcommand);
    if (type == TransactionType::Unknown) {
        return std::unexpected("Unknown trade subcommand: " + cmd.subcommand +
                               " (expected buy or sell)");
    }

    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }
    auto symbol = getRequiredOption<std::string>(cmd, "symbol");
    if (!symbol) {
        return std::unexpected(symbol.error());
    }
    auto quantity = getRequiredOption<std::int64_t>(cmd, "quantity");
    if (!quantity) {
        return std::unexpected(quantity.error());
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }
    ensured = ensureOracle(cmd);
    if (!ensured) {
        return ensured;
    }

    TradeRequest request;
    request.userId = *userId;
    request.symbol = *symbol;
    request.type = type;
    request.quantity = *quantity;

    if (cmd.options.count("timeout-ms")) {
        auto timeoutMs = cmd.options.at("timeout-ms").as<std::int64_t>();
        if (timeoutMs <= 0) {
            return std::unexpected("Option '--timeout-ms' must be positive");
        }
        request.deadline = clock_->now() + std::chrono::milliseconds(timeoutMs);
    }

    TradeExecutionEngine engine(ledger_, oracle_, clock_);
    auto receipt = engine.executeTrade(request);
    if (!receipt) {
        return reportError(cmd, receipt.error());
    }

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(*receipt).dump(2) << std::endl;
        return {};
    }

    std::cout << "✓ " << toString(receipt->type) << " " << receipt->quantity << " "
              << receipt->symbol << " @ " << formatMoney(receipt->price) << std::endl;
    std::cout << "  Transaction ID: " << receipt->transactionId << std::endl;
    std::cout << "  Total amount:   " << formatMoney(receipt->totalAmount) << std::endl;
    std::cout << "  New balance:    " << formatMoney(receipt->newBalance) << std::endl;
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Reports
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executePortfolio(const ParsedCommand& cmd)
{
    if (!cmd.subcommand.empty() && cmd.subcommand != "show") {
        return std::unexpected("Unknown portfolio subcommand: " + cmd.subcommand);
    }

    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }
    ensured = ensureOracle(cmd);
    if (!ensured) {
        return ensured;
    }

    PortfolioService service(ledger_, oracle_, clock_);
    auto portfolio = service.getPortfolio(*userId);
    if (!portfolio) {
        return reportError(cmd, portfolio.error());
    }

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(*portfolio).dump(2) << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "Portfolio: " << *userId << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    if (portfolio->positions.empty()) {
        std::cout << "No open positions." << std::endl;
    } else {
        std::cout << std::left << std::setw(8) << "Symbol"
                  << std::right << std::setw(8) << "Qty"
                  << std::setw(12) << "Avg cost"
                  << std::setw(12) << "Price"
                  << std::setw(14) << "Value"
                  << std::setw(10) << "Gain %" << std::endl;
        std::cout << std::string(70, '-') << std::endl;

        for (const auto& position : portfolio->positions) {
            std::cout << std::left << std::setw(8) << position.symbol
                      << std::right << std::setw(8) << position.netQuantity
                      << std::setw(12) << formatMoney(position.avgCost)
                      << std::setw(12) << formatMoney(position.currentPrice)
                      << std::setw(14) << formatMoney(position.marketValue)
                      << std::setw(10) << formatMoney(position.gainPercent) << std::endl;
        }
        std::cout << std::string(70, '-') << std::endl;
    }

    std::cout << "Cash:         " << formatMoney(portfolio->balance) << std::endl;
    std::cout << "Market value: " << formatMoney(portfolio->totalMarketValue) << std::endl;
    std::cout << "Total equity: " << formatMoney(portfolio->totalEquity) << std::endl;
    std::cout << "Return:       " << formatMoney(portfolio->totalReturn)
              << " (" << formatMoney(portfolio->totalReturnPercent) << "%)" << std::endl;

    for (const auto& symbol : portfolio->degradedSymbols) {
        std::cout << "⚠ " << symbol << ": no current price, excluded from valuation"
                  << std::endl;
    }
    std::cout << std::string(70, '=') << std::endl;
    return {};
}

std::expected<void, std::string> CommandExecutor::executeEquity(const ParsedCommand& cmd)
{
    if (!cmd.subcommand.empty() && cmd.subcommand != "show") {
        return std::unexpected("Unknown equity subcommand: " + cmd.subcommand);
    }

    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }

    auto ledger = ledger_->readSnapshot(*userId);
    if (!ledger) {
        return reportError(cmd, ledger.error());
    }

    EquityCurveBuilder builder(clock_);
    auto curve = builder.build(ledger->account.startingBalance, ledger->transactions);

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(curve).dump(2) << std::endl;
        return {};
    }

    std::cout << "Equity curve: " << *userId << " (" << curve.size() << " points)" << std::endl;
    for (const auto& point : curve) {
        std::cout << "  " << SnapshotSerializer::formatTimestamp(point.timestamp)
                  << "  " << formatMoney(point.equity) << std::endl;
    }
    return {};
}

std::expected<void, std::string> CommandExecutor::executePnL(const ParsedCommand& cmd)
{
    if (!cmd.subcommand.empty() && cmd.subcommand != "show") {
        return std::unexpected("Unknown pnl subcommand: " + cmd.subcommand);
    }

    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }

    auto ledger = ledger_->readSnapshot(*userId);
    if (!ledger) {
        return reportError(cmd, ledger.error());
    }

    EquityCurveBuilder builder(clock_);
    auto curve = builder.buildPnL(ledger->account.startingBalance, ledger->transactions);

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(curve).dump(2) << std::endl;
        return {};
    }

    std::cout << "P&L curve: " << *userId << " (" << curve.size() << " points)" << std::endl;
    for (const auto& point : curve) {
        std::cout << "  " << SnapshotSerializer::formatTimestamp(point.timestamp)
                  << "  " << formatMoney(point.pnl) << std::endl;
    }
    return {};
}

std::expected<void, std::string> CommandExecutor::executeSnapshot(const ParsedCommand& cmd)
{
    if (!cmd.subcommand.empty() && cmd.subcommand != "show") {
        return std::unexpected("Unknown snapshot subcommand: " + cmd.subcommand);
    }

    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }

    AnalyticsConfig config;
    if (cmd.options.count("risk-free-rate")) {
        config.riskFreeRate = cmd.options.at("risk-free-rate").as<double>();
    }

    std::chrono::seconds ttl{0};
    if (cmd.options.count("sector-cache-ttl")) {
        auto seconds = cmd.options.at("sector-cache-ttl").as<std::int64_t>();
        if (seconds < 0) {
            return std::unexpected("Option '--sector-cache-ttl' must not be negative");
        }
        ttl = std::chrono::seconds(seconds);
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }
    ensured = ensureOracle(cmd);
    if (!ensured) {
        return ensured;
    }

    auto service = std::make_shared<PortfolioService>(ledger_, oracle_, clock_);
    auto sectors = std::make_shared<SectorCache>(oracle_, ttl, clock_);
    AnalyticsEngine analytics(service, sectors, config);

    auto snapshot = analytics.buildSnapshot(*userId);
    if (!snapshot) {
        return reportError(cmd, snapshot.error());
    }

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(*snapshot).dump(2) << std::endl;
        return {};
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "Portfolio Snapshot: " << *userId << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Total equity:       " << formatMoney(snapshot->totalEquity) << std::endl;
    std::cout << "Total return:       " << snapshot->displayTotalReturnPct << std::endl;
    std::cout << "Cash allocation:    " << snapshot->cashAllocationPct << "%" << std::endl;

    if (snapshot->largestPosition) {
        std::cout << "Largest position:   " << snapshot->largestPosition->symbol
                  << " (" << snapshot->largestPosition->allocationPct << "%)" << std::endl;
    }
    std::cout << "Concentration risk: "
              << toString(snapshot->concentrationRiskLevel) << std::endl;
    std::cout << "Volatility:         " << snapshot->volatility << std::endl;
    std::cout << "Sharpe ratio:       " << snapshot->sharpeRatio << std::endl;

    if (snapshot->topGainer) {
        std::cout << "Top gainer:         " << *snapshot->topGainer << std::endl;
    }
    if (snapshot->topLoser) {
        std::cout << "Top loser:          " << *snapshot->topLoser << std::endl;
    }

    if (!snapshot->sectorBreakdown.empty()) {
        std::cout << "\n" << std::string(70, '-') << std::endl;
        std::cout << "SECTORS:" << std::endl;
        std::cout << std::string(70, '-') << std::endl;
        for (const auto& sector : snapshot->sectorBreakdown) {
            std::cout << "  " << std::left << std::setw(24) << sector.sector
                      << std::right << sector.allocationPct << "%" << std::endl;
        }
    }
    std::cout << std::string(70, '=') << std::endl;
    return {};
}

std::expected<void, std::string> CommandExecutor::executeTransactions(const ParsedCommand& cmd)
{
    if (!cmd.subcommand.empty() && cmd.subcommand != "list") {
        return std::unexpected("Unknown transactions subcommand: " + cmd.subcommand);
    }

    auto userId = getRequiredOption<std::string>(cmd, "user");
    if (!userId) {
        return std::unexpected(userId.error());
    }

    auto ensured = ensureLedger(cmd);
    if (!ensured) {
        return ensured;
    }

    auto transactions = ledger_->readTransactions(*userId);
    if (!transactions) {
        return reportError(cmd, transactions.error());
    }

    if (wantsJson(cmd)) {
        std::cout << SnapshotSerializer::toJson(*transactions).dump(2) << std::endl;
        return {};
    }

    if (transactions->empty()) {
        std::cout << "No transactions for '" << *userId << "'." << std::endl;
        return {};
    }

    std::cout << std::left << std::setw(6) << "ID"
              << std::setw(26) << "Time"
              << std::setw(6) << "Type"
              << std::setw(8) << "Symbol"
              << std::right << std::setw(8) << "Qty"
              << std::setw(12) << "Price"
              << std::setw(14) << "Total" << std::endl;
    std::cout << std::string(80, '-') << std::endl;

    for (const auto& txn : *transactions) {
        std::string time = txn.createdAt
            ? SnapshotSerializer::formatTimestamp(*txn.createdAt)
            : "-";
        std::cout << std::left << std::setw(6) << txn.id
                  << std::setw(26) << time
                  << std::setw(6) << toString(txn.type)
                  << std::setw(8) << txn.symbol
                  << std::right << std::setw(8) << txn.quantity
                  << std::setw(12) << formatMoney(txn.price)
                  << std::setw(14) << formatMoney(txn.totalAmount) << std::endl;
    }
    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Plugin Management
// ═════════════════════════════════════════════════════════════════════════════

std::expected<void, std::string> CommandExecutor::executePlugin(const ParsedCommand& cmd)
{
    if (cmd.subcommand.empty()) {
        std::cout << "Use 'brokerage help plugin' for usage information" << std::endl;
        return {};
    }

    if (cmd.subcommand == "list") {
        return executePluginList(cmd);
    } else if (cmd.subcommand == "info") {
        return executePluginInfo(cmd);
    } else {
        return std::unexpected("Unknown plugin subcommand: " + cmd.subcommand);
    }
}

std::expected<void, std::string> CommandExecutor::executePluginList(
    const ParsedCommand& cmd)
{
    std::string typeFilter;
    if (cmd.options.count("type")) {
        typeFilter = cmd.options.at("type").as<std::string>();
    } else if (!cmd.positional.empty()) {
        typeFilter = cmd.positional[0];
    }

    if (!typeFilter.empty() && typeFilter != "ledger" && typeFilter != "oracle") {
        return std::unexpected("Unknown plugin type: " + typeFilter +
                               " (available: ledger, oracle)");
    }

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "Available Plugins" << std::endl;
    std::cout << std::string(70, '=') << std::endl;
    std::cout << "Plugin path: " << ledgerPluginManager_->getPluginPath() << std::endl;
    std::cout << std::string(70, '=') << std::endl << std::endl;

    std::size_t total = 0;
    if (typeFilter.empty() || typeFilter == "ledger") {
        printPluginGroup("Ledger", ledgerPluginManager_.get(), total);
    }
    if (typeFilter.empty() || typeFilter == "oracle") {
        printPluginGroup("Oracle", oraclePluginManager_.get(), total);
    }

    if (total == 0) {
        std::cout << "No plugins found." << std::endl;
        std::cout << "Set BROKERAGE_PLUGIN_PATH environment variable to change the search path."
                  << std::endl;
    } else {
        std::cout << "Total: " << total << " plugin(s)" << std::endl;
    }
    std::cout << std::string(70, '=') << std::endl << std::endl;
    return {};
}

std::expected<void, std::string> CommandExecutor::executePluginInfo(
    const ParsedCommand& cmd)
{
    std::string pluginName;
    if (cmd.options.count("name")) {
        pluginName = cmd.options.at("name").as<std::string>();
    } else if (!cmd.positional.empty()) {
        pluginName = cmd.positional[0];
    }

    if (pluginName.empty()) {
        return std::unexpected(
            "Plugin name is required.\n"
            "Usage: brokerage plugin info <plugin_name>\n"
            "       brokerage plugin info --name <plugin_name>\n"
            "\n"
            "Use 'brokerage plugin list' to see available plugins.");
    }

    if (printPluginInfoIfFound(pluginName, "LEDGER", ledgerPluginManager_.get())) {
        return {};
    }
    if (printPluginInfoIfFound(pluginName, "ORACLE", oraclePluginManager_.get())) {
        return {};
    }

    return std::unexpected("Plugin '" + pluginName + "' not found.\n"
                           "Use 'brokerage plugin list' to see available plugins.");
}

}  // namespace brokerage
