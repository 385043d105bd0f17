#include "CommandLineParser.hpp"
#include "RiskMetrics.hpp"
#include <iostream>
#include <sstream>

namespace brokerage {

CommandLineParser::CommandLineParser(
    std::shared_ptr<PluginManager<ILedgerStore>> ledgerPluginManager,
    std::shared_ptr<PluginManager<IPriceOracle>> oraclePluginManager)
    : ledgerPluginManager_(ledgerPluginManager),
    oraclePluginManager_(oraclePluginManager) {
}

bool CommandLineParser::commandHasSubcommands(std::string_view command) noexcept {
    return command == "account" ||
           command == "trade" ||
           command == "portfolio" ||
           command == "equity" ||
           command == "pnl" ||
           command == "snapshot" ||
           command == "transactions" ||
           command == "plugin";
}

std::expected<ParsedCommand, std::string> CommandLineParser::parse(
    int argc,
    char* argv[]) {

    if (argc < 2) {
        return std::unexpected(
            "No command specified. Use 'brokerage help' for usage information.");
    }

    ParsedCommand result;
    result.command = argv[1];

    try {
        // ═════════════════════════════════════════════════════════════════════
        // Глобальный help с обработкой --with
        // ═════════════════════════════════════════════════════════════════════

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg != "help" && arg != "--help" && arg != "-h") {
                continue;
            }

            if (i == 1) {
                result.command = "help";
                for (int j = 2; j < argc; ++j) {
                    std::string currentArg = argv[j];
                    if (currentArg == "--with") {
                        if (j + 1 < argc) {
                            result.pluginNames.push_back(argv[j + 1]);
                            ++j;
                        }
                    } else if (!currentArg.empty() && currentArg[0] != '-') {
                        result.positional.push_back(currentArg);
                    }
                }
            } else {
                result.positional.push_back(result.command);
                result.command = "help";
                if (argc > 2 && argv[2][0] != '-') {
                    result.positional.push_back(argv[2]);
                }
                for (int j = 3; j < argc; ++j) {
                    std::string currentArg = argv[j];
                    if (currentArg == "--with" && j + 1 < argc) {
                        result.pluginNames.push_back(argv[j + 1]);
                        ++j;
                    }
                }
            }

            // Не более одного плагина каждого типа
            if (result.pluginNames.size() > 2) {
                return std::unexpected("Too many --with options (maximum 2)");
            }

            std::map<std::string, std::string> typeToPlugin;
            for (const auto& pluginName : result.pluginNames) {
                auto typeResult = getPluginType(pluginName);
                if (!typeResult) {
                    return std::unexpected("Unknown plugin: " + pluginName);
                }
                const auto& pluginType = typeResult.value();
                if (typeToPlugin.count(pluginType)) {
                    std::ostringstream oss;
                    oss << "Multiple plugins of the same type specified: "
                        << typeToPlugin[pluginType] << " and " << pluginName
                        << " are both " << pluginType << " plugins";
                    return std::unexpected(oss.str());
                }
                typeToPlugin[pluginType] = pluginName;
            }

            return result;
        }

        int startIdx = 2;
        if (commandHasSubcommands(result.command) && argc > 2 && argv[2][0] != '-') {
            result.subcommand = argv[2];
            startIdx = 3;
        }

        std::vector<std::string> args(argv + startIdx, argv + argc);

        if (result.command == "account") {
            auto desc = createAccountOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "trade") {
            auto desc = createTradeOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "portfolio" ||
                   result.command == "equity" ||
                   result.command == "pnl" ||
                   result.command == "snapshot" ||
                   result.command == "transactions") {
            auto desc = createReportOptions();
            po::store(po::command_line_parser(args).options(desc).run(),
                      result.options);
            po::notify(result.options);

        } else if (result.command == "plugin") {
            auto desc = createPluginOptions();

            auto parsed = po::command_line_parser(args)
                              .options(desc)
                              .allow_unregistered()
                              .run();

            po::store(parsed, result.options);
            po::notify(result.options);

            std::vector<std::string> unrecognized =
                po::collect_unrecognized(parsed.options,
                                         po::include_positional);

            for (const auto& arg : unrecognized) {
                if (!arg.empty() && arg[0] != '-') {
                    result.positional.push_back(arg);
                }
            }

        } else if (result.command == "version") {
            for (int i = startIdx; i < argc; ++i) {
                result.positional.push_back(argv[i]);
            }
        } else {
            return std::unexpected("Unknown command: " + result.command);
        }

        return result;

    } catch (const po::error& e) {
        return std::unexpected(std::string("Command line parsing error: ") +
                               e.what());
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Опции хранилища и оракула + опции найденных плагинов
// ═════════════════════════════════════════════════════════════════════════════

template<typename PluginInterface>
void CommandLineParser::addPluginOptions(
    po::options_description& desc,
    const std::shared_ptr<PluginManager<PluginInterface>>& manager) {

    if (!manager) {
        return;
    }

    try {
        for (const auto& metadata : manager->getAllPluginMetadata()) {
            if (metadata.commandLineOptions) {
                desc.add(*metadata.commandLineOptions);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "⚠ Failed to read "
                  << PluginTypeTraits<PluginInterface>::typeName()
                  << " plugin options: " << e.what() << std::endl;
    }
}

po::options_description CommandLineParser::createBackendOptions(bool withOracle) {
    po::options_description desc("Backend options");
    desc.add_options()
        ("ledger", po::value<std::string>()->default_value("sqlite_ledger"),
         "Ledger plugin name (e.g., sqlite_ledger, inmemory_ledger)");

    if (withOracle) {
        desc.add_options()
            ("oracle", po::value<std::string>()->default_value("csv_quotes"),
             "Price oracle plugin name (e.g., csv_quotes)");
    }

    addPluginOptions(desc, ledgerPluginManager_);
    if (withOracle) {
        addPluginOptions(desc, oraclePluginManager_);
    }
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Account Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createAccountOptions() {
    po::options_description desc("Account options");
    desc.add_options()
        ("user,u", po::value<std::string>(),
         "User id")

        ("starting-balance", po::value<double>()->default_value(
             fromCents(kDefaultStartingBalance)),
         "Starting cash balance for a new account")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("help,h", "Show help message");

    desc.add(createBackendOptions(false));
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Trade Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createTradeOptions() {
    po::options_description desc("Trade options");
    desc.add_options()
        ("user,u", po::value<std::string>(),
         "User id")

        ("symbol,s", po::value<std::string>(),
         "Ticker symbol")

        ("quantity,q", po::value<std::int64_t>(),
         "Number of shares (>= 1)")

        ("timeout-ms", po::value<std::int64_t>(),
         "Abort the trade if it cannot commit within this many milliseconds")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("help,h", "Show help message");

    desc.add(createBackendOptions(true));
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Report Options: portfolio, equity, pnl, snapshot, transactions
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createReportOptions() {
    po::options_description desc("Report options");
    desc.add_options()
        ("user,u", po::value<std::string>(),
         "User id")

        ("json", po::bool_switch()->default_value(false),
         "Print result as JSON")

        ("risk-free-rate", po::value<double>()->default_value(
             RiskMetrics::kDefaultRiskFreeRate),
         "Annual risk-free rate for the Sharpe ratio")

        ("sector-cache-ttl", po::value<std::int64_t>()->default_value(0),
         "Sector cache lifetime in seconds (0 = unbounded)")

        ("help,h", "Show help message");

    desc.add(createBackendOptions(true));
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Plugin Options
// ═════════════════════════════════════════════════════════════════════════════

po::options_description CommandLineParser::createPluginOptions() {
    po::options_description desc("Plugin options");
    desc.add_options()
        ("name,n", po::value<std::string>(),
         "Plugin name (for info command)")

        ("type,t", po::value<std::string>(),
         "Filter by plugin type: ledger, oracle (for list command)")

        ("help,h", "Show help message");
    return desc;
}

// ═════════════════════════════════════════════════════════════════════════════
// Опции плагинов для справки
// ═════════════════════════════════════════════════════════════════════════════

std::expected<po::options_description, std::string>
CommandLineParser::getPluginOptions(std::string_view pluginName) {

    if (ledgerPluginManager_) {
        auto metadata = ledgerPluginManager_->getPluginCommandLineMetadata(pluginName);
        if (metadata && metadata->commandLineOptions) {
            return *metadata->commandLineOptions;
        }
    }

    if (oraclePluginManager_) {
        auto metadata = oraclePluginManager_->getPluginCommandLineMetadata(pluginName);
        if (metadata && metadata->commandLineOptions) {
            return *metadata->commandLineOptions;
        }
    }

    return std::unexpected("Plugin not found or has no command line options: " +
                           std::string(pluginName));
}

std::expected<std::string, std::string>
CommandLineParser::getPluginType(std::string_view pluginName) const {

    if (ledgerPluginManager_ &&
        ledgerPluginManager_->getPluginCommandLineMetadata(pluginName)) {
        return std::string(PluginTypeTraits<ILedgerStore>::typeName());
    }

    if (oraclePluginManager_ &&
        oraclePluginManager_->getPluginCommandLineMetadata(pluginName)) {
        return std::string(PluginTypeTraits<IPriceOracle>::typeName());
    }

    return std::unexpected("Unknown plugin: " + std::string(pluginName));
}

bool CommandLineParser::commandUsesPluginType(
    std::string_view command,
    [[maybe_unused]] std::string_view subcommand,
    std::string_view pluginType) const noexcept {

    if (pluginType == "ledger") {
        return command == "account" || command == "trade" ||
               command == "portfolio" || command == "equity" ||
               command == "pnl" || command == "snapshot" ||
               command == "transactions";
    }

    // Живые цены нужны для сделок и оценки позиций
    if (pluginType == "oracle") {
        return command == "trade" || command == "portfolio" || command == "snapshot";
    }

    return false;
}

}  // namespace brokerage
