#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <expected>
#include "PluginManager.hpp"
#include "ILedgerStore.hpp"
#include "IPriceOracle.hpp"

namespace po = boost::program_options;

namespace brokerage {

struct ParsedCommand {
    std::string command;
    std::string subcommand;
    po::variables_map options;
    std::vector<std::string> positional;
    std::vector<std::string> pluginNames;  // Плагины из опции --with для справки
};

class CommandLineParser {
public:
    explicit CommandLineParser(
        std::shared_ptr<PluginManager<ILedgerStore>> ledgerPluginManager = nullptr,
        std::shared_ptr<PluginManager<IPriceOracle>> oraclePluginManager = nullptr);

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    // Описания опций команд (с опциями найденных плагинов)
    po::options_description createAccountOptions();
    po::options_description createTradeOptions();
    po::options_description createReportOptions();
    po::options_description createPluginOptions();

    // ═════════════════════════════════════════════════════════════════════════
    // Опции плагинов для справки
    // ═════════════════════════════════════════════════════════════════════════

    std::expected<po::options_description, std::string> getPluginOptions(
        std::string_view pluginName);

    // Нужен ли команде плагин данного типа (ledger, oracle)
    bool commandUsesPluginType(
        std::string_view command,
        std::string_view subcommand,
        std::string_view pluginType) const noexcept;

    std::expected<std::string, std::string> getPluginType(
        std::string_view pluginName) const;

    static bool commandHasSubcommands(std::string_view command) noexcept;

private:
    std::shared_ptr<PluginManager<ILedgerStore>> ledgerPluginManager_;
    std::shared_ptr<PluginManager<IPriceOracle>> oraclePluginManager_;

    po::options_description createBackendOptions(bool withOracle);

    template<typename PluginInterface>
    void addPluginOptions(
        po::options_description& desc,
        const std::shared_ptr<PluginManager<PluginInterface>>& manager);
};

}  // namespace brokerage
