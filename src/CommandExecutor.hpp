#pragma once

#include "CommandLineParser.hpp"
#include "ILedgerStore.hpp"
#include "IPriceOracle.hpp"
#include "Clock.hpp"
#include "PluginManager.hpp"
#include <memory>
#include <expected>
#include <iostream>
#include <sstream>

namespace brokerage {

class CommandExecutor {
public:
    // Хранилище и оракул можно передать напрямую (тесты),
    // иначе они загружаются плагинами по --ledger / --oracle
    explicit CommandExecutor(
        std::shared_ptr<ILedgerStore> ledger = nullptr,
        std::shared_ptr<IPriceOracle> oracle = nullptr,
        std::shared_ptr<const IClock> clock = nullptr);
    ~CommandExecutor();

    std::expected<void, std::string> execute(const ParsedCommand& cmd);

    // Для вывода опций плагинов в справке
    void setCommandLineParser(std::shared_ptr<CommandLineParser> parser) noexcept {
        parser_ = parser;
    }

private:
    // Менеджеры объявлены раньше экземпляров плагинов: выгружаются последними
    std::unique_ptr<PluginManager<ILedgerStore>> ledgerPluginManager_;
    std::unique_ptr<PluginManager<IPriceOracle>> oraclePluginManager_;

    std::shared_ptr<ILedgerStore> ledger_;
    std::shared_ptr<IPriceOracle> oracle_;
    std::shared_ptr<const IClock> clock_;
    std::shared_ptr<CommandLineParser> parser_;

    // Backend
    std::expected<void, std::string> ensureLedger(const ParsedCommand& cmd);
    std::expected<void, std::string> ensureOracle(const ParsedCommand& cmd);

    // Help & Version
    std::expected<void, std::string> executeHelp(const ParsedCommand& cmd);
    std::expected<void, std::string> executeVersion(const ParsedCommand& cmd);
    void printHelp(const ParsedCommand& cmd);
    void printVersion() const;
    void printPluginOptions(const std::vector<std::string>& pluginNames,
                            std::string_view command);

    // Account
    std::expected<void, std::string> executeAccount(const ParsedCommand& cmd);
    std::expected<void, std::string> executeAccountCreate(const ParsedCommand& cmd);
    std::expected<void, std::string> executeAccountShow(const ParsedCommand& cmd);
    std::expected<void, std::string> executeAccountList(const ParsedCommand& cmd);

    // Trade
    std::expected<void, std::string> executeTrade(const ParsedCommand& cmd);

    // Reports
    std::expected<void, std::string> executePortfolio(const ParsedCommand& cmd);
    std::expected<void, std::string> executeEquity(const ParsedCommand& cmd);
    std::expected<void, std::string> executePnL(const ParsedCommand& cmd);
    std::expected<void, std::string> executeSnapshot(const ParsedCommand& cmd);
    std::expected<void, std::string> executeTransactions(const ParsedCommand& cmd);

    // Plugin Management
    std::expected<void, std::string> executePlugin(const ParsedCommand& cmd);
    std::expected<void, std::string> executePluginList(const ParsedCommand& cmd);
    std::expected<void, std::string> executePluginInfo(const ParsedCommand& cmd);

    // Utility methods
    template<typename T>
    std::expected<T, std::string> getRequiredOption(
        const ParsedCommand& cmd,
        std::string_view optionName) const;

    static bool wantsJson(const ParsedCommand& cmd);

    // Ошибка домена: JSON в stdout при --json, текст наверх в main
    std::expected<void, std::string> reportError(
        const ParsedCommand& cmd,
        const Error& error) const;

    template<typename PluginInterface>
    bool printPluginInfoIfFound(
        std::string_view pluginName,
        std::string_view displayTypeName,
        PluginManager<PluginInterface>* manager);

    template<typename PluginInterface>
    void printPluginGroup(
        std::string_view title,
        PluginManager<PluginInterface>* manager,
        std::size_t& total);
};

// Template implementation
template<typename T>
std::expected<T, std::string> CommandExecutor::getRequiredOption(
    const ParsedCommand& cmd,
    std::string_view optionName) const {

    std::string optName(optionName);
    if (!cmd.options.count(optName)) {
        return std::unexpected(
            "Required option '--" + optName + "' is missing");
    }

    try {
        return cmd.options.at(optName).as<T>();
    } catch (const std::exception& e) {
        return std::unexpected(
            "Invalid value for option '--" + optName + "': " + e.what());
    }
}

template<typename PluginInterface>
bool CommandExecutor::printPluginInfoIfFound(
    std::string_view pluginName,
    std::string_view displayTypeName,
    PluginManager<PluginInterface>* manager)
{
    auto plugins = manager->scanAvailablePlugins();
    std::string pluginNameStr(pluginName);

    for (const auto& plugin : plugins) {
        if (plugin.name != pluginNameStr && plugin.systemName != pluginNameStr) {
            continue;
        }

        std::cout << "\n" << std::string(70, '=') << std::endl;
        std::cout << displayTypeName << " PLUGIN: "
                  << plugin.displayName << " v" << plugin.version << std::endl;
        std::cout << std::string(70, '=') << std::endl;
        std::cout << "System name: " << plugin.systemName << std::endl;
        std::cout << "Type:        " << plugin.type << std::endl;
        std::cout << "Path:        " << plugin.path << std::endl;

        if (!plugin.description.empty()) {
            std::cout << "\nDescription:\n  " << plugin.description << std::endl;
        }

        // ════════════════════════════════════════════════════════════════
        // Опции командной строки плагина
        // ════════════════════════════════════════════════════════════════

        auto metadataResult = manager->getPluginCommandLineMetadata(pluginNameStr);
        if (metadataResult && metadataResult->commandLineOptions) {
            std::cout << "\n" << std::string(70, '-') << std::endl;
            std::cout << "COMMAND LINE OPTIONS:" << std::endl;
            std::cout << std::string(70, '-') << std::endl;

            std::ostringstream oss;
            oss << *metadataResult->commandLineOptions;

            std::istringstream iss(oss.str());
            std::string line;
            while (std::getline(iss, line)) {
                if (!line.empty()) {
                    std::cout << "  " << line << std::endl;
                }
            }
        }

        if (!plugin.examples.empty()) {
            std::cout << "\n" << std::string(70, '-') << std::endl;
            std::cout << "EXAMPLES:" << std::endl;
            std::cout << std::string(70, '-') << std::endl;
            for (const auto& example : plugin.examples) {
                if (!example.empty() && example[0] == '#') {
                    std::cout << "  " << example << std::endl;
                } else {
                    std::cout << "  $ " << example << std::endl;
                }
            }
        }

        std::cout << std::string(70, '=') << std::endl << std::endl;
        return true;
    }

    return false;
}

template<typename PluginInterface>
void CommandExecutor::printPluginGroup(
    std::string_view title,
    PluginManager<PluginInterface>* manager,
    std::size_t& total)
{
    auto plugins = manager->scanAvailablePlugins();
    if (plugins.empty()) {
        return;
    }

    std::cout << title << " Plugins (" << plugins.size() << "):" << std::endl;
    std::cout << std::string(70, '-') << std::endl;

    for (const auto& plugin : plugins) {
        std::cout << "  Name:        " << plugin.displayName << std::endl;
        std::cout << "  Version:     " << plugin.version << std::endl;
        std::cout << "  System name: " << plugin.systemName << std::endl;
        std::cout << "  Path:        " << plugin.path << std::endl;
        std::cout << std::endl;
    }

    total += plugins.size();
}

}  // namespace brokerage
