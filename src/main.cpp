#include "CommandLineParser.hpp"
#include "CommandExecutor.hpp"
#include "PluginManager.hpp"
#include "ILedgerStore.hpp"
#include "IPriceOracle.hpp"
#include <iostream>
#include <memory>

using namespace brokerage;

int main(int argc, char** argv)
{
    try {
        // ═════════════════════════════════════════════════════════════════════
        // PluginManager'ы для опций плагинов (хранилища и оракулы)
        // ═════════════════════════════════════════════════════════════════════

        std::string searchPath = defaultPluginPath();

        auto ledgerPluginManager =
            std::make_shared<PluginManager<ILedgerStore>>(searchPath);
        auto oraclePluginManager =
            std::make_shared<PluginManager<IPriceOracle>>(searchPath);

        auto parser = std::make_shared<CommandLineParser>(
            ledgerPluginManager,
            oraclePluginManager);

        auto parseResult = parser->parse(argc, argv);

        if (!parseResult) {
            std::cerr << "✗ Parse error: " << parseResult.error() << std::endl;
            return 1;
        }

        const auto& cmd = parseResult.value();

        CommandExecutor executor;
        executor.setCommandLineParser(parser);

        auto execResult = executor.execute(cmd);

        if (!execResult) {
            std::cerr << "✗ Error: " << execResult.error() << std::endl;
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "✗ Exception: " << e.what() << std::endl;
        return 1;
    }
}
