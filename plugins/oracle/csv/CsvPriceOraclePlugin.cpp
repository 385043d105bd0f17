#include "CsvPriceOracle.hpp"
#include <iostream>
#include <boost/program_options.hpp>

#ifdef _WIN32
#define PLUGIN_API __declspec(dllexport)
#else
#define PLUGIN_API __attribute__((visibility("default")))
#endif

namespace po = boost::program_options;

extern "C" {

// ═══════════════════════════════════════════════════════════════════════════════
// Command Line Options Metadata
// ═══════════════════════════════════════════════════════════════════════════════

// Возвращает указатель на статически размещенный options_description
// Вызывающая сторона НЕ должна удалять возвращенный указатель
PLUGIN_API const po::options_description* getCommandLineOptions() {
    static po::options_description* quoteOptions = nullptr;

    if (!quoteOptions) {
        quoteOptions = new po::options_description("CSV Quotes Options");
        quoteOptions->add_options()
            ("quotes-file", po::value<std::string>(),
             "Path to quotes CSV file (symbol,price[,sector])")

            ("quotes-delimiter", po::value<char>()->default_value(','),
             "CSV delimiter character (default: ',')")

            ("quotes-skip-header", po::value<bool>()->default_value(true),
             "Skip first line as header (default: true)");
    }

    return quoteOptions;
}

PLUGIN_API const char* getPluginDescription() {
    return "Current prices and sectors from a CSV quotes file";
}

PLUGIN_API const char* getPluginExamples() {
    return
        "# quotes.csv:\n"
        "#   symbol,price,sector\n"
        "#   AAPL,150.00,Technology\n"
        "brokerage trade buy --user alice --symbol AAPL --quantity 10 "
        "--oracle csv_quotes --quotes-file quotes.csv "
        "--sqlite-path ./ledger.db\n"
        "\n"
        "# Semicolon-separated file:\n"
        "brokerage portfolio show --user alice "
        "--quotes-file quotes.csv --quotes-delimiter ';' "
        "--sqlite-path ./ledger.db";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Creation Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API brokerage::IPriceOracle* createPriceOracle(const char* /* config */) {
    try {
        return new brokerage::CsvPriceOracle();
    } catch (const std::exception& e) {
        std::cerr << "Failed to create CsvPriceOracle: " << e.what() << std::endl;
        return nullptr;
    }
}

PLUGIN_API void destroyPriceOracle(brokerage::IPriceOracle* oracle) {
    delete oracle;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Metadata Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API const char* getPluginName() {
    return "CsvPriceOracle";
}

PLUGIN_API const char* getPluginVersion() {
    return "1.0.0";
}

PLUGIN_API const char* getPluginType() {
    return "oracle";
}

// Системное имя плагина (используется в --oracle)
PLUGIN_API const char* getPluginSystemName() {
    return "csv_quotes";
}

}  // extern "C"
