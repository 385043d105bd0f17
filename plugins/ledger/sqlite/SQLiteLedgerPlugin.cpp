#include "SQLiteLedgerStore.hpp"
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
    static po::options_description* sqliteOptions = nullptr;

    if (!sqliteOptions) {
        sqliteOptions = new po::options_description("SQLite Ledger Options");
        sqliteOptions->add_options()
            ("sqlite-path", po::value<std::string>(),
             "Path to SQLite ledger file. "
             "File will be created if it doesn't exist. "
             "Example: --sqlite-path ./ledger.db");
    }

    return sqliteOptions;
}

PLUGIN_API const char* getPluginDescription() {
    return "Persistent ledger in a SQLite database with append-only transaction log";
}

// Примеры, разделенные '\n'
PLUGIN_API const char* getPluginExamples() {
    return
        "# Open an account:\n"
        "brokerage account create --user alice "
        "--ledger sqlite_ledger --sqlite-path ./ledger.db\n"
        "\n"
        "# Buy shares:\n"
        "brokerage trade buy --user alice --symbol AAPL --quantity 10 "
        "--ledger sqlite_ledger --sqlite-path ./ledger.db "
        "--oracle csv_quotes --quotes-file quotes.csv";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Creation Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API brokerage::ILedgerStore* createLedgerStore(const char* config) {
    try {
        // Пустой config: путь придет через initializeFromOptions()
        if (!config || std::string(config).empty()) {
            return new brokerage::SQLiteLedgerStore("");
        }
        return new brokerage::SQLiteLedgerStore(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create SQLiteLedgerStore: " << e.what() << std::endl;
        return nullptr;
    }
}

PLUGIN_API void destroyLedgerStore(brokerage::ILedgerStore* store) {
    delete store;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Metadata Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API const char* getPluginName() {
    return "SQLiteLedgerStore";
}

PLUGIN_API const char* getPluginVersion() {
    return "1.0.0";
}

PLUGIN_API const char* getPluginType() {
    return "ledger";
}

// Системное имя плагина (используется в --ledger)
PLUGIN_API const char* getPluginSystemName() {
    return "sqlite_ledger";
}

}  // extern "C"
