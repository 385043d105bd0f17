#include "InMemoryLedgerStore.hpp"
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

// Хранилище в памяти не имеет опций, но функция нужна для единообразия
PLUGIN_API const po::options_description* getCommandLineOptions() {
    static po::options_description* inmemoryOptions = nullptr;

    if (!inmemoryOptions) {
        inmemoryOptions = new po::options_description("In-Memory Ledger Options");
    }

    return inmemoryOptions;
}

PLUGIN_API const char* getPluginDescription() {
    return "Ledger kept in process memory for demos and testing. "
           "Accounts and transactions are lost when the application exits.";
}

PLUGIN_API const char* getPluginExamples() {
    return
        "# Create an account for a single demo run:\n"
        "brokerage account create --user alice --ledger inmemory_ledger\n"
        "\n"
        "# List accounts:\n"
        "brokerage account list --ledger inmemory_ledger";
}

// ═══════════════════════════════════════════════════════════════════════════════
// Plugin Creation Functions
// ═══════════════════════════════════════════════════════════════════════════════

PLUGIN_API brokerage::ILedgerStore* createLedgerStore(const char* /* config */) {
    try {
        return new brokerage::InMemoryLedgerStore();
    } catch (const std::exception& e) {
        std::cerr << "Failed to create InMemoryLedgerStore: " << e.what() << std::endl;
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
    return "InMemoryLedgerStore";
}

PLUGIN_API const char* getPluginVersion() {
    return "1.0.0";
}

PLUGIN_API const char* getPluginType() {
    return "ledger";
}

PLUGIN_API const char* getPluginSystemName() {
    return "inmemory_ledger";
}

}  // extern "C"
