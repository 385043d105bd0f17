#include <gtest/gtest.h>
#include "PluginManager.hpp"
#include "ILedgerStore.hpp"
#include "IPriceOracle.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>

using namespace brokerage;

namespace {

std::string testPluginPath() {
    // Переменная окружения важнее пути сборки
    const char* pluginPath = std::getenv("BROKERAGE_PLUGIN_PATH");
    if (pluginPath) {
        return pluginPath;
    }
#ifdef BROKERAGE_TEST_PLUGIN_DIR
    return BROKERAGE_TEST_PLUGIN_DIR;
#else
    return "../plugins";
#endif
}

}  // namespace

class PluginManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledgers = std::make_unique<PluginManager<ILedgerStore>>(testPluginPath());
        oracles = std::make_unique<PluginManager<IPriceOracle>>(testPluginPath());
    }

    void TearDown() override {
        if (ledgers) {
            ledgers->unloadAll();
        }
        if (oracles) {
            oracles->unloadAll();
        }
    }

    std::unique_ptr<PluginManager<ILedgerStore>> ledgers;
    std::unique_ptr<PluginManager<IPriceOracle>> oracles;
};

TEST_F(PluginManagerTest, ConstructorWithPath) {
    auto pm = PluginManager<ILedgerStore>("/custom/path");
    EXPECT_EQ(pm.getPluginPath(), "/custom/path");
}

TEST_F(PluginManagerTest, SetPluginPath) {
    ledgers->setPluginPath("/new/path");
    EXPECT_EQ(ledgers->getPluginPath(), "/new/path");
}

TEST_F(PluginManagerTest, LoadInMemoryLedger) {
    auto result = ledgers->load("inmemory_ledger");
    ASSERT_TRUE(result.has_value()) << "Failed to load in-memory ledger: " << result.error();

    auto store = result.value();
    ASSERT_NE(store, nullptr);

    auto now = std::chrono::system_clock::now();
    auto account = store->createAccount("alice", kDefaultStartingBalance, now);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->cashBalance, kDefaultStartingBalance);

    auto accounts = store->listAccounts();
    ASSERT_TRUE(accounts.has_value());
    EXPECT_EQ(accounts->size(), 1u);
}

TEST_F(PluginManagerTest, LoadSQLiteLedgerWithInMemoryDatabase) {
    auto result = ledgers->load("sqlite_ledger", ":memory:");
    ASSERT_TRUE(result.has_value()) << "Failed to load SQLite ledger: " << result.error();

    auto store = result.value();
    auto account = store->createAccount("bob", 100000, std::chrono::system_clock::now());
    EXPECT_TRUE(account.has_value());
}

TEST_F(PluginManagerTest, LoadCsvOracle) {
    auto result = oracles->load("csv_quotes");
    ASSERT_TRUE(result.has_value()) << "Failed to load CSV oracle: " << result.error();

    // Без файла котировок цен нет
    auto price = result.value()->getPrice("AAPL");
    EXPECT_FALSE(price.has_value());
}

TEST_F(PluginManagerTest, LoadPluginTwiceGivesIndependentInstances) {
    auto first = ledgers->load("inmemory_ledger");
    auto second = ledgers->load("inmemory_ledger");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_NE(first.value().get(), second.value().get());

    auto now = std::chrono::system_clock::now();
    ASSERT_TRUE(first.value()->createAccount("alice", 100, now));
    EXPECT_FALSE(second.value()->readAccount("alice").has_value());
}

TEST_F(PluginManagerTest, LoadNonExistentPlugin) {
    auto result = ledgers->load("nonexistent_plugin");
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(result.error().empty());
}

TEST_F(PluginManagerTest, ScanAvailableLedgers) {
    auto plugins = ledgers->scanAvailablePlugins();
    ASSERT_FALSE(plugins.empty()) << "No plugins found in " << ledgers->getPluginPath();

    for (const auto& plugin : plugins) {
        EXPECT_FALSE(plugin.displayName.empty());
        EXPECT_FALSE(plugin.version.empty());
        EXPECT_EQ(plugin.type, "ledger");
        EXPECT_EQ(plugin.systemName, plugin.name);
    }

    auto it = std::find_if(plugins.begin(), plugins.end(),
                           [](const auto& p) { return p.systemName == "sqlite_ledger"; });
    EXPECT_NE(it, plugins.end());
}

TEST_F(PluginManagerTest, OraclesLiveInTheirOwnDirectory) {
    auto plugins = oracles->scanAvailablePlugins();
    ASSERT_EQ(plugins.size(), 1u);
    EXPECT_EQ(plugins[0].systemName, "csv_quotes");
    EXPECT_EQ(plugins[0].type, "oracle");
}

TEST_F(PluginManagerTest, CommandLineMetadataExposesOptions) {
    auto sqlite = ledgers->getPluginCommandLineMetadata("sqlite_ledger");
    ASSERT_TRUE(sqlite.has_value()) << sqlite.error();
    ASSERT_NE(sqlite->commandLineOptions, nullptr);
    EXPECT_NE(sqlite->commandLineOptions->find_nothrow("sqlite-path", false), nullptr);

    auto csv = oracles->getPluginCommandLineMetadata("csv_quotes");
    ASSERT_TRUE(csv.has_value()) << csv.error();
    ASSERT_NE(csv->commandLineOptions, nullptr);
    EXPECT_NE(csv->commandLineOptions->find_nothrow("quotes-file", false), nullptr);
}

TEST_F(PluginManagerTest, MetadataForUnknownPluginIsError) {
    EXPECT_FALSE(ledgers->getPluginCommandLineMetadata("nonexistent_plugin").has_value());
}
