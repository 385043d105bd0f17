#include <gtest/gtest.h>
#include "TradeExecutionEngine.hpp"
#include "InMemoryLedgerStore.hpp"
#include "FakePriceOracle.hpp"
#include "TestLedgerHelpers.hpp"
#include <atomic>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

using namespace brokerage;
using namespace brokerage::test;

class TradeExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
        oracle_ = std::make_shared<FakePriceOracle>();
        clock_ = std::make_shared<SimulationClock>(at(0));
        engine_ = std::make_unique<TradeExecutionEngine>(store_, oracle_, clock_);

        oracle_->setPrice("AAPL", 150.0);
        ASSERT_TRUE(store_->createAccount("alice", kDefaultStartingBalance, at(0)));
    }

    Cents balanceOf(const std::string& userId) {
        auto account = store_->readAccount(userId);
        EXPECT_TRUE(account.has_value());
        return account ? account->cashBalance : -1;
    }

    std::size_t journalSize(const std::string& userId) {
        auto journal = store_->readTransactions(userId);
        EXPECT_TRUE(journal.has_value());
        return journal ? journal->size() : 0;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<FakePriceOracle> oracle_;
    std::shared_ptr<SimulationClock> clock_;
    std::unique_ptr<TradeExecutionEngine> engine_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Успешные сделки
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TradeExecutionEngineTest, BuyDebitsCashAndAppendsJournal) {
    // Act
    auto receipt = engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 10);

    // Assert
    ASSERT_TRUE(receipt.has_value()) << describe(receipt.error());
    EXPECT_EQ(receipt->symbol, "AAPL");
    EXPECT_EQ(receipt->type, TransactionType::Buy);
    EXPECT_EQ(receipt->quantity, 10);
    EXPECT_DOUBLE_EQ(receipt->price, 150.0);
    EXPECT_EQ(receipt->totalAmount, 150000);
    EXPECT_EQ(receipt->newBalance, 9850000);
    EXPECT_EQ(receipt->executedAt, at(0));

    EXPECT_EQ(balanceOf("alice"), 9850000);
    EXPECT_EQ(journalSize("alice"), 1u);
}

TEST_F(TradeExecutionEngineTest, SymbolIsNormalized) {
    auto receipt = engine_->executeTrade("alice", "  aapl ", TransactionType::Buy, 1);

    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt->symbol, "AAPL");
}

TEST_F(TradeExecutionEngineTest, SellCreditsCash) {
    ASSERT_TRUE(engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 10));
    oracle_->setPrice("AAPL", 160.0);

    auto receipt = engine_->executeTrade("alice", "AAPL", TransactionType::Sell, 4);

    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt->totalAmount, 64000);
    EXPECT_EQ(balanceOf("alice"), 9850000 + 64000);
    EXPECT_EQ(journalSize("alice"), 2u);
}

TEST_F(TradeExecutionEngineTest, SellThatWouldOverflowBalanceIsRejected) {
    // Arrange: баланс у верхней границы Cents
    const Cents nearMax = std::numeric_limits<Cents>::max() - 100;
    ASSERT_TRUE(store_->createAccount("whale", nearMax, at(0)));
    ASSERT_TRUE(engine_->executeTrade("whale", "AAPL", TransactionType::Buy, 1));
    oracle_->setPrice("AAPL", 1000000.0);

    // Act
    auto receipt = engine_->executeTrade("whale", "AAPL", TransactionType::Sell, 1);

    // Assert
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().kind, ErrorKind::InvalidInput);
    EXPECT_EQ(balanceOf("whale"), nearMax - 15000);
    EXPECT_EQ(journalSize("whale"), 1u);
}

TEST_F(TradeExecutionEngineTest, AmountIsRoundedToCents) {
    oracle_->setPrice("PENNY", 0.333);

    auto receipt = engine_->executeTrade("alice", "PENNY", TransactionType::Buy, 3);

    ASSERT_TRUE(receipt.has_value());
    EXPECT_EQ(receipt->totalAmount, 100);
    EXPECT_EQ(balanceOf("alice"), kDefaultStartingBalance - 100);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Отказы без изменений
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TradeExecutionEngineTest, InvalidParametersAreRejected) {
    auto zeroQty = engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 0);
    auto noSymbol = engine_->executeTrade("alice", "   ", TransactionType::Buy, 1);
    auto noUser = engine_->executeTrade("", "AAPL", TransactionType::Buy, 1);
    auto badType = engine_->executeTrade("alice", "AAPL", TransactionType::Unknown, 1);

    for (const auto* result : {&zeroQty, &noSymbol, &noUser, &badType}) {
        ASSERT_FALSE(result->has_value());
        EXPECT_EQ(result->error().kind, ErrorKind::InvalidInput);
        EXPECT_EQ(result->error().message, "Invalid trade parameters");
    }

    EXPECT_EQ(oracle_->priceCalls(), 0);
    EXPECT_EQ(journalSize("alice"), 0u);
}

TEST_F(TradeExecutionEngineTest, PriceUnavailableLeavesLedgerUntouched) {
    oracle_->failPrice("AAPL");

    auto result = engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::PriceUnavailable);
    EXPECT_EQ(result.error().message, "Unable to fetch current stock price");
    EXPECT_EQ(balanceOf("alice"), kDefaultStartingBalance);
}

TEST_F(TradeExecutionEngineTest, NonPositivePriceIsUnavailable) {
    oracle_->setPrice("ZERO", 0.0);

    auto result = engine_->executeTrade("alice", "ZERO", TransactionType::Buy, 1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::PriceUnavailable);
}

TEST_F(TradeExecutionEngineTest, UnknownUserIsNotFound) {
    auto result = engine_->executeTrade("bob", "AAPL", TransactionType::Buy, 1);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::AccountNotFound);
    EXPECT_EQ(result.error().message, "User not found");
}

TEST_F(TradeExecutionEngineTest, InsufficientBalance) {
    auto result = engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 1000);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InsufficientBalance);
    EXPECT_EQ(result.error().message, "Insufficient balance");
    EXPECT_EQ(balanceOf("alice"), kDefaultStartingBalance);
    EXPECT_EQ(journalSize("alice"), 0u);
}

TEST_F(TradeExecutionEngineTest, InsufficientHoldings) {
    ASSERT_TRUE(engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 2));

    auto result = engine_->executeTrade("alice", "AAPL", TransactionType::Sell, 3);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::InsufficientHoldings);
    EXPECT_EQ(result.error().message, "Insufficient holdings");
    EXPECT_EQ(journalSize("alice"), 1u);
}

TEST_F(TradeExecutionEngineTest, FailedCommitRollsBackEverything) {
    // Arrange
    store_->failNextCommit("disk full");

    // Act
    auto result = engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 10);

    // Assert
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::StoreFailure);
    EXPECT_EQ(balanceOf("alice"), kDefaultStartingBalance);
    EXPECT_EQ(journalSize("alice"), 0u);

    // Следующая сделка проходит
    EXPECT_TRUE(engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 10));
}

TEST_F(TradeExecutionEngineTest, ExpiredDeadlineTimesOut) {
    TradeRequest request;
    request.userId = "alice";
    request.symbol = "AAPL";
    request.type = TransactionType::Buy;
    request.quantity = 1;
    request.deadline = clock_->now();

    auto result = engine_->executeTrade(request);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(balanceOf("alice"), kDefaultStartingBalance);
    EXPECT_EQ(journalSize("alice"), 0u);
}

TEST_F(TradeExecutionEngineTest, FutureDeadlineAllowsTrade) {
    TradeRequest request;
    request.userId = "alice";
    request.symbol = "AAPL";
    request.type = TransactionType::Buy;
    request.quantity = 1;
    request.deadline = clock_->now() + std::chrono::seconds(5);

    EXPECT_TRUE(engine_->executeTrade(request).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Конкурентные сделки по одному счету
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(TradeExecutionEngineTest, ConcurrentBuysNeverOverdraw) {
    // Arrange: денег ровно на одну покупку
    ASSERT_TRUE(store_->createAccount("carol", 100000, at(0)));
    oracle_->setPrice("BRK", 600.0);

    constexpr int kThreads = 8;
    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;

    // Act
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            auto result = engine_->executeTrade("carol", "BRK", TransactionType::Buy, 1);
            if (result) {
                ++succeeded;
            } else if (result.error().kind == ErrorKind::InsufficientBalance) {
                ++rejected;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Assert
    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), kThreads - 1);
    EXPECT_EQ(balanceOf("carol"), 40000);
    EXPECT_EQ(journalSize("carol"), 1u);
}

TEST_F(TradeExecutionEngineTest, ConcurrentSellsNeverOversell) {
    ASSERT_TRUE(engine_->executeTrade("alice", "AAPL", TransactionType::Buy, 3));

    constexpr int kThreads = 6;
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            if (engine_->executeTrade("alice", "AAPL", TransactionType::Sell, 1)) {
                ++succeeded;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 3);
    EXPECT_EQ(balanceOf("alice"), kDefaultStartingBalance);
}

TEST_F(TradeExecutionEngineTest, NullDependenciesAreRejected) {
    EXPECT_THROW(TradeExecutionEngine(nullptr, oracle_), std::invalid_argument);
    EXPECT_THROW(TradeExecutionEngine(store_, nullptr), std::invalid_argument);
}
