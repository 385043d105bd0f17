#include <gtest/gtest.h>
#include "AnalyticsEngine.hpp"
#include "TradeExecutionEngine.hpp"
#include "InMemoryLedgerStore.hpp"
#include "FakePriceOracle.hpp"
#include "TestLedgerHelpers.hpp"
#include <memory>

using namespace brokerage;
using namespace brokerage::test;

class AnalyticsEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
        oracle_ = std::make_shared<FakePriceOracle>();
        clock_ = std::make_shared<SimulationClock>(at(0));

        auto service = std::make_shared<PortfolioService>(store_, oracle_, clock_);
        auto sectors = std::make_shared<SectorCache>(
            oracle_, std::chrono::seconds::zero(), clock_);
        analytics_ = std::make_unique<AnalyticsEngine>(service, sectors);

        ASSERT_TRUE(store_->createAccount("alice", kDefaultStartingBalance, at(0)));
    }

    // Портфель без журнала: только то, что нужно composeSnapshot
    static Position position(const std::string& symbol, double marketValue,
                             double gainPercent = 0.0) {
        Position p;
        p.symbol = symbol;
        p.netQuantity = 1;
        p.marketValue = marketValue;
        p.gainPercent = gainPercent;
        return p;
    }

    static PortfolioView view(Cents balance, std::vector<Position> positions) {
        PortfolioView v;
        v.balance = balance;
        v.startingBalance = balance;
        for (const auto& p : positions) {
            v.totalMarketValue += p.marketValue;
        }
        v.positions = std::move(positions);
        v.totalEquity = fromCents(balance) + v.totalMarketValue;
        return v;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<FakePriceOracle> oracle_;
    std::shared_ptr<SimulationClock> clock_;
    std::unique_ptr<AnalyticsEngine> analytics_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Снимок по журналу
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AnalyticsEngineTest, CashOnlyAccount) {
    auto snapshot = analytics_->buildSnapshot("alice");

    ASSERT_TRUE(snapshot.has_value());
    EXPECT_DOUBLE_EQ(snapshot->totalEquity, 100000.0);
    EXPECT_DOUBLE_EQ(snapshot->totalReturnPct, 0.0);
    EXPECT_EQ(snapshot->displayTotalReturnPct, "0%");
    EXPECT_DOUBLE_EQ(snapshot->cashAllocationPct, 100.0);
    EXPECT_FALSE(snapshot->largestPosition.has_value());
    EXPECT_EQ(snapshot->concentrationRiskLevel, ConcentrationRisk::Low);
    EXPECT_TRUE(snapshot->sectorBreakdown.empty());
    EXPECT_DOUBLE_EQ(snapshot->volatility, 0.0);
    EXPECT_DOUBLE_EQ(snapshot->sharpeRatio, 0.0);
    EXPECT_FALSE(snapshot->topGainer.has_value());
    EXPECT_FALSE(snapshot->topLoser.has_value());
}

TEST_F(AnalyticsEngineTest, BuyThenPriceRiseScenario) {
    // Arrange
    TradeExecutionEngine engine(store_, oracle_, clock_);
    oracle_->setPrice("AAPL", 150.0);
    oracle_->setSector("AAPL", "Technology");
    ASSERT_TRUE(engine.executeTrade("alice", "AAPL", TransactionType::Buy, 10));
    oracle_->setPrice("AAPL", 160.0);

    // Act
    auto snapshot = analytics_->buildSnapshot("alice");

    // Assert
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_DOUBLE_EQ(snapshot->totalEquity, 100100.0);
    EXPECT_DOUBLE_EQ(snapshot->totalReturnPct, 0.1);
    EXPECT_EQ(snapshot->displayTotalReturnPct, "0.1%");
    EXPECT_DOUBLE_EQ(snapshot->cashAllocationPct, 98.4);

    ASSERT_TRUE(snapshot->largestPosition.has_value());
    EXPECT_EQ(snapshot->largestPosition->symbol, "AAPL");
    EXPECT_DOUBLE_EQ(snapshot->largestPosition->allocationPct, 1.6);
    EXPECT_EQ(snapshot->concentrationRiskLevel, ConcentrationRisk::Low);

    ASSERT_EQ(snapshot->sectorBreakdown.size(), 1u);
    EXPECT_EQ(snapshot->sectorBreakdown[0].sector, "Technology");
    EXPECT_DOUBLE_EQ(snapshot->sectorBreakdown[0].allocationPct, 1.6);

    EXPECT_EQ(snapshot->topGainer, std::optional<std::string>("AAPL"));
    EXPECT_FALSE(snapshot->topLoser.has_value());
}

TEST_F(AnalyticsEngineTest, UnknownUserPropagatesError) {
    auto snapshot = analytics_->buildSnapshot("nobody");

    ASSERT_FALSE(snapshot.has_value());
    EXPECT_EQ(snapshot.error().kind, ErrorKind::AccountNotFound);
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: composeSnapshot
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(AnalyticsEngineTest, FortyPercentIsMediumConcentration) {
    auto snapshot = analytics_->composeSnapshot(
        view(60000, {position("AAPL", 400.0)}), {});

    ASSERT_TRUE(snapshot.largestPosition.has_value());
    EXPECT_DOUBLE_EQ(snapshot.largestPosition->allocationPct, 40.0);
    EXPECT_EQ(snapshot.concentrationRiskLevel, ConcentrationRisk::Medium);
}

TEST_F(AnalyticsEngineTest, AboveFortyPercentIsHighConcentration) {
    auto snapshot = analytics_->composeSnapshot(
        view(59000, {position("AAPL", 410.0)}), {});

    EXPECT_EQ(snapshot.concentrationRiskLevel, ConcentrationRisk::High);
}

TEST_F(AnalyticsEngineTest, LargestPositionTieGoesToLaterPosition) {
    auto snapshot = analytics_->composeSnapshot(
        view(80000, {position("AAPL", 100.0), position("MSFT", 100.0)}), {});

    ASSERT_TRUE(snapshot.largestPosition.has_value());
    EXPECT_EQ(snapshot.largestPosition->symbol, "MSFT");
    EXPECT_DOUBLE_EQ(snapshot.largestPosition->allocationPct, 10.0);
}

TEST_F(AnalyticsEngineTest, SectorsSortedDescendingWithUnknown) {
    oracle_->setSector("AAPL", "Technology");
    oracle_->setSector("MSFT", "Technology");
    oracle_->setSector("XOM", "Energy");

    auto snapshot = analytics_->composeSnapshot(
        view(50000, {position("AAPL", 100.0),
                     position("MSFT", 100.0),
                     position("XOM", 300.0),
                     position("ZZZ", 0.0)}), {});

    ASSERT_EQ(snapshot.sectorBreakdown.size(), 3u);
    EXPECT_EQ(snapshot.sectorBreakdown[0].sector, "Energy");
    EXPECT_DOUBLE_EQ(snapshot.sectorBreakdown[0].allocationPct, 30.0);
    EXPECT_EQ(snapshot.sectorBreakdown[1].sector, "Technology");
    EXPECT_DOUBLE_EQ(snapshot.sectorBreakdown[1].allocationPct, 20.0);
    EXPECT_EQ(snapshot.sectorBreakdown[2].sector, "Unknown");
    EXPECT_DOUBLE_EQ(snapshot.sectorBreakdown[2].allocationPct, 0.0);
}

TEST_F(AnalyticsEngineTest, GainerAndLoserByGainPercent) {
    auto snapshot = analytics_->composeSnapshot(
        view(100000, {position("AAPL", 100.0, 5.0),
                      position("MSFT", 100.0, -3.0),
                      position("XOM", 100.0, 12.0)}), {});

    EXPECT_EQ(snapshot.topGainer, std::optional<std::string>("XOM"));
    EXPECT_EQ(snapshot.topLoser, std::optional<std::string>("MSFT"));
}

TEST_F(AnalyticsEngineTest, VolatilityAndSharpeFromCurve) {
    std::vector<EquityPoint> curve = {
        {at(0), 100000.0},
        {at(1), 101000.0},
        {at(2), 100000.0}
    };

    auto snapshot = analytics_->composeSnapshot(view(10000000, {}), curve);

    auto returns = RiskMetrics::dailyReturns(curve);
    double volatility = RiskMetrics::annualizedVolatility(returns);
    double annualized = RiskMetrics::annualizedReturn(0.0, returns.size());

    EXPECT_GT(snapshot.volatility, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.volatility, RiskMetrics::roundTo(volatility, 4));
    EXPECT_DOUBLE_EQ(snapshot.sharpeRatio,
                     RiskMetrics::roundTo((annualized - 0.03) / volatility, 4));
}

TEST_F(AnalyticsEngineTest, FormatPercentDropsTrailingZeros) {
    EXPECT_EQ(AnalyticsEngine::formatPercent(12.5), "12.5%");
    EXPECT_EQ(AnalyticsEngine::formatPercent(0.0), "0%");
    EXPECT_EQ(AnalyticsEngine::formatPercent(-3.25), "-3.25%");
}
