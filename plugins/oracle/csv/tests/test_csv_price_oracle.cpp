#include <gtest/gtest.h>
#include "CsvPriceOracle.hpp"
#include <boost/program_options.hpp>
#include <memory>
#include <vector>

namespace po = boost::program_options;

using namespace brokerage;

// ═══════════════════════════════════════════════════════════════════════════════
// Mock File Reader для тестирования
// ═══════════════════════════════════════════════════════════════════════════════

class MockFileReader : public IFileReader {
public:
    void setLines(const std::vector<std::string>& lines) {
        lines_ = lines;
    }

    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override {

        lastPath_ = std::string(filePath);
        if (lines_.empty()) {
            return std::unexpected("File is empty");
        }
        return lines_;
    }

    const std::string& lastPath() const { return lastPath_; }

private:
    std::vector<std::string> lines_;
    std::string lastPath_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Test Fixture
// ═══════════════════════════════════════════════════════════════════════════════

class CsvPriceOracleTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReader_ = std::make_shared<MockFileReader>();
    }

    po::variables_map createOptions(
        const std::string& filePath = "quotes.csv",
        char delimiter = ',',
        bool skipHeader = true) {

        po::variables_map vm;
        vm.insert({"quotes-file", po::variable_value(filePath, false)});
        vm.insert({"quotes-delimiter", po::variable_value(delimiter, false)});
        vm.insert({"quotes-skip-header", po::variable_value(skipHeader, false)});
        po::notify(vm);
        return vm;
    }

    std::shared_ptr<MockFileReader> mockReader_;
};

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Загрузка котировок
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CsvPriceOracleTest, LoadWithHeader) {
    // Arrange
    mockReader_->setLines({
        "symbol,price,sector",
        "AAPL,150.25,Technology",
        "XOM,101.5,Energy"
    });
    CsvPriceOracle oracle(mockReader_);

    // Act
    auto result = oracle.load("quotes.csv");

    // Assert
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(oracle.quoteCount(), 2u);
    EXPECT_EQ(mockReader_->lastPath(), "quotes.csv");

    auto price = oracle.getPrice("AAPL");
    ASSERT_TRUE(price.has_value());
    EXPECT_DOUBLE_EQ(*price, 150.25);
    EXPECT_EQ(oracle.getSector("XOM"), "Energy");
}

TEST_F(CsvPriceOracleTest, LoadWithoutHeader) {
    mockReader_->setLines({
        "AAPL,150",
        "MSFT,300"
    });
    CsvPriceOracle oracle(mockReader_, ',', false);

    ASSERT_TRUE(oracle.load("quotes.csv"));

    EXPECT_EQ(oracle.quoteCount(), 2u);
}

TEST_F(CsvPriceOracleTest, SemicolonDelimiter) {
    mockReader_->setLines({
        "symbol;price;sector",
        "AAPL;150;Technology"
    });
    CsvPriceOracle oracle(mockReader_, ';');

    ASSERT_TRUE(oracle.load("quotes.csv"));

    EXPECT_DOUBLE_EQ(*oracle.getPrice("AAPL"), 150.0);
    EXPECT_EQ(oracle.getSector("AAPL"), "Technology");
}

TEST_F(CsvPriceOracleTest, SymbolsAreNormalized) {
    mockReader_->setLines({
        "symbol,price",
        " aapl , 150 "
    });
    CsvPriceOracle oracle(mockReader_);
    ASSERT_TRUE(oracle.load("quotes.csv"));

    EXPECT_TRUE(oracle.getPrice("AAPL").has_value());
    EXPECT_TRUE(oracle.getPrice("aapl").has_value());
}

TEST_F(CsvPriceOracleTest, BadLinesAreSkipped) {
    mockReader_->setLines({
        "symbol,price",
        "AAPL,150",
        "MSFT,not-a-number",
        "XOM",
        ",42",
        "GOOG,12x"
    });
    CsvPriceOracle oracle(mockReader_);

    ASSERT_TRUE(oracle.load("quotes.csv"));

    EXPECT_EQ(oracle.quoteCount(), 1u);
    EXPECT_FALSE(oracle.getPrice("MSFT").has_value());
    EXPECT_FALSE(oracle.getPrice("GOOG").has_value());
}

TEST_F(CsvPriceOracleTest, EmptyFileIsError) {
    CsvPriceOracle oracle(mockReader_);

    auto result = oracle.load("quotes.csv");

    EXPECT_FALSE(result.has_value());
}

TEST_F(CsvPriceOracleTest, HeaderOnlyFileIsError) {
    mockReader_->setLines({"symbol,price,sector"});
    CsvPriceOracle oracle(mockReader_);

    auto result = oracle.load("quotes.csv");

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("No quotes"), std::string::npos);
}

TEST_F(CsvPriceOracleTest, ReloadReplacesQuotes) {
    mockReader_->setLines({"symbol,price", "AAPL,150"});
    CsvPriceOracle oracle(mockReader_);
    ASSERT_TRUE(oracle.load("quotes.csv"));

    mockReader_->setLines({"symbol,price", "MSFT,300"});
    ASSERT_TRUE(oracle.load("quotes.csv"));

    EXPECT_FALSE(oracle.getPrice("AAPL").has_value());
    EXPECT_TRUE(oracle.getPrice("MSFT").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Запросы
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CsvPriceOracleTest, UnknownSymbolHasNoPrice) {
    mockReader_->setLines({"symbol,price", "AAPL,150"});
    CsvPriceOracle oracle(mockReader_);
    ASSERT_TRUE(oracle.load("quotes.csv"));

    auto price = oracle.getPrice("TSLA");

    ASSERT_FALSE(price.has_value());
    EXPECT_EQ(price.error(), "No quote for symbol: TSLA");
}

TEST_F(CsvPriceOracleTest, MissingSectorIsUnknown) {
    mockReader_->setLines({
        "symbol,price,sector",
        "AAPL,150",
        "MSFT,300,"
    });
    CsvPriceOracle oracle(mockReader_);
    ASSERT_TRUE(oracle.load("quotes.csv"));

    EXPECT_EQ(oracle.getSector("AAPL"), "Unknown");
    EXPECT_EQ(oracle.getSector("MSFT"), "Unknown");
    EXPECT_EQ(oracle.getSector("TSLA"), "Unknown");
}

// ═══════════════════════════════════════════════════════════════════════════════
// ТЕСТЫ: Инициализация из опций
// ═══════════════════════════════════════════════════════════════════════════════

TEST_F(CsvPriceOracleTest, InitializeFromOptions) {
    mockReader_->setLines({"AAPL;150;Technology"});
    CsvPriceOracle oracle(mockReader_);

    auto result = oracle.initializeFromOptions(createOptions("data/quotes.csv", ';', false));

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(mockReader_->lastPath(), "data/quotes.csv");
    EXPECT_EQ(oracle.quoteCount(), 1u);
    EXPECT_EQ(oracle.getSector("AAPL"), "Technology");
}

TEST_F(CsvPriceOracleTest, InitializeWithoutFileIsError) {
    CsvPriceOracle oracle(mockReader_);
    po::variables_map vm;

    auto result = oracle.initializeFromOptions(vm);

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("quotes-file"), std::string::npos);
}

TEST_F(CsvPriceOracleTest, MissingFileIsError) {
    CsvPriceOracle oracle;

    auto result = oracle.load("/nonexistent/quotes.csv");

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("Failed to open file"), std::string::npos);
}
