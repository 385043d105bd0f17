#pragma once

#include "IPriceOracle.hpp"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <shared_mutex>
#include <boost/program_options.hpp>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// CSV Price Oracle: котировки из файла symbol,price[,sector]
// ═══════════════════════════════════════════════════════════════════════════════

class IFileReader {
public:
    virtual ~IFileReader() = default;
    virtual std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) = 0;
};

class FileReader : public IFileReader {
public:
    std::expected<std::vector<std::string>, std::string> readLines(
        std::string_view filePath) override;
};

class CsvPriceOracle : public IPriceOracle {
public:
    explicit CsvPriceOracle(
        std::shared_ptr<IFileReader> reader = nullptr,
        char delimiter = ',',
        bool skipHeader = true);

    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    // Загружает котировки, заменяя ранее загруженные.
    // Строки с неразборчивой ценой пропускаются с предупреждением.
    Result load(std::string_view filePath);

    std::expected<double, std::string> getPrice(std::string_view symbol) override;

    std::string getSector(std::string_view symbol) override;

    std::size_t quoteCount() const;

private:
    struct Quote {
        double price = 0.0;
        std::string sector;
    };

    std::shared_ptr<IFileReader> reader_;
    char delimiter_;
    bool skipHeader_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Quote> quotes_;

    std::vector<std::string> parseCSVLine(std::string_view line) const;

    static std::expected<double, std::string> parsePrice(std::string_view valueStr);
};

}  // namespace brokerage
