#include "CsvPriceOracle.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <mutex>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// FileReader Implementation
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<std::vector<std::string>, std::string> FileReader::readLines(
    std::string_view filePath) {
    std::vector<std::string> lines;
    std::ifstream file{std::string(filePath)};

    if (!file.is_open()) {
        return std::unexpected(std::string("Failed to open file: ") + std::string(filePath));
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    if (lines.empty()) {
        return std::unexpected(std::string("File is empty: ") + std::string(filePath));
    }

    return lines;
}

// ═══════════════════════════════════════════════════════════════════════════════
// CsvPriceOracle Implementation
// ═══════════════════════════════════════════════════════════════════════════════

CsvPriceOracle::CsvPriceOracle(
    std::shared_ptr<IFileReader> reader,
    char delimiter,
    bool skipHeader)
    : reader_(reader ? reader : std::make_shared<FileReader>()),
    delimiter_(delimiter),
    skipHeader_(skipHeader) {}

Result CsvPriceOracle::initializeFromOptions(
    const boost::program_options::variables_map& options) {

    if (!options.count("quotes-file")) {
        return std::unexpected(
            "Required option 'quotes-file' not provided.\n"
            "Usage: --quotes-file <path>");
    }

    if (options.count("quotes-delimiter")) {
        delimiter_ = options.at("quotes-delimiter").as<char>();
    }

    if (options.count("quotes-skip-header")) {
        skipHeader_ = options.at("quotes-skip-header").as<bool>();
    }

    return load(options.at("quotes-file").as<std::string>());
}

Result CsvPriceOracle::load(std::string_view filePath) {
    auto linesResult = reader_->readLines(filePath);
    if (!linesResult) {
        return std::unexpected(linesResult.error());
    }

    const auto& lines = linesResult.value();
    std::size_t startLine = skipHeader_ ? 1 : 0;

    std::map<std::string, Quote> loaded;
    std::size_t skipped = 0;

    for (std::size_t i = startLine; i < lines.size(); ++i) {
        auto fields = parseCSVLine(lines[i]);
        if (fields.size() < 2) {
            ++skipped;
            continue;
        }

        std::string symbol = normalizeSymbol(fields[0]);
        auto price = parsePrice(fields[1]);
        if (symbol.empty() || !price) {
            std::cerr << "⚠ Quotes: skipping line " << (i + 1)
                      << " of " << filePath << std::endl;
            ++skipped;
            continue;
        }

        Quote quote;
        quote.price = *price;
        quote.sector = fields.size() > 2 && !fields[2].empty()
            ? fields[2]
            : std::string(kUnknownSector);

        loaded[symbol] = std::move(quote);
    }

    if (loaded.empty()) {
        return std::unexpected(std::string("No quotes found in ") + std::string(filePath));
    }

    if (skipped > 0) {
        std::cerr << "⚠ Quotes: " << skipped << " line(s) skipped" << std::endl;
    }

    std::unique_lock guard(mutex_);
    quotes_ = std::move(loaded);
    return Result{};
}

std::expected<double, std::string> CsvPriceOracle::getPrice(std::string_view symbol) {
    std::shared_lock guard(mutex_);

    auto it = quotes_.find(normalizeSymbol(symbol));
    if (it == quotes_.end()) {
        return std::unexpected("No quote for symbol: " + std::string(symbol));
    }
    return it->second.price;
}

std::string CsvPriceOracle::getSector(std::string_view symbol) {
    std::shared_lock guard(mutex_);

    auto it = quotes_.find(normalizeSymbol(symbol));
    if (it == quotes_.end()) {
        return std::string(kUnknownSector);
    }
    return it->second.sector;
}

std::size_t CsvPriceOracle::quoteCount() const {
    std::shared_lock guard(mutex_);
    return quotes_.size();
}

std::vector<std::string> CsvPriceOracle::parseCSVLine(std::string_view line) const {
    std::vector<std::string> fields;
    std::istringstream iss{std::string(line)};
    std::string field;

    while (std::getline(iss, field, delimiter_)) {
        // Убираем пробелы с концов
        auto start = field.find_first_not_of(" \t\r\n");
        auto end = field.find_last_not_of(" \t\r\n");

        if (start != std::string::npos) {
            fields.push_back(field.substr(start, end - start + 1));
        } else {
            fields.push_back("");
        }
    }

    return fields;
}

std::expected<double, std::string> CsvPriceOracle::parsePrice(std::string_view valueStr) {
    try {
        std::size_t idx;
        double value = std::stod(std::string(valueStr), &idx);
        if (idx == valueStr.length()) {
            return value;
        }
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Invalid price '") + std::string(valueStr) +
                               "': " + e.what());
    }
    return std::unexpected(std::string("Invalid price: ") + std::string(valueStr));
}

}  // namespace brokerage
