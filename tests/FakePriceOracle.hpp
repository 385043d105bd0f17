#pragma once

#include "IPriceOracle.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// FakePriceOracle - цены и секторы задаются тестом
// ═══════════════════════════════════════════════════════════════════════════════

class FakePriceOracle : public IPriceOracle {
public:
    void setPrice(const std::string& symbol, double price) {
        std::lock_guard lock(mutex_);
        prices_[symbol] = price;
        failing_.erase(symbol);
    }

    void setSector(const std::string& symbol, const std::string& sector) {
        std::lock_guard lock(mutex_);
        sectors_[symbol] = sector;
    }

    // getPrice для символа вернет ошибку
    void failPrice(const std::string& symbol) {
        std::lock_guard lock(mutex_);
        failing_.insert(symbol);
    }

    // getSector для символа бросит исключение
    void throwOnSector(const std::string& symbol) {
        std::lock_guard lock(mutex_);
        throwingSectors_.insert(symbol);
    }

    std::expected<double, std::string> getPrice(std::string_view symbol) override {
        ++priceCalls_;
        std::lock_guard lock(mutex_);
        std::string key(symbol);
        if (failing_.count(key)) {
            return std::unexpected("Quote service unavailable for " + key);
        }
        auto it = prices_.find(key);
        if (it == prices_.end()) {
            return std::unexpected("No quote for symbol: " + key);
        }
        return it->second;
    }

    std::string getSector(std::string_view symbol) override {
        ++sectorCalls_;
        std::lock_guard lock(mutex_);
        std::string key(symbol);
        if (throwingSectors_.count(key)) {
            throw std::runtime_error("Sector lookup failed for " + key);
        }
        auto it = sectors_.find(key);
        return it == sectors_.end() ? std::string(kUnknownSector) : it->second;
    }

    int priceCalls() const { return priceCalls_.load(); }
    int sectorCalls() const { return sectorCalls_.load(); }

private:
    std::mutex mutex_;
    std::map<std::string, double> prices_;
    std::map<std::string, std::string> sectors_;
    std::set<std::string> failing_;
    std::set<std::string> throwingSectors_;
    std::atomic<int> priceCalls_{0};
    std::atomic<int> sectorCalls_{0};
};

}  // namespace brokerage
