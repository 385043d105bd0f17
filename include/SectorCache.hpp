#pragma once

#include "IPriceOracle.hpp"
#include "Clock.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// SectorCache - кэш symbol -> sector поверх IPriceOracle
// ═══════════════════════════════════════════════════════════════════════════════
//
// Ошибки поиска кэшируются как "Unknown", как и успешные ответы.
// ttl == 0: записи живут до evict()/clear().

class SectorCache {
public:
    explicit SectorCache(
        std::shared_ptr<IPriceOracle> oracle,
        std::chrono::seconds ttl = std::chrono::seconds::zero(),
        std::shared_ptr<const IClock> clock = nullptr);

    std::string sectorFor(std::string_view symbol);

    void evict(std::string_view symbol);
    void clear();
    std::size_t size() const;

private:
    struct Entry {
        std::string sector;
        TimePoint storedAt;
    };

    std::string lookup(const std::string& symbol);

    std::shared_ptr<IPriceOracle> oracle_;
    std::chrono::seconds ttl_;
    std::shared_ptr<const IClock> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}  // namespace brokerage
