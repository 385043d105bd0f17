#include "SectorCache.hpp"
#include <iostream>
#include <stdexcept>

namespace brokerage {

SectorCache::SectorCache(
    std::shared_ptr<IPriceOracle> oracle,
    std::chrono::seconds ttl,
    std::shared_ptr<const IClock> clock)
    : oracle_(std::move(oracle))
    , ttl_(ttl)
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
{
    if (!oracle_) {
        throw std::invalid_argument("SectorCache: price oracle is required");
    }
}

std::string SectorCache::sectorFor(std::string_view symbol)
{
    std::string key = normalizeSymbol(symbol);
    TimePoint now = clock_->now();

    {
        std::lock_guard guard(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() &&
            (ttl_ == std::chrono::seconds::zero() || now - it->second.storedAt < ttl_)) {
            return it->second.sector;
        }
    }

    // Обращение к оракулу вне блокировки; при гонке побеждает последняя запись
    std::string sector = lookup(key);

    std::lock_guard guard(mutex_);
    entries_[key] = Entry{sector, now};
    return sector;
}

std::string SectorCache::lookup(const std::string& symbol)
{
    try {
        std::string sector = oracle_->getSector(symbol);
        if (sector.empty()) {
            return std::string(kUnknownSector);
        }
        return sector;
    } catch (const std::exception& e) {
        std::cerr << "⚠ Sector lookup failed for " << symbol << ": "
                  << e.what() << std::endl;
        return std::string(kUnknownSector);
    }
}

void SectorCache::evict(std::string_view symbol)
{
    std::lock_guard guard(mutex_);
    entries_.erase(normalizeSymbol(symbol));
}

void SectorCache::clear()
{
    std::lock_guard guard(mutex_);
    entries_.clear();
}

std::size_t SectorCache::size() const
{
    std::lock_guard guard(mutex_);
    return entries_.size();
}

}  // namespace brokerage
