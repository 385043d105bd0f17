#pragma once

#include "LedgerTypes.hpp"
#include <atomic>
#include <chrono>

namespace brokerage {

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: IClock
// ═══════════════════════════════════════════════════════════════════════════════

// Источник текущего времени: метки сделок, дедлайны, точка "сейчас"
// в кривой капитала, срок жизни кэша секторов
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// SimulationClock - время задается явно (тесты, воспроизведение)
// ═══════════════════════════════════════════════════════════════════════════════

class SimulationClock final : public IClock {
public:
    explicit SimulationClock(TimePoint start = TimePoint{})
        : ticks_(start.time_since_epoch().count()) {}

    TimePoint now() const override {
        return TimePoint(TimePoint::duration(ticks_.load()));
    }

    void set(TimePoint value) {
        ticks_.store(value.time_since_epoch().count());
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        ticks_.fetch_add(
            std::chrono::duration_cast<TimePoint::duration>(delta).count());
    }

private:
    std::atomic<TimePoint::rep> ticks_;
};

}  // namespace brokerage
