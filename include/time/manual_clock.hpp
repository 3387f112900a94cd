#pragma once

#include "time/clock.hpp"

#include <atomic>
#include <cstdint>

/**
 * Clock that only moves when told to. Safe to read from background threads while a
 * test thread advances it.
 */
class ManualClock : public Clock {
public:
    ManualClock(Timestamp now = Timestamp{0}, TimeOfDay tod = TimeOfDay{0})
        : now_(now.value()), tod_us_(tod.value() * MICROS_PER_SECOND) {}

    [[nodiscard]] Timestamp now() const override { return Timestamp{now_.load()}; }

    [[nodiscard]] TimeOfDay time_of_day() const override {
        return TimeOfDay{static_cast<std::uint32_t>(tod_us_.load() / MICROS_PER_SECOND)};
    }

    void set_now(Timestamp now) noexcept { now_.store(now.value()); }

    void set_time_of_day(TimeOfDay tod) noexcept {
        tod_us_.store(tod.value() * MICROS_PER_SECOND);
    }

    // Moves both readings forward; time of day wraps at midnight.
    void advance(Timestamp delta) noexcept {
        now_.fetch_add(delta.value());
        std::uint64_t tod = tod_us_.load();
        while (!tod_us_.compare_exchange_weak(tod, (tod + delta.value()) % MICROS_PER_DAY)) {
        }
    }

    ManualClock(const ManualClock&) = delete;
    void operator=(const ManualClock&) = delete;

private:
    static constexpr std::uint64_t MICROS_PER_DAY =
        std::uint64_t{SECONDS_PER_DAY} * MICROS_PER_SECOND;

    std::atomic<std::uint64_t> now_;
    std::atomic<std::uint64_t> tod_us_;
};
