#pragma once

#include "time/clock.hpp"
#include "utils/types.hpp"

#include <cstdint>
#include <mutex>

/**
 * Fixed-window rate limiter for outbound sends.
 *
 * At most `cap` admissions per interval. Intervals are aligned to the first interval
 * start, so the counter resets exactly once for every interval boundary crossed,
 * whether the reset comes from roll() or from try_admit().
 */
class ThrottleGate {
public:
    ThrottleGate(std::uint32_t cap, const Clock& clock,
                 Timestamp interval = Timestamp{MICROS_PER_SECOND});

    ThrottleGate(const ThrottleGate&) = delete;
    ThrottleGate& operator=(const ThrottleGate&) = delete;

    // Counts one send and returns true while under the cap; returns false otherwise.
    [[nodiscard]] bool try_admit();

    // Interval boundary reset, driven by the dispatcher tick.
    void roll();

    [[nodiscard]] std::uint32_t cap() const noexcept { return cap_; }
    [[nodiscard]] Timestamp interval() const noexcept { return interval_; }
    [[nodiscard]] std::uint32_t sent_in_interval() const;
    [[nodiscard]] Timestamp time_until_next_interval() const;

private:
    const std::uint32_t cap_;
    const Timestamp interval_;
    const Clock& clock_;

    mutable std::mutex mu_;
    std::uint32_t sent_{0};
    Timestamp interval_start_;

    void roll_locked_(Timestamp now);
};
