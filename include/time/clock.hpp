#pragma once

#include "utils/types.hpp"

#include <string>
#include <string_view>

/**
 * Source of wall-clock time for every gateway component.
 *
 * now() is used for throttle intervals and latencies, time_of_day() for the session
 * window. Both come from the same instant on a real clock; test clocks may set them
 * independently.
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
    [[nodiscard]] virtual TimeOfDay time_of_day() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] Timestamp now() const override;
    [[nodiscard]] TimeOfDay time_of_day() const override;
};

// Parses "HH:MM:SS" (or "HH:MM"). Throws std::invalid_argument on malformed input.
[[nodiscard]] TimeOfDay parse_time_of_day(std::string_view text);

[[nodiscard]] std::string format_time_of_day(TimeOfDay tod);

// ISO-8601 local time with microseconds, e.g. 2024-03-01T09:15:00.000123
[[nodiscard]] std::string format_timestamp(Timestamp ts);
