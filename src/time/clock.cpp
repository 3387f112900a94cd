#include "time/clock.hpp"

#include <charconv>
#include <chrono>
#include <ctime>
#include <format>
#include <stdexcept>
#include <vector>

namespace {

std::tm to_local_tm(std::time_t seconds) {
    std::tm local{};
    if (localtime_r(&seconds, &local) == nullptr) {
        throw std::runtime_error("localtime_r failed");
    }
    return local;
}

} // namespace

Timestamp SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count())};
}

TimeOfDay SystemClock::time_of_day() const {
    std::tm local = to_local_tm(std::time(nullptr));
    return make_time_of_day(static_cast<std::uint32_t>(local.tm_hour),
                            static_cast<std::uint32_t>(local.tm_min),
                            static_cast<std::uint32_t>(local.tm_sec));
}

TimeOfDay parse_time_of_day(std::string_view text) {
    std::vector<std::uint32_t> fields;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t colon = text.find(':', pos);
        std::string_view part =
            text.substr(pos, colon == std::string_view::npos ? text.size() - pos
                                                             : colon - pos);
        std::uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size()) {
            throw std::invalid_argument("Invalid time of day: '" + std::string(text) + "'");
        }
        fields.push_back(value);
        if (colon == std::string_view::npos) {
            break;
        }
        pos = colon + 1;
    }

    if (fields.size() < 2 || fields.size() > 3) {
        throw std::invalid_argument("Invalid time of day: '" + std::string(text) +
                                    "' (expected HH:MM or HH:MM:SS)");
    }
    std::uint32_t seconds = fields.size() == 3 ? fields[2] : 0;
    if (fields[0] > 23 || fields[1] > 59 || seconds > 59) {
        throw std::invalid_argument("Time of day out of range: '" + std::string(text) + "'");
    }
    return make_time_of_day(fields[0], fields[1], seconds);
}

std::string format_time_of_day(TimeOfDay tod) {
    std::uint32_t s = tod.value();
    return std::format("{:02}:{:02}:{:02}", s / 3600, (s / 60) % 60, s % 60);
}

std::string format_timestamp(Timestamp ts) {
    auto seconds = static_cast<std::time_t>(ts.value() / MICROS_PER_SECOND);
    std::tm local = to_local_tm(seconds);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}", local.tm_year + 1900,
                       local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min,
                       local.tm_sec, ts.value() % MICROS_PER_SECOND);
}
