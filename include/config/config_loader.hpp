#pragma once

#include "config/configs.hpp"
#include "time/clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

/**
 * Reads an integer field that must fit a uint32 and be at least `min`. Read as int64 so a
 * negative value is reported instead of wrapping around.
 */
inline std::uint32_t read_uint32_field(const nlohmann::json& j, const char* key,
                                       std::int64_t min) {
    auto value = j.at(key).get<std::int64_t>();
    if (value < min || value > std::int64_t{std::numeric_limits<std::uint32_t>::max()}) {
        throw std::invalid_argument(std::string(key) + " out of range: " +
                                    std::to_string(value));
    }
    return static_cast<std::uint32_t>(value);
}

inline void from_json(const nlohmann::json& j, Credentials& c) {
    c.username = j.at("username").get<std::string>();
    if (j.contains("password")) {
        c.password = j.at("password").get<std::string>();
    }
}

inline void from_json(const nlohmann::json& j, ThrottleConfig& c) {
    c.max_orders_per_second = read_uint32_field(j, "max_orders_per_second", 1);
    if (j.contains("interval_ms")) {
        c.interval = std::chrono::milliseconds{j.at("interval_ms").get<std::int64_t>()};
    }
}

inline void from_json(const nlohmann::json& j, DispatcherConfig& c) {
    if (j.contains("tick_interval_ms")) {
        c.tick_interval =
            std::chrono::milliseconds{j.at("tick_interval_ms").get<std::int64_t>()};
    }
}

inline void from_json(const nlohmann::json& j, ExchangeConfig& c) {
    if (j.contains("latency_ms")) {
        c.latency = std::chrono::milliseconds{j.at("latency_ms").get<std::int64_t>()};
    }
    if (j.contains("reject_probability")) {
        c.reject_probability = j.at("reject_probability").get<double>();
    }
    if (j.contains("seed")) {
        c.seed = j.at("seed").get<std::uint64_t>();
    }
}

/**
 * Session window, either absolute ("open"/"close" as HH:MM:SS) or relative to the
 * supplied clock ("open_in_seconds"/"duration_seconds"). The relative form is meant
 * for demos and must not run past midnight.
 */
inline SessionConfig parse_session_config(const nlohmann::json& j, const Clock& clock) {
    SessionConfig c;
    if (j.contains("open_in_seconds") || j.contains("duration_seconds")) {
        std::uint32_t open_in = read_uint32_field(j, "open_in_seconds", 0);
        std::uint32_t duration = read_uint32_field(j, "duration_seconds", 1);
        std::uint64_t open = std::uint64_t{clock.time_of_day().value()} + open_in;
        std::uint64_t close = open + duration;
        if (close > SECONDS_PER_DAY) {
            throw std::invalid_argument("Relative session window runs past midnight");
        }
        c.window = SessionWindow{.open = TimeOfDay{static_cast<std::uint32_t>(open)},
                                 .close = TimeOfDay{static_cast<std::uint32_t>(close)}};
    } else {
        c.window =
            SessionWindow{.open = parse_time_of_day(j.at("open").get<std::string>()),
                          .close = parse_time_of_day(j.at("close").get<std::string>())};
    }

    if (j.contains("poll_interval_ms")) {
        c.poll_interval =
            std::chrono::milliseconds{j.at("poll_interval_ms").get<std::int64_t>()};
    }
    return c;
}

// Throws std::invalid_argument describing the first problem found.
inline void validate_config(const GatewayConfig& c) {
    c.session.window.validate();
    if (c.credentials.username.empty()) {
        throw std::invalid_argument("credentials.username must not be empty");
    }
    if (c.throttle.max_orders_per_second == 0) {
        throw std::invalid_argument("throttle.max_orders_per_second must be positive");
    }
    if (c.throttle.interval.count() <= 0) {
        throw std::invalid_argument("throttle.interval_ms must be positive");
    }
    if (c.session.poll_interval.count() <= 0) {
        throw std::invalid_argument("session.poll_interval_ms must be positive");
    }
    if (c.dispatcher.tick_interval.count() <= 0) {
        throw std::invalid_argument("dispatcher.tick_interval_ms must be positive");
    }
    if (c.exchange.latency.count() < 0) {
        throw std::invalid_argument("exchange.latency_ms must not be negative");
    }
    if (c.exchange.reject_probability < 0.0 || c.exchange.reject_probability > 1.0) {
        throw std::invalid_argument("exchange.reject_probability must be within [0, 1]");
    }
}

inline GatewayConfig parse_gateway_config(const nlohmann::json& j, const Clock& clock) {
    GatewayConfig c;
    c.credentials = j.at("credentials").get<Credentials>();
    c.session = parse_session_config(j.at("session"), clock);
    c.throttle = j.at("throttle").get<ThrottleConfig>();

    if (j.contains("dispatcher")) {
        c.dispatcher = j.at("dispatcher").get<DispatcherConfig>();
    }
    if (j.contains("exchange")) {
        c.exchange = j.at("exchange").get<ExchangeConfig>();
    }
    if (j.contains("output_dir")) {
        c.output_dir = j.at("output_dir").get<std::string>();
    }
    if (j.contains("verbose")) {
        c.verbose = j.at("verbose").get<bool>();
    }

    validate_config(c);
    return c;
}

inline GatewayConfig load_config(const std::filesystem::path& path, const Clock& clock) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    try {
        return parse_gateway_config(j, clock);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path.string() + ": " +
                                 std::string(e.what()));
    }
}
