#pragma once

#include "session/session_window.hpp"
#include "utils/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * Logon identity. The password is only carried through for the logon message and is
 * never written to any output file.
 */
struct Credentials {
    std::string username;
    std::string password;
};

/**
 * Trading window plus how often the controller checks the clock against it.
 */
struct SessionConfig {
    SessionWindow window{};
    std::chrono::milliseconds poll_interval{100};
};

/**
 * Outbound rate limit: at most max_orders_per_second sends per interval.
 * The interval defaults to one second and is only shortened by tests and demos.
 */
struct ThrottleConfig {
    std::uint32_t max_orders_per_second{0};
    std::chrono::milliseconds interval{1000};
};

struct DispatcherConfig {
    std::chrono::milliseconds tick_interval{10};
};

/**
 * Parameters of the simulated exchange used by the demo executable.
 *
 * reject_probability: chance in [0, 1] that an order comes back REJECT.
 * latency: simulated round trip per order.
 */
struct ExchangeConfig {
    std::chrono::milliseconds latency{50};
    double reject_probability{0.0};
    std::uint64_t seed{42};
};

/**
 * Complete gateway configuration loaded from a JSON file.
 */
struct GatewayConfig {
    Credentials credentials;
    SessionConfig session;
    ThrottleConfig throttle;
    DispatcherConfig dispatcher;
    ExchangeConfig exchange;
    std::filesystem::path output_dir{"./output"};
    bool verbose{true};
};
