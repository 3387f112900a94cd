#pragma once

#include "config/configs.hpp"
#include "gateway/order_gateway.hpp"
#include "time/clock.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

// Credentials are reduced to the username; the password never leaves memory.
inline nlohmann::json to_json(const GatewayConfig& c) {
    return {{"username", c.credentials.username},
            {"session",
             {{"open", format_time_of_day(c.session.window.open)},
              {"close", format_time_of_day(c.session.window.close)},
              {"poll_interval_ms", c.session.poll_interval.count()}}},
            {"throttle",
             {{"max_orders_per_second", c.throttle.max_orders_per_second},
              {"interval_ms", c.throttle.interval.count()}}},
            {"dispatcher", {{"tick_interval_ms", c.dispatcher.tick_interval.count()}}},
            {"exchange",
             {{"latency_ms", c.exchange.latency.count()},
              {"reject_probability", c.exchange.reject_probability},
              {"seed", c.exchange.seed}}}};
}

inline nlohmann::json to_json(const GatewayStats& s) {
    return {{"submitted", s.submitted}, {"sent", s.sent},
            {"queued", s.queued},       {"rejected", s.rejected},
            {"modified", s.modified},   {"cancelled", s.cancelled},
            {"ignored", s.ignored},     {"still_queued", s.still_queued}};
}

/**
 * Writes <output_dir>/summary.json at the end of a run: the effective configuration
 * and the final gateway counters.
 */
class SummaryWriter {
public:
    void set_config(const GatewayConfig& config) { config_ = to_json(config); }

    void set_stats(const GatewayStats& stats) { stats_ = to_json(stats); }

    void set_run_window(Timestamp started_at, Timestamp finished_at) {
        run_["started_at"] = format_timestamp(started_at);
        run_["finished_at"] = format_timestamp(finished_at);
    }

    void write(const std::filesystem::path& output_dir) const {
        nlohmann::json summary;
        summary["config"] = config_;
        summary["stats"] = stats_;
        if (!run_.is_null()) {
            summary["run"] = run_;
        }

        std::filesystem::create_directories(output_dir);
        std::ofstream file(output_dir / "summary.json");
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open summary.json for writing");
        }
        file << summary.dump(2);
    }

private:
    nlohmann::json config_;
    nlohmann::json stats_;
    nlohmann::json run_;
};
