#pragma once

#include "config/configs.hpp"
#include "gateway/sender.hpp"
#include "time/clock.hpp"

#include <cstdint>
#include <mutex>
#include <random>

/**
 * Stand-in for the exchange connection. Each send blocks for the configured round
 * trip and answers ACCEPT, or REJECT with the configured probability.
 */
class SimulatedExchange : public Sender {
public:
    SimulatedExchange(const ExchangeConfig& config, const Clock& clock);

    SendReceipt send(const Order& order) override;

    [[nodiscard]] std::uint64_t orders_received() const;

private:
    const ExchangeConfig config_;
    const Clock& clock_;

    mutable std::mutex mu_;
    std::mt19937_64 rng_;
    std::bernoulli_distribution reject_dist_;
    std::uint64_t received_{0};
};
