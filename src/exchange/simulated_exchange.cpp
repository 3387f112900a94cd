#include "exchange/simulated_exchange.hpp"

#include <thread>

SimulatedExchange::SimulatedExchange(const ExchangeConfig& config, const Clock& clock)
    : config_(config), clock_(clock), rng_(config.seed),
      reject_dist_(config.reject_probability) {}

SendReceipt SimulatedExchange::send(const Order&) {
    Timestamp sent_at = clock_.now();
    bool reject = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++received_;
        reject = reject_dist_(rng_);
    }

    std::this_thread::sleep_for(config_.latency);

    return SendReceipt{.verdict = reject ? Verdict::REJECT : Verdict::ACCEPT,
                       .sent_at = sent_at};
}

std::uint64_t SimulatedExchange::orders_received() const {
    std::lock_guard<std::mutex> lk(mu_);
    return received_;
}
