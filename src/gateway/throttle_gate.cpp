#include "gateway/throttle_gate.hpp"

#include <stdexcept>

ThrottleGate::ThrottleGate(std::uint32_t cap, const Clock& clock, Timestamp interval)
    : cap_(cap), interval_(interval), clock_(clock), interval_start_(clock.now()) {
    if (cap_ == 0) {
        throw std::invalid_argument("Throttle cap must be positive");
    }
    if (interval_.is_zero()) {
        throw std::invalid_argument("Throttle interval must be positive");
    }
}

void ThrottleGate::roll_locked_(Timestamp now) {
    if (now < interval_start_ + interval_) {
        return;
    }
    Timestamp elapsed = now - interval_start_;
    interval_start_ = now - elapsed % interval_;
    sent_ = 0;
}

bool ThrottleGate::try_admit() {
    std::lock_guard<std::mutex> lk(mu_);
    roll_locked_(clock_.now());
    if (sent_ >= cap_) {
        return false;
    }
    ++sent_;
    return true;
}

void ThrottleGate::roll() {
    std::lock_guard<std::mutex> lk(mu_);
    roll_locked_(clock_.now());
}

std::uint32_t ThrottleGate::sent_in_interval() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
}

Timestamp ThrottleGate::time_until_next_interval() const {
    std::lock_guard<std::mutex> lk(mu_);
    return (interval_start_ + interval_) - clock_.now();
}
