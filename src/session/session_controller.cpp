#include "session/session_controller.hpp"

#include <optional>

SessionController::SessionController(SessionWindow window, const Clock& clock,
                                     std::chrono::milliseconds poll_interval)
    : window_(window), clock_(clock), poller_(poll_interval, [this] { poll(); }) {
    window_.validate();
}

SessionController::~SessionController() { stop(); }

void SessionController::set_transition_callback(PhaseTransitionCallback callback) {
    std::lock_guard<std::mutex> lk(mu_);
    callback_ = std::move(callback);
}

Phase SessionController::current_phase() const {
    std::lock_guard<std::mutex> lk(mu_);
    return phase_;
}

Phase SessionController::next_phase_(Phase current, TimeOfDay tod) const noexcept {
    switch (current) {
        case Phase::BEFORE_OPEN:
            if (window_.contains(tod)) {
                return Phase::OPEN;
            }
            return tod >= window_.close ? Phase::CLOSED : Phase::BEFORE_OPEN;
        case Phase::OPEN:
            // tod < open means the clock went past midnight while open.
            return window_.contains(tod) ? Phase::OPEN : Phase::CLOSED;
        case Phase::CLOSED:
            return Phase::CLOSED;
    }
    return current;
}

Phase SessionController::poll() {
    std::lock_guard<std::mutex> delivery(delivery_mu_);
    std::optional<PhaseTransition> transition;
    PhaseTransitionCallback callback;
    Phase result{};
    {
        std::lock_guard<std::mutex> lk(mu_);
        Phase next = next_phase_(phase_, clock_.time_of_day());
        if (next != phase_) {
            // BEFORE_OPEN -> CLOSED happens when started after the window; nobody logged
            // on, so there is nothing to log out of.
            if (!(phase_ == Phase::BEFORE_OPEN && next == Phase::CLOSED)) {
                transition = PhaseTransition{.from = phase_, .to = next,
                                             .timestamp = clock_.now()};
                callback = callback_;
            }
            phase_ = next;
            phase_cv_.notify_all();
        }
        result = phase_;
    }

    if (transition && callback) {
        callback(*transition);
    }
    return result;
}

bool SessionController::wait_until_open(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mu_);
    phase_cv_.wait_for(lk, timeout, [this] { return phase_ != Phase::BEFORE_OPEN; });
    return phase_ == Phase::OPEN;
}

void SessionController::start() { poller_.start(); }

void SessionController::stop() { poller_.stop(); }
