#pragma once

#include "gateway/types.hpp"
#include "session/session_window.hpp"
#include "time/clock.hpp"
#include "time/periodic_task.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

struct PhaseTransition {
    Phase from;
    Phase to;
    Timestamp timestamp;
};

using PhaseTransitionCallback = std::function<void(const PhaseTransition&)>;

/**
 * Tracks the clock against the session window and owns the current phase.
 *
 * Phases only move forward: BEFORE_OPEN -> OPEN -> CLOSED, or BEFORE_OPEN -> CLOSED
 * when started after the window. BEFORE_OPEN -> OPEN fires the logon transition and
 * OPEN -> CLOSED fires the logout transition. CLOSED is final for the lifetime of the
 * controller. Callbacks run outside the phase lock but one at a time, in phase order,
 * even when poll() is called from several threads.
 */
class SessionController {
public:
    SessionController(SessionWindow window, const Clock& clock,
                      std::chrono::milliseconds poll_interval = std::chrono::milliseconds{100});

    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    void set_transition_callback(PhaseTransitionCallback callback);

    [[nodiscard]] Phase current_phase() const;

    // Single transition check. Returns the phase after the check.
    Phase poll();

    /**
     * Blocks until the phase is OPEN. Returns false when the session closes first or
     * the timeout expires.
     */
    [[nodiscard]] bool wait_until_open(std::chrono::milliseconds timeout) const;

    // Background polling at the configured interval.
    void start();
    void stop();

private:
    const SessionWindow window_;
    const Clock& clock_;

    // Held across computing and delivering a transition so callbacks see phase order.
    std::mutex delivery_mu_;
    mutable std::mutex mu_;
    mutable std::condition_variable phase_cv_;
    Phase phase_{Phase::BEFORE_OPEN};
    PhaseTransitionCallback callback_;

    PeriodicTask poller_;

    [[nodiscard]] Phase next_phase_(Phase current, TimeOfDay tod) const noexcept;
};
