#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

/**
 * Runs a callback every `period` on a dedicated thread until stopped.
 *
 * The callback runs once immediately on start(). stop() interrupts the sleep between
 * runs, so shutdown never waits out a full period. A callback already in progress is
 * allowed to finish.
 */
class PeriodicTask {
public:
    PeriodicTask(std::chrono::milliseconds period, std::function<void()> fn)
        : period_(period), fn_(std::move(fn)) {}

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (thread_.joinable()) {
            return;
        }
        thread_ = std::jthread([this](std::stop_token st) { run(st); });
    }

    void stop() {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        if (!thread_.joinable()) {
            return;
        }
        thread_.request_stop();
        thread_.join();
        thread_ = std::jthread{};
    }

    [[nodiscard]] bool running() const {
        std::lock_guard<std::mutex> lk(lifecycle_mu_);
        return thread_.joinable();
    }

    [[nodiscard]] std::chrono::milliseconds period() const noexcept { return period_; }

private:
    void run(std::stop_token st) {
        while (!st.stop_requested()) {
            fn_();
            std::unique_lock<std::mutex> lk(sleep_mu_);
            sleep_cv_.wait_for(lk, st, period_, [] { return false; });
        }
    }

    const std::chrono::milliseconds period_;
    std::function<void()> fn_;

    mutable std::mutex lifecycle_mu_;
    std::mutex sleep_mu_;
    std::condition_variable_any sleep_cv_;
    std::jthread thread_;
};
