#pragma once

#include "gateway/pending_queue.hpp"
#include "gateway/response_recorder.hpp"
#include "gateway/sender.hpp"
#include "gateway/throttle_gate.hpp"
#include "time/clock.hpp"
#include "time/periodic_task.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

/**
 * Moves admitted orders to the Sender under the throttle.
 *
 * New orders try the gate immediately from the caller's thread and are queued on
 * denial. A periodic tick rolls the gate and flushes the queue backlog in FIFO order.
 * Every order handed to the Sender produces exactly one ResponseRecord.
 */
class Dispatcher {
public:
    Dispatcher(ThrottleGate& gate, PendingQueue& queue, Sender& sender,
               ResponseRecorder& recorder, const Clock& clock, bool verbose = true);

    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // SENT when the gate admits it, QUEUED on denial, REJECTED if the id is already queued.
    [[nodiscard]] OrderStatus submit(Order order);

    // One scheduling tick. Returns the number of queued orders sent.
    std::size_t drain();

    void start(std::chrono::milliseconds tick = std::chrono::milliseconds{10});
    void stop();

    [[nodiscard]] std::uint64_t sent_count() const noexcept { return sent_.load(); }

private:
    ThrottleGate& gate_;
    PendingQueue& queue_;
    Sender& sender_;
    ResponseRecorder& recorder_;
    const Clock& clock_;
    const bool verbose_;

    std::atomic<std::uint64_t> sent_{0};
    std::unique_ptr<PeriodicTask> ticker_;

    void dispatch_(Order& order);
};
