#pragma once

#include "config/configs.hpp"
#include "gateway/dispatcher.hpp"
#include "gateway/pending_queue.hpp"
#include "gateway/response_recorder.hpp"
#include "gateway/sender.hpp"
#include "gateway/throttle_gate.hpp"
#include "gateway/types.hpp"
#include "session/session_controller.hpp"
#include "time/clock.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct GatewayStats {
    std::uint64_t submitted{0};
    std::uint64_t sent{0};
    std::uint64_t queued{0};
    std::uint64_t rejected{0};
    std::uint64_t modified{0};
    std::uint64_t cancelled{0};
    std::uint64_t ignored{0};
    std::uint64_t still_queued{0};
};

inline constexpr const char* REASON_OUTSIDE_WINDOW = "Not in allowed time window";
inline constexpr const char* REASON_INVALID_QUANTITY = "Invalid quantity";
inline constexpr const char* REASON_INVALID_PRICE = "Invalid price";
inline constexpr const char* REASON_DUPLICATE_ID = "Duplicate order id";

/**
 * Client entry point: new, modify and cancel.
 *
 * new_order passes the session check and basic validation, then goes to the
 * dispatcher, which sends it or queues it behind the throttle. modify_order and
 * cancel_order only ever touch the pending queue; an id that is not queued (already
 * sent, already cancelled, or unknown) is reported as ignored, never as a failure.
 *
 * The gateway owns the session controller, throttle, queue and dispatcher. The
 * clock, sender and recorder are supplied by the caller and must outlive it.
 */
class OrderGateway {
public:
    OrderGateway(const GatewayConfig& config, const Clock& clock, Sender& sender,
                 ResponseRecorder& recorder);

    ~OrderGateway();

    OrderGateway(const OrderGateway&) = delete;
    OrderGateway& operator=(const OrderGateway&) = delete;

    OrderAck new_order(const NewOrder& request);
    RequestAck modify_order(OrderID order_id, Price new_price, Quantity new_quantity);
    RequestAck cancel_order(OrderID order_id);

    // Routes a unified upstream message to the matching operation.
    RequestAck on_request(const OrderRequest& request);

    // Starts the session poller and the dispatcher tick.
    void start();
    // Stops both background tasks. Orders still queued stay in memory.
    void stop();

    [[nodiscard]] Phase phase() const { return session_.current_phase(); }
    [[nodiscard]] bool wait_for_open(std::chrono::milliseconds timeout) const {
        return session_.wait_until_open(timeout);
    }

    // Manual driving for tests and single-threaded callers.
    Phase poll_session() { return session_.poll(); }
    std::size_t tick() { return dispatcher_.drain(); }

    [[nodiscard]] std::optional<Order> find_queued(OrderID order_id) const {
        return queue_.find(order_id);
    }
    [[nodiscard]] std::size_t queued_count() const { return queue_.size(); }
    [[nodiscard]] GatewayStats stats() const;

    [[nodiscard]] const GatewayConfig& config() const noexcept { return config_; }

private:
    const GatewayConfig config_;
    const Clock& clock_;
    ResponseRecorder& recorder_;

    SessionController session_;
    ThrottleGate gate_;
    PendingQueue queue_;
    Dispatcher dispatcher_;

    std::atomic<std::uint64_t> next_order_id_{1};

    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> queued_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> modified_{0};
    std::atomic<std::uint64_t> cancelled_{0};
    std::atomic<std::uint64_t> ignored_{0};

    void on_phase_transition_(const PhaseTransition& transition);
    OrderID assign_order_id_(OrderID requested);
    OrderAck reject_(OrderID order_id, const char* reason);
    RequestAck ignore_(OrderID order_id, std::string message);
};
