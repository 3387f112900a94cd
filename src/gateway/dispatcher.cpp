#include "gateway/dispatcher.hpp"

#include <exception>
#include <iostream>
#include <print>

Dispatcher::Dispatcher(ThrottleGate& gate, PendingQueue& queue, Sender& sender,
                       ResponseRecorder& recorder, const Clock& clock, bool verbose)
    : gate_(gate), queue_(queue), sender_(sender), recorder_(recorder), clock_(clock),
      verbose_(verbose) {}

Dispatcher::~Dispatcher() { stop(); }

OrderStatus Dispatcher::submit(Order order) {
    if (gate_.try_admit()) {
        dispatch_(order);
        return OrderStatus::SENT;
    }

    OrderID order_id = order.order_id;
    if (!queue_.enqueue(std::move(order))) {
        return OrderStatus::REJECTED;
    }
    if (verbose_) {
        std::println("Order {} queued due to throttle.", order_id);
    }
    return OrderStatus::QUEUED;
}

std::size_t Dispatcher::drain() {
    gate_.roll();
    std::vector<Order> ready = queue_.drain_admissible(gate_);
    for (auto& order : ready) {
        dispatch_(order);
    }
    return ready.size();
}

void Dispatcher::dispatch_(Order& order) {
    order.status = OrderStatus::SENT;

    SendReceipt receipt{.verdict = Verdict::REJECT, .sent_at = clock_.now()};
    try {
        receipt = sender_.send(order);
    } catch (const std::exception& e) {
        std::cerr << "Error: send failed for order " << order.order_id << ": " << e.what()
                  << "\n";
    }
    ++sent_;

    Timestamp responded_at = clock_.now();
    ResponseRecord record{.order_id = order.order_id,
                          .verdict = receipt.verdict,
                          .latency = responded_at - receipt.sent_at,
                          .timestamp = responded_at};
    recorder_.record(record);

    if (verbose_) {
        std::println("Order {} sent to exchange. Response: {}, Latency: {:.2f} ms",
                     order.order_id, verdict_to_string(record.verdict),
                     to_millis(record.latency));
    }
}

void Dispatcher::start(std::chrono::milliseconds tick) {
    if (ticker_ && ticker_->running()) {
        return;
    }
    ticker_ = std::make_unique<PeriodicTask>(tick, [this] { drain(); });
    ticker_->start();
}

void Dispatcher::stop() {
    if (ticker_) {
        ticker_->stop();
    }
}
