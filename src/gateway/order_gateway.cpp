#include "gateway/order_gateway.hpp"

#include <format>
#include <print>

OrderGateway::OrderGateway(const GatewayConfig& config, const Clock& clock, Sender& sender,
                           ResponseRecorder& recorder)
    : config_(config), clock_(clock), recorder_(recorder),
      session_(config.session.window, clock, config.session.poll_interval),
      gate_(config.throttle.max_orders_per_second, clock,
            from_millis(static_cast<std::uint64_t>(config.throttle.interval.count()))),
      dispatcher_(gate_, queue_, sender, recorder, clock, config.verbose) {
    session_.set_transition_callback(
        [this](const PhaseTransition& transition) { on_phase_transition_(transition); });
}

OrderGateway::~OrderGateway() { stop(); }

void OrderGateway::start() {
    session_.start();
    dispatcher_.start(config_.dispatcher.tick_interval);
}

void OrderGateway::stop() {
    session_.stop();
    dispatcher_.stop();
}

OrderAck OrderGateway::new_order(const NewOrder& request) {
    ++submitted_;
    OrderID order_id = assign_order_id_(request.order_id);

    if (session_.current_phase() != Phase::OPEN) {
        return reject_(order_id, REASON_OUTSIDE_WINDOW);
    }
    if (request.quantity.is_zero()) {
        return reject_(order_id, REASON_INVALID_QUANTITY);
    }
    if (request.price.is_zero()) {
        return reject_(order_id, REASON_INVALID_PRICE);
    }
    if (queue_.contains(order_id)) {
        return reject_(order_id, REASON_DUPLICATE_ID);
    }

    Order order{.order_id = order_id,
                .price = request.price,
                .quantity = request.quantity,
                .submitted_at = clock_.now(),
                .symbol_id = request.symbol_id,
                .side = request.side,
                .status = OrderStatus::NEW};

    OrderStatus status = dispatcher_.submit(std::move(order));
    if (status == OrderStatus::REJECTED) {
        // Lost a race with another submission of the same id.
        return reject_(order_id, REASON_DUPLICATE_ID);
    }
    if (status == OrderStatus::QUEUED) {
        ++queued_;
    }
    return OrderAck{.order_id = order_id, .status = status, .reason = {}};
}

RequestAck OrderGateway::modify_order(OrderID order_id, Price new_price,
                                      Quantity new_quantity) {
    if (new_price.is_zero() || new_quantity.is_zero()) {
        return ignore_(order_id, std::format("Modify request for {} ignored: invalid price "
                                             "or quantity.",
                                             order_id));
    }
    if (!queue_.modify(order_id, new_price, new_quantity)) {
        return ignore_(order_id,
                       std::format("Modify request for {} ignored: not in queue.", order_id));
    }

    ++modified_;
    std::string message = std::format("Order {} modified in queue.", order_id);
    if (config_.verbose) {
        std::println("{}", message);
    }
    return RequestAck{.order_id = order_id,
                      .outcome = RequestOutcome::APPLIED,
                      .message = std::move(message)};
}

RequestAck OrderGateway::cancel_order(OrderID order_id) {
    if (!queue_.cancel(order_id)) {
        return ignore_(order_id,
                       std::format("Cancel request for {} ignored: not in queue.", order_id));
    }

    ++cancelled_;
    std::string message = std::format("Order {} cancelled from queue.", order_id);
    if (config_.verbose) {
        std::println("{}", message);
    }
    return RequestAck{.order_id = order_id,
                      .outcome = RequestOutcome::APPLIED,
                      .message = std::move(message)};
}

RequestAck OrderGateway::on_request(const OrderRequest& request) {
    switch (request.request_type) {
        case RequestType::NEW: {
            OrderAck ack = new_order(NewOrder{.order_id = request.order_id,
                                              .symbol_id = request.symbol_id,
                                              .side = request.side,
                                              .price = request.price,
                                              .quantity = request.quantity});
            bool rejected = ack.status == OrderStatus::REJECTED;
            return RequestAck{
                .order_id = ack.order_id,
                .outcome = rejected ? RequestOutcome::IGNORED : RequestOutcome::APPLIED,
                .message = rejected ? ack.reason
                                    : std::format("Order {} {}.", ack.order_id,
                                                  order_status_to_string(ack.status))};
        }
        case RequestType::MODIFY:
            return modify_order(request.order_id, request.price, request.quantity);
        case RequestType::CANCEL:
            return cancel_order(request.order_id);
        case RequestType::UNKNOWN:
            break;
    }
    return ignore_(request.order_id,
                   std::format("Request for {} ignored: unknown request type.",
                               request.order_id));
}

GatewayStats OrderGateway::stats() const {
    return GatewayStats{.submitted = submitted_.load(),
                        .sent = dispatcher_.sent_count(),
                        .queued = queued_.load(),
                        .rejected = rejected_.load(),
                        .modified = modified_.load(),
                        .cancelled = cancelled_.load(),
                        .ignored = ignored_.load(),
                        .still_queued = queue_.size()};
}

void OrderGateway::on_phase_transition_(const PhaseTransition& transition) {
    SessionEventType type =
        transition.to == Phase::OPEN ? SessionEventType::LOGON : SessionEventType::LOGOUT;

    std::println("[{}] {} at {}", session_event_to_string(type), config_.credentials.username,
                 format_timestamp(transition.timestamp));
    recorder_.record_session_event(SessionEvent{.type = type,
                                                .username = config_.credentials.username,
                                                .timestamp = transition.timestamp});
}

OrderID OrderGateway::assign_order_id_(OrderID requested) {
    if (requested.is_zero()) {
        return OrderID{next_order_id_.fetch_add(1)};
    }
    // Keep generated ids clear of ids the caller picked.
    std::uint64_t next = next_order_id_.load();
    while (next <= requested.value() &&
           !next_order_id_.compare_exchange_weak(next, requested.value() + 1)) {
    }
    return requested;
}

OrderAck OrderGateway::reject_(OrderID order_id, const char* reason) {
    ++rejected_;
    if (config_.verbose) {
        std::println("Order {} rejected: {}.", order_id, reason);
    }
    return OrderAck{.order_id = order_id, .status = OrderStatus::REJECTED, .reason = reason};
}

RequestAck OrderGateway::ignore_(OrderID order_id, std::string message) {
    ++ignored_;
    if (config_.verbose) {
        std::println("{}", message);
    }
    return RequestAck{.order_id = order_id,
                      .outcome = RequestOutcome::IGNORED,
                      .message = std::move(message)};
}
