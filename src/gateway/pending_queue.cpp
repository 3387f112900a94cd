#include "gateway/pending_queue.hpp"

#include <iterator>
#include <utility>

bool PendingQueue::enqueue(Order order) {
    std::lock_guard<std::mutex> lk(mu_);
    if (index_.contains(order.order_id)) {
        return false;
    }
    order.status = OrderStatus::QUEUED;
    orders_.push_back(std::move(order));
    index_.emplace(orders_.back().order_id, std::prev(orders_.end()));
    return true;
}

bool PendingQueue::modify(OrderID order_id, Price new_price, Quantity new_quantity) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(order_id);
    if (it == index_.end()) {
        return false;
    }
    Order& order = *it->second;
    order.price = new_price;
    order.quantity = new_quantity;
    order.status = OrderStatus::MODIFIED;
    return true;
}

std::optional<Order> PendingQueue::cancel(OrderID order_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(order_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    Order cancelled = std::move(*it->second);
    cancelled.status = OrderStatus::CANCELLED;
    orders_.erase(it->second);
    index_.erase(it);
    return cancelled;
}

std::vector<Order> PendingQueue::drain_admissible(ThrottleGate& gate) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Order> drained;
    while (!orders_.empty() && gate.try_admit()) {
        index_.erase(orders_.front().order_id);
        drained.push_back(std::move(orders_.front()));
        orders_.pop_front();
    }
    return drained;
}

std::optional<Order> PendingQueue::find(OrderID order_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(order_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return *it->second;
}

bool PendingQueue::contains(OrderID order_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return index_.contains(order_id);
}

std::size_t PendingQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return orders_.size();
}

bool PendingQueue::empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return orders_.empty();
}

std::vector<OrderID> PendingQueue::ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<OrderID> result;
    result.reserve(orders_.size());
    for (const auto& order : orders_) {
        result.push_back(order.order_id);
    }
    return result;
}
