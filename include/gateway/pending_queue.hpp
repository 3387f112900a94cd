#pragma once

#include "gateway/throttle_gate.hpp"
#include "gateway/types.hpp"

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * FIFO of orders that passed session admission but were held back by the throttle.
 *
 * Storage is a list in arrival order plus an id index into it, so modify and cancel
 * are O(1) and never disturb the position of other entries. Every operation holds the
 * queue lock for its whole duration: a modify or cancel racing a drain sees the queue
 * either entirely before or entirely after that drain.
 */
class PendingQueue {
public:
    PendingQueue() = default;

    PendingQueue(const PendingQueue&) = delete;
    PendingQueue& operator=(const PendingQueue&) = delete;

    // Appends with status QUEUED. Returns false if the id is already queued.
    [[nodiscard]] bool enqueue(Order order);

    // Updates price and quantity in place, keeping the id and FIFO position.
    [[nodiscard]] bool modify(OrderID order_id, Price new_price, Quantity new_quantity);

    // Removes the order and returns it with status CANCELLED, or nullopt if not queued.
    [[nodiscard]] std::optional<Order> cancel(OrderID order_id);

    /**
     * Pulls orders from the front while the gate admits them. Stops at the first
     * denial so a later order never overtakes an earlier one. Returned orders are no
     * longer in the queue.
     */
    [[nodiscard]] std::vector<Order> drain_admissible(ThrottleGate& gate);

    [[nodiscard]] std::optional<Order> find(OrderID order_id) const;
    [[nodiscard]] bool contains(OrderID order_id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    // Queued ids, front first.
    [[nodiscard]] std::vector<OrderID> ids() const;

private:
    mutable std::mutex mu_;
    std::list<Order> orders_;
    std::unordered_map<OrderID, std::list<Order>::iterator, strong_hash<OrderID>> index_;
};
