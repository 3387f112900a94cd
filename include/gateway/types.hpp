#pragma once

#include "utils/types.hpp"

#include <cstdint>
#include <string>

enum class OrderSide : std::uint8_t { BUY = 0, SELL };

enum class OrderStatus : std::uint8_t {
    NEW = 0x00,
    QUEUED = 0x01,
    SENT = 0x02,
    MODIFIED = 0x03,
    CANCELLED = 0x04,
    REJECTED = 0x05
};

enum class Verdict : std::uint8_t { ACCEPT = 0, REJECT };

enum class RequestType : std::uint8_t { UNKNOWN = 0, NEW, MODIFY, CANCEL };

enum class RequestOutcome : std::uint8_t { APPLIED = 0, IGNORED };

enum class Phase : std::uint8_t { BEFORE_OPEN = 0, OPEN, CLOSED };

enum class SessionEventType : std::uint8_t { LOGON = 0, LOGOUT };

struct Order {
    OrderID order_id;       // 8 bytes
    Price price;            // 8 bytes
    Quantity quantity;      // 8 bytes
    Timestamp submitted_at; // 8 bytes
    SymbolID symbol_id;     // 4 bytes
    OrderSide side;         // 1 byte
    OrderStatus status;     // 1 byte
};

// Payload of a client new-order call. An order_id of 0 lets the gateway assign one.
struct NewOrder {
    OrderID order_id{0};
    SymbolID symbol_id;
    OrderSide side;
    Price price;
    Quantity quantity;
};

// Unified upstream message, routed by request_type.
struct OrderRequest {
    RequestType request_type;
    OrderID order_id;
    SymbolID symbol_id;
    OrderSide side;
    Price price;
    Quantity quantity;
};

struct OrderAck {
    OrderID order_id;
    OrderStatus status;
    std::string reason; // empty unless rejected
};

struct RequestAck {
    OrderID order_id;
    RequestOutcome outcome;
    std::string message;
};

// What the Sender hands back for one transmitted order.
struct SendReceipt {
    Verdict verdict;
    Timestamp sent_at;
};

struct ResponseRecord {
    OrderID order_id;
    Verdict verdict;
    Timestamp latency;
    Timestamp timestamp;
};

struct SessionEvent {
    SessionEventType type;
    std::string username;
    Timestamp timestamp;
};

[[nodiscard]] constexpr const char* order_side_to_string(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::NEW: return "NEW";
        case OrderStatus::QUEUED: return "QUEUED";
        case OrderStatus::SENT: return "SENT";
        case OrderStatus::MODIFIED: return "MODIFIED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* verdict_to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::ACCEPT: return "ACCEPT";
        case Verdict::REJECT: return "REJECT";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* request_type_to_string(RequestType type) {
    switch (type) {
        case RequestType::UNKNOWN: return "UNKNOWN";
        case RequestType::NEW: return "NEW";
        case RequestType::MODIFY: return "MODIFY";
        case RequestType::CANCEL: return "CANCEL";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::BEFORE_OPEN: return "BEFORE_OPEN";
        case Phase::OPEN: return "OPEN";
        case Phase::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr const char* session_event_to_string(SessionEventType type) {
    switch (type) {
        case SessionEventType::LOGON: return "LOGON";
        case SessionEventType::LOGOUT: return "LOGOUT";
    }
    return "UNKNOWN";
}
