#pragma once

#include "errors.hpp"
#include "types.hpp"

#include <optional>
#include <variant>

namespace tickbook {

// Why an order left the book without trading
enum class CancelReason : uint8_t {
    Requested = 1,       // Explicit cancel command
    MarketRemainder = 2, // Unfilled part of a market order
    SelfMatch = 3        // Removed by self-match prevention
};

[[nodiscard]] inline const char* toString(CancelReason reason)
{
    switch (reason) {
    case CancelReason::Requested:
        return "Requested";
    case CancelReason::MarketRemainder:
        return "MarketRemainder";
    case CancelReason::SelfMatch:
        return "SelfMatch";
    }
    return "?";
}

// ---- Events published to the EventSink ----

struct OrderAccepted {
    OrderId id;
    Side side;
    OrderType type;
    Price price; // 0 for market orders
    Qty qty;
    Sequence sequence;
};

struct OrderRejected {
    OrderId id;
    ErrorCode reason;
};

struct TradeExecuted {
    OrderId makerId;
    OrderId takerId;
    Side takerSide;
    Price price; // Maker's resting price
    Qty qty;
    Sequence sequence;
};

// Residual of an incoming limit order now resting in the book
struct OrderRested {
    OrderId id;
    Side side;
    Price price;
    Qty remaining;
    Sequence sequence; // Time priority token
};

struct OrderCancelled {
    OrderId id;
    Qty cancelledQty;
    CancelReason reason;
};

struct OrderModified {
    OrderId id;
    Price price;
    Qty remaining;
    bool priorityKept; // false when re-entered as a new order
};

// Best price or its aggregate changed on one side
struct BookTopChanged {
    Side side;
    std::optional<Price> bestPrice; // Empty when the side has no liquidity
    Qty totalQty;                   // Aggregate at the best price
};

using Event =
    std::variant<OrderAccepted, OrderRejected, TradeExecuted, OrderRested, OrderCancelled, OrderModified, BookTopChanged>;

} // namespace tickbook
