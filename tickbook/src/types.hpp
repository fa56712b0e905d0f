#pragma once

#include <cstdint>

namespace tickbook {

// Strong typedefs for domain clarity
using Price = int64_t;    // Integer ticks (display scale comes from config)
using Qty = int64_t;      // Lots; signed so bad input can be detected
using OrderId = uint64_t; // Unique order identifier
using OwnerId = uint64_t; // Originator of an order (0 = anonymous)
using Sequence = uint64_t; // Engine-assigned monotonic sequence number

// Side of the order
enum class Side : uint8_t { Buy = 1, Sell = 2 };

// Order type
enum class OrderType : uint8_t { Limit = 1, Market = 2 };

// Lifecycle of an order
enum class OrderStatus : uint8_t { Active = 1, PartiallyFilled = 2, Filled = 3, Cancelled = 4 };

// What to do when an incoming order would trade against its own owner
enum class SelfMatchPolicy : uint8_t { Allow = 1, CancelTaker = 2, CancelResting = 3 };

[[nodiscard]] inline Side opposite(Side side) { return side == Side::Buy ? Side::Sell : Side::Buy; }

[[nodiscard]] inline const char* toString(Side side) { return side == Side::Buy ? "BUY" : "SELL"; }

[[nodiscard]] inline const char* toString(OrderType type) { return type == OrderType::Limit ? "LIMIT" : "MARKET"; }

[[nodiscard]] inline const char* toString(OrderStatus status)
{
    switch (status) {
    case OrderStatus::Active:
        return "Active";
    case OrderStatus::PartiallyFilled:
        return "PartiallyFilled";
    case OrderStatus::Filled:
        return "Filled";
    case OrderStatus::Cancelled:
        return "Cancelled";
    }
    return "?";
}

} // namespace tickbook
