#pragma once

#include "types.hpp"

namespace tickbook {

struct Order {
    OrderId id;          // Unique identifier
    Side side;           // Buy or Sell
    OrderType type;      // Limit or Market
    Price price;         // Limit price (0 for market orders)
    Qty qty;             // Original quantity
    Qty remaining;       // Quantity still open
    Sequence sequence;   // Time priority token
    OrderStatus status;  // Lifecycle state
    OwnerId owner;       // 0 when the originator is unknown

    // Check if order is fully filled
    [[nodiscard]] bool isFilled() const { return remaining == 0; }

    // Reduce remaining quantity (after partial fill)
    void fill(Qty amount)
    {
        remaining -= amount;
        status = remaining == 0 ? OrderStatus::Filled : OrderStatus::PartiallyFilled;
    }
};

} // namespace tickbook
