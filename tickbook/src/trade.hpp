#pragma once

#include "types.hpp"

namespace tickbook {

struct Trade {
    OrderId makerOrderId; // Passive order (was resting in book)
    OrderId takerOrderId; // Aggressive order
    Side takerSide;       // Side of the taker
    Price price;          // Execution price (maker's price)
    Qty qty;              // Quantity traded
    Sequence sequence;    // Engine sequence number
};

} // namespace tickbook
