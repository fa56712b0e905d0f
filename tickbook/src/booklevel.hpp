#pragma once

#include "types.hpp"

namespace tickbook {

struct BookLevel {
    Price price;    // Price at this level
    Qty totalQty;   // Sum of remaining quantity at this price
    int orderCount; // Number of orders at this level
};

inline bool operator==(const BookLevel& lhs, const BookLevel& rhs)
{
    return lhs.price == rhs.price && lhs.totalQty == rhs.totalQty && lhs.orderCount == rhs.orderCount;
}

} // namespace tickbook
