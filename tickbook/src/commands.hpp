#pragma once

#include "errors.hpp"
#include "trade.hpp"

#include <optional>
#include <variant>
#include <vector>

namespace tickbook {

// ---- Input commands ----

struct NewLimitOrder {
    OrderId id;
    Side side;
    Price price;
    Qty qty;
    OwnerId owner = 0;
};

struct NewMarketOrder {
    OrderId id;
    Side side;
    Qty qty;
    OwnerId owner = 0;
};

struct CancelOrder {
    OrderId id;
};

struct ModifyOrder {
    OrderId id;
    Qty newQty;
    std::optional<Price> newPrice; // Empty keeps the current price
};

using Command = std::variant<NewLimitOrder, NewMarketOrder, CancelOrder, ModifyOrder>;

// Generic order entry; market orders must leave price at 0
struct OrderRequest {
    OrderId id;
    Side side;
    OrderType type;
    Price price;
    Qty qty;
    OwnerId owner;
};

// Outcome of one command as seen by the caller
struct CommandResult {
    ErrorCode error = ErrorCode::None;
    std::vector<Trade> trades;
    Qty filledQty = 0;    // Traded by the incoming order
    Qty restingQty = 0;   // Left resting in the book
    Qty cancelledQty = 0; // Removed without trading

    [[nodiscard]] bool ok() const { return error == ErrorCode::None; }
};

} // namespace tickbook
