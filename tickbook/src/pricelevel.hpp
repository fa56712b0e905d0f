#pragma once

#include "order.hpp"

#include <list>

namespace tickbook {

class PriceLevel {
public:
    using Queue = std::list<Order>;     // FIFO queue (list for stable iterators)
    using Handle = Queue::iterator;     // Position of one order, valid until it leaves the level

    explicit PriceLevel(Price price);

    // Getters
    [[nodiscard]] Price price() const { return m_price; }
    [[nodiscard]] Qty totalQty() const { return m_totalQty; }
    [[nodiscard]] int orderCount() const { return static_cast<int>(m_orders.size()); }
    [[nodiscard]] bool isEmpty() const { return m_totalQty == 0; }

    // Add order to back of queue (time priority). Throws PriceMismatch.
    Handle enqueue(Order order);

    // Oldest resting order. Throws EmptyLevel.
    [[nodiscard]] Order& peekFront();
    [[nodiscard]] const Order& peekFront() const;
    [[nodiscard]] Handle frontHandle();

    // Remove and return the oldest order. Throws EmptyLevel.
    Order popFront();

    // Remove an arbitrary order in O(1)
    Order remove(Handle handle);

    // Execute qty against an order (0 < qty <= remaining)
    void fill(Handle handle, Qty qty);

    // Shrink an order in place, keeping its position (0 < qty < remaining)
    void reduce(Handle handle, Qty qty);

    // Re-sum member quantities; used only to verify the running total
    [[nodiscard]] Qty recomputeTotal() const;

    // Iterator access (for depth queries and audits)
    [[nodiscard]] auto begin() const { return m_orders.begin(); }
    [[nodiscard]] auto end() const { return m_orders.end(); }

private:
    Price m_price;
    Qty m_totalQty;
    Queue m_orders;
};

} // namespace tickbook
