#include "pricelevel.hpp"
#include "errors.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace tickbook {

PriceLevel::PriceLevel(Price price) : m_price(price), m_totalQty(0) {}

PriceLevel::Handle PriceLevel::enqueue(Order order)
{
    if (order.price != m_price) {
        throw BookError(ErrorCode::PriceMismatch, "order " + std::to_string(order.id) + " priced " +
                                                      std::to_string(order.price) + " at level " +
                                                      std::to_string(m_price));
    }

    m_totalQty += order.remaining;
    m_orders.push_back(std::move(order));
    return std::prev(m_orders.end());
}

Order& PriceLevel::peekFront()
{
    if (m_orders.empty()) {
        throw BookError(ErrorCode::EmptyLevel, "no orders at price " + std::to_string(m_price));
    }
    return m_orders.front();
}

const Order& PriceLevel::peekFront() const
{
    if (m_orders.empty()) {
        throw BookError(ErrorCode::EmptyLevel, "no orders at price " + std::to_string(m_price));
    }
    return m_orders.front();
}

PriceLevel::Handle PriceLevel::frontHandle()
{
    if (m_orders.empty()) {
        throw BookError(ErrorCode::EmptyLevel, "no orders at price " + std::to_string(m_price));
    }
    return m_orders.begin();
}

Order PriceLevel::popFront() { return remove(frontHandle()); }

Order PriceLevel::remove(Handle handle)
{
    Order order = std::move(*handle);
    m_totalQty -= order.remaining;
    m_orders.erase(handle);
    return order;
}

void PriceLevel::fill(Handle handle, Qty qty)
{
    if (qty <= 0 || qty > handle->remaining) {
        throw BookError(ErrorCode::InvalidQuantity, "fill of " + std::to_string(qty) + " against order " +
                                                        std::to_string(handle->id) + " with " +
                                                        std::to_string(handle->remaining) + " open");
    }

    handle->fill(qty);
    m_totalQty -= qty;
}

void PriceLevel::reduce(Handle handle, Qty qty)
{
    if (qty <= 0 || qty >= handle->remaining) {
        throw BookError(ErrorCode::InvalidQuantity, "reduce by " + std::to_string(qty) + " on order " +
                                                        std::to_string(handle->id) + " with " +
                                                        std::to_string(handle->remaining) + " open");
    }

    handle->remaining -= qty;
    m_totalQty -= qty;
}

Qty PriceLevel::recomputeTotal() const
{
    Qty total = 0;
    for (const auto& order : m_orders) {
        total += order.remaining;
    }
    return total;
}

} // namespace tickbook
