#pragma once

#include "pricelevel.hpp"

#include <cstddef>
#include <unordered_map>

namespace tickbook {

// Where a resting order lives. Non-owning; the handle is invalidated once the
// order leaves its level.
struct OrderLocator {
    Side side;
    Price price;
    PriceLevel::Handle handle;
};

// Fast order lookup by ID for cancel and modify
class OrderIndex {
public:
    // Throws DuplicateOrderId
    void insert(OrderId id, const OrderLocator& locator);

    // Throws UnknownOrderId
    [[nodiscard]] const OrderLocator& lookup(OrderId id) const;

    // Non-throwing probe, nullptr when absent
    [[nodiscard]] const OrderLocator* find(OrderId id) const;

    // Throws UnknownOrderId
    void remove(OrderId id);

    // Throws UnknownOrderId
    void updateLocator(OrderId id, const OrderLocator& locator);

    [[nodiscard]] bool contains(OrderId id) const { return m_locators.count(id) != 0; }
    [[nodiscard]] size_t size() const { return m_locators.size(); }

    [[nodiscard]] auto begin() const { return m_locators.begin(); }
    [[nodiscard]] auto end() const { return m_locators.end(); }

private:
    std::unordered_map<OrderId, OrderLocator> m_locators;
};

} // namespace tickbook
