#include "orderindex.hpp"
#include "errors.hpp"

#include <string>

namespace tickbook {

void OrderIndex::insert(OrderId id, const OrderLocator& locator)
{
    auto [iterator, inserted] = m_locators.try_emplace(id, locator);
    if (!inserted) {
        throw BookError(ErrorCode::DuplicateOrderId, "order " + std::to_string(id) + " already indexed");
    }
}

const OrderLocator& OrderIndex::lookup(OrderId id) const
{
    auto iterator = m_locators.find(id);
    if (iterator == m_locators.end()) {
        throw BookError(ErrorCode::UnknownOrderId, "order " + std::to_string(id) + " not found");
    }
    return iterator->second;
}

const OrderLocator* OrderIndex::find(OrderId id) const
{
    auto iterator = m_locators.find(id);
    if (iterator == m_locators.end()) {
        return nullptr;
    }
    return &iterator->second;
}

void OrderIndex::remove(OrderId id)
{
    if (m_locators.erase(id) == 0) {
        throw BookError(ErrorCode::UnknownOrderId, "order " + std::to_string(id) + " not found");
    }
}

void OrderIndex::updateLocator(OrderId id, const OrderLocator& locator)
{
    auto iterator = m_locators.find(id);
    if (iterator == m_locators.end()) {
        throw BookError(ErrorCode::UnknownOrderId, "order " + std::to_string(id) + " not found");
    }
    iterator->second = locator;
}

} // namespace tickbook
