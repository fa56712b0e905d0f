#include "bookside.hpp"

#include <algorithm>

namespace tickbook {

BookSide::BookSide(Side side) : m_side(side), m_levels(PricePriority{side}) {}

PriceLevel* BookSide::bestLevel()
{
    if (m_levels.empty()) {
        return nullptr;
    }
    return &m_levels.begin()->second;
}

const PriceLevel* BookSide::bestLevel() const
{
    if (m_levels.empty()) {
        return nullptr;
    }
    return &m_levels.begin()->second;
}

std::optional<Price> BookSide::bestPrice() const
{
    if (m_levels.empty()) {
        return std::nullopt;
    }
    return m_levels.begin()->first;
}

PriceLevel& BookSide::getOrCreateLevel(Price price)
{
    auto [iterator, inserted] = m_levels.try_emplace(price, price);
    return iterator->second;
}

PriceLevel* BookSide::findLevel(Price price)
{
    auto iterator = m_levels.find(price);
    if (iterator == m_levels.end()) {
        return nullptr;
    }
    return &iterator->second;
}

const PriceLevel* BookSide::findLevel(Price price) const
{
    auto iterator = m_levels.find(price);
    if (iterator == m_levels.end()) {
        return nullptr;
    }
    return &iterator->second;
}

bool BookSide::removeLevelIfEmpty(Price price)
{
    auto iterator = m_levels.find(price);
    if (iterator != m_levels.end() && iterator->second.isEmpty()) {
        m_levels.erase(iterator);
        return true;
    }
    return false;
}

bool BookSide::crosses(Price limit) const
{
    if (m_levels.empty()) {
        return false;
    }
    // Resting best is at least as good as the incoming limit
    return !isBetter(limit, m_levels.begin()->first);
}

std::vector<BookLevel> BookSide::depth(size_t levels) const
{
    std::vector<BookLevel> result;
    result.reserve(std::min(levels, m_levels.size()));

    for (const auto& [price, level] : m_levels) {
        if (result.size() >= levels) {
            break;
        }
        result.push_back({price, level.totalQty(), level.orderCount()});
    }

    return result;
}

size_t BookSide::orderCount() const
{
    size_t count = 0;
    for (const auto& [price, level] : m_levels) {
        count += static_cast<size_t>(level.orderCount());
    }
    return count;
}

Qty BookSide::totalQty() const
{
    Qty total = 0;
    for (const auto& [price, level] : m_levels) {
        total += level.totalQty();
    }
    return total;
}

} // namespace tickbook
