#pragma once

#include "booklevel.hpp"
#include "pricelevel.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace tickbook {

// One side of the book: price levels kept best price first.
class BookSide {
public:
    // Bids: sorted descending (highest price first)
    // Asks: sorted ascending (lowest price first)
    struct PricePriority {
        Side side;
        bool operator()(Price lhs, Price rhs) const { return side == Side::Buy ? lhs > rhs : lhs < rhs; }
    };

    using Levels = std::map<Price, PriceLevel, PricePriority>;

    explicit BookSide(Side side);

    [[nodiscard]] Side side() const { return m_side; }

    // Most aggressive level, or nullptr when the side has no liquidity
    [[nodiscard]] PriceLevel* bestLevel();
    [[nodiscard]] const PriceLevel* bestLevel() const;
    [[nodiscard]] std::optional<Price> bestPrice() const;

    // Existing level at price, or a new empty one inserted in order
    PriceLevel& getOrCreateLevel(Price price);

    [[nodiscard]] PriceLevel* findLevel(Price price);
    [[nodiscard]] const PriceLevel* findLevel(Price price) const;

    // Drop the level once its aggregate reaches zero; true if erased
    bool removeLevelIfEmpty(Price price);

    // True if an opposite-side order limited at `limit` trades with the best level
    [[nodiscard]] bool crosses(Price limit) const;

    // True if `lhs` has priority over `rhs` on this side
    [[nodiscard]] bool isBetter(Price lhs, Price rhs) const { return m_levels.key_comp()(lhs, rhs); }

    // Top N levels, best first
    [[nodiscard]] std::vector<BookLevel> depth(size_t levels) const;

    // Statistics
    [[nodiscard]] bool empty() const { return m_levels.empty(); }
    [[nodiscard]] size_t levelCount() const { return m_levels.size(); }
    [[nodiscard]] size_t orderCount() const;
    [[nodiscard]] Qty totalQty() const;

    // Iteration from best to worst; restartable
    [[nodiscard]] Levels::iterator begin() { return m_levels.begin(); }
    [[nodiscard]] Levels::iterator end() { return m_levels.end(); }
    [[nodiscard]] Levels::const_iterator begin() const { return m_levels.begin(); }
    [[nodiscard]] Levels::const_iterator end() const { return m_levels.end(); }

private:
    Side m_side;
    Levels m_levels;
};

} // namespace tickbook
