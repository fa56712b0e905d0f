#include "../src/bookside.hpp"
#include <gtest/gtest.h>

using namespace tickbook;

namespace {

Order restingOrder(OrderId id, Side side, Price price, Qty qty)
{
    return {id, side, OrderType::Limit, price, qty, qty, id, OrderStatus::Active, 0};
}

std::vector<Price> prices(const BookSide& side)
{
    std::vector<Price> result;
    for (const auto& [price, level] : side) {
        result.push_back(price);
    }
    return result;
}

} // namespace

TEST(BookSideTest, EmptySideHasNoLiquidity)
{
    BookSide bids(Side::Buy);

    EXPECT_TRUE(bids.empty());
    EXPECT_EQ(nullptr, bids.bestLevel());
    EXPECT_FALSE(bids.bestPrice().has_value());
    EXPECT_FALSE(bids.crosses(1));
    EXPECT_TRUE(bids.depth(5).empty());
}

TEST(BookSideTest, BidsBestIsHighest)
{
    BookSide bids(Side::Buy);
    bids.getOrCreateLevel(9900);
    bids.getOrCreateLevel(10100);
    bids.getOrCreateLevel(10000);

    EXPECT_EQ((std::vector<Price>{10100, 10000, 9900}), prices(bids));
    EXPECT_EQ(10100, bids.bestPrice().value());
    EXPECT_TRUE(bids.isBetter(10100, 10000));
}

TEST(BookSideTest, AsksBestIsLowest)
{
    BookSide asks(Side::Sell);
    asks.getOrCreateLevel(10100);
    asks.getOrCreateLevel(9900);
    asks.getOrCreateLevel(10000);

    EXPECT_EQ((std::vector<Price>{9900, 10000, 10100}), prices(asks));
    EXPECT_EQ(9900, asks.bestLevel()->price());
    EXPECT_TRUE(asks.isBetter(9900, 10000));
}

TEST(BookSideTest, GetOrCreateReusesLevel)
{
    BookSide asks(Side::Sell);
    PriceLevel& first = asks.getOrCreateLevel(10000);
    first.enqueue(restingOrder(1, Side::Sell, 10000, 10));

    PriceLevel& again = asks.getOrCreateLevel(10000);
    EXPECT_EQ(&first, &again);
    EXPECT_EQ(1u, asks.levelCount());
    EXPECT_EQ(10, again.totalQty());
}

TEST(BookSideTest, RemoveLevelOnlyWhenEmpty)
{
    BookSide bids(Side::Buy);
    PriceLevel& level = bids.getOrCreateLevel(10000);
    level.enqueue(restingOrder(1, Side::Buy, 10000, 10));

    EXPECT_FALSE(bids.removeLevelIfEmpty(10000));
    EXPECT_EQ(1u, bids.levelCount());

    level.popFront();
    EXPECT_TRUE(bids.removeLevelIfEmpty(10000));
    EXPECT_TRUE(bids.empty());

    // Unknown price is a no-op
    EXPECT_FALSE(bids.removeLevelIfEmpty(12345));
}

TEST(BookSideTest, CrossCondition)
{
    // Asks at 10000: buys at or above cross
    BookSide asks(Side::Sell);
    asks.getOrCreateLevel(10000).enqueue(restingOrder(1, Side::Sell, 10000, 10));
    EXPECT_TRUE(asks.crosses(10100));
    EXPECT_TRUE(asks.crosses(10000));
    EXPECT_FALSE(asks.crosses(9900));

    // Bids at 10000: sells at or below cross
    BookSide bids(Side::Buy);
    bids.getOrCreateLevel(10000).enqueue(restingOrder(2, Side::Buy, 10000, 10));
    EXPECT_TRUE(bids.crosses(9900));
    EXPECT_TRUE(bids.crosses(10000));
    EXPECT_FALSE(bids.crosses(10100));
}

TEST(BookSideTest, DepthAndTotals)
{
    BookSide bids(Side::Buy);
    bids.getOrCreateLevel(10000).enqueue(restingOrder(1, Side::Buy, 10000, 10));
    bids.getOrCreateLevel(9900).enqueue(restingOrder(2, Side::Buy, 9900, 20));
    bids.getOrCreateLevel(9800).enqueue(restingOrder(3, Side::Buy, 9800, 30));
    bids.getOrCreateLevel(10000).enqueue(restingOrder(4, Side::Buy, 10000, 5));

    auto depth = bids.depth(2);
    ASSERT_EQ(2u, depth.size());
    EXPECT_EQ((BookLevel{10000, 15, 2}), depth[0]);
    EXPECT_EQ((BookLevel{9900, 20, 1}), depth[1]);

    EXPECT_EQ(4u, bids.orderCount());
    EXPECT_EQ(65, bids.totalQty());
    EXPECT_EQ(3u, bids.depth(10).size());
}

TEST(BookSideTest, IterationIsRestartable)
{
    BookSide asks(Side::Sell);
    asks.getOrCreateLevel(10200);
    asks.getOrCreateLevel(10100);

    EXPECT_EQ(prices(asks), prices(asks));

    // A level added between walks shows up in order
    asks.getOrCreateLevel(10000);
    EXPECT_EQ((std::vector<Price>{10000, 10100, 10200}), prices(asks));
}
