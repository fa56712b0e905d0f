#include "../src/errors.hpp"
#include "../src/orderindex.hpp"
#include <functional>
#include <gtest/gtest.h>

using namespace tickbook;

class OrderIndexTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        first = level.enqueue({1, Side::Sell, OrderType::Limit, 10000, 10, 10, 1, OrderStatus::Active, 0});
        second = level.enqueue({2, Side::Sell, OrderType::Limit, 10000, 20, 20, 2, OrderStatus::Active, 0});
    }

    static ErrorCode errorOf(const std::function<void()>& action)
    {
        try {
            action();
        } catch (const BookError& error) {
            return error.code();
        }
        return ErrorCode::None;
    }

    PriceLevel level{10000};
    PriceLevel::Handle first;
    PriceLevel::Handle second;
    OrderIndex index;
};

TEST_F(OrderIndexTest, InsertAndLookup)
{
    index.insert(1, {Side::Sell, 10000, first});

    EXPECT_TRUE(index.contains(1));
    EXPECT_EQ(1u, index.size());

    const OrderLocator& locator = index.lookup(1);
    EXPECT_EQ(Side::Sell, locator.side);
    EXPECT_EQ(10000, locator.price);
    EXPECT_EQ(1u, locator.handle->id);
}

TEST_F(OrderIndexTest, DuplicateInsertFails)
{
    index.insert(1, {Side::Sell, 10000, first});

    EXPECT_EQ(ErrorCode::DuplicateOrderId, errorOf([&] { index.insert(1, {Side::Sell, 10000, second}); }));

    // Original entry untouched
    EXPECT_EQ(1u, index.lookup(1).handle->id);
}

TEST_F(OrderIndexTest, UnknownIdFails)
{
    EXPECT_EQ(ErrorCode::UnknownOrderId, errorOf([&] { (void)index.lookup(42); }));
    EXPECT_EQ(ErrorCode::UnknownOrderId, errorOf([&] { index.remove(42); }));
    EXPECT_EQ(ErrorCode::UnknownOrderId, errorOf([&] { index.updateLocator(42, {Side::Sell, 10000, first}); }));
    EXPECT_EQ(nullptr, index.find(42));
}

TEST_F(OrderIndexTest, RemoveTwiceFails)
{
    index.insert(1, {Side::Sell, 10000, first});
    index.remove(1);

    EXPECT_FALSE(index.contains(1));
    EXPECT_EQ(ErrorCode::UnknownOrderId, errorOf([&] { index.remove(1); }));
}

TEST_F(OrderIndexTest, UpdateLocator)
{
    index.insert(2, {Side::Sell, 10000, second});

    PriceLevel other(10100);
    auto moved = other.enqueue({2, Side::Sell, OrderType::Limit, 10100, 20, 20, 3, OrderStatus::Active, 0});
    index.updateLocator(2, {Side::Sell, 10100, moved});

    const OrderLocator* locator = index.find(2);
    ASSERT_NE(nullptr, locator);
    EXPECT_EQ(10100, locator->price);
    EXPECT_EQ(3u, locator->handle->sequence);
}
