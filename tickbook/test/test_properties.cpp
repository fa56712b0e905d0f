#include "../src/bookprinter.hpp"
#include "../src/matchingengine.hpp"
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

using namespace tickbook;

namespace {

// Remaining quantity per order, rebuilt from the event stream alone
class ShadowBook : public EventSink {
public:
    void publish(const Event& event) override
    {
        std::visit(
            [this](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, OrderAccepted>) {
                    remaining[e.id] = e.qty;
                } else if constexpr (std::is_same_v<T, TradeExecuted>) {
                    remaining[e.makerId] -= e.qty;
                    remaining[e.takerId] -= e.qty;
                } else if constexpr (std::is_same_v<T, OrderCancelled>) {
                    remaining[e.id] -= e.cancelledQty;
                } else if constexpr (std::is_same_v<T, OrderModified>) {
                    remaining[e.id] = e.remaining;
                }
            },
            event);
        lines.push_back(describe(event, 1));
    }

    std::unordered_map<OrderId, Qty> remaining;
    std::vector<std::string> lines;
};

Qty sideTotal(const std::vector<BookLevel>& levels)
{
    Qty total = 0;
    for (const auto& level : levels) {
        total += level.totalQty;
    }
    return total;
}

// Random session; every step is checked against the shadow book
std::vector<std::string> runSession(SelfMatchPolicy policy, uint64_t seed, int steps)
{
    EngineConfig config;
    config.selfMatchPolicy = policy;
    config.verifyInvariants = true;
    config.logLevel = LogLevel::Off;

    ShadowBook shadow;
    MatchingEngine book(config, &shadow);

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> sideDist(0, 1);
    std::uniform_int_distribution<Price> priceDist(1000, 1020);
    std::uniform_int_distribution<Qty> qtyDist(1, 50);
    std::uniform_int_distribution<OwnerId> ownerDist(0, 3);
    std::uniform_int_distribution<int> opDist(0, 19);

    std::vector<OrderId> seen;
    OrderId nextId = 1;

    auto pick = [&]() {
        std::uniform_int_distribution<size_t> index(0, seen.size() - 1);
        return seen[index(rng)];
    };

    for (int i = 0; i < steps; ++i) {
        const int op = opDist(rng);
        const Side side = sideDist(rng) == 0 ? Side::Buy : Side::Sell;
        CommandResult result;

        if (op < 10 || seen.empty()) {
            seen.push_back(nextId);
            result = book.newLimitOrder({nextId++, side, priceDist(rng), qtyDist(rng), ownerDist(rng)});
        } else if (op < 12) {
            seen.push_back(nextId);
            result = book.newMarketOrder({nextId++, side, qtyDist(rng), ownerDist(rng)});
        } else if (op < 15) {
            result = book.cancelOrder(pick());
        } else if (op < 18) {
            std::optional<Price> price;
            if (sideDist(rng) == 0) {
                price = priceDist(rng);
            }
            result = book.modifyOrder({pick(), qtyDist(rng), price});
        } else if (op == 18) {
            // Reused id
            result = book.newLimitOrder({pick(), side, priceDist(rng), qtyDist(rng)});
            EXPECT_EQ(ErrorCode::DuplicateOrderId, result.error);
        } else {
            result = book.newLimitOrder({nextId, side, priceDist(rng), 0});
            EXPECT_EQ(ErrorCode::InvalidQuantity, result.error);
        }

        EXPECT_FALSE(book.isHalted()) << "step " << i;
        EXPECT_TRUE(book.checkInvariants().empty()) << "step " << i;

        // Never crossed
        if (book.bestBid() && book.bestAsk()) {
            EXPECT_LT(*book.bestBid(), *book.bestAsk()) << "step " << i;
        }

        // Reported fills match the trades
        Qty traded = 0;
        for (const auto& trade : result.trades) {
            traded += trade.qty;
        }
        EXPECT_EQ(traded, result.filledQty) << "step " << i;

        // Quantity is conserved: what the events say is left is what rests
        Qty expectedResting = 0;
        for (const auto& [id, qty] : shadow.remaining) {
            EXPECT_GE(qty, 0) << "order " << id;
            if (qty > 0) {
                expectedResting += qty;
                EXPECT_EQ(qty, book.findOrder(id).remaining) << "order " << id;
            }
        }
        const size_t allLevels = book.bidLevelCount() + book.askLevelCount();
        EXPECT_EQ(expectedResting, sideTotal(book.bidDepth(allLevels)) + sideTotal(book.askDepth(allLevels)))
            << "step " << i;

        if (::testing::Test::HasFailure()) {
            break;
        }
    }

    return shadow.lines;
}

} // namespace

TEST(PropertyTest, RandomSessionKeepsBookConsistent)
{
    auto lines = runSession(SelfMatchPolicy::Allow, 42, 3000);
    EXPECT_FALSE(lines.empty());
}

TEST(PropertyTest, RandomSessionWithCancelTaker)
{
    (void)runSession(SelfMatchPolicy::CancelTaker, 7, 2000);
}

TEST(PropertyTest, RandomSessionWithCancelResting)
{
    (void)runSession(SelfMatchPolicy::CancelResting, 11, 2000);
}

TEST(PropertyTest, ReplayIsDeterministic)
{
    auto first = runSession(SelfMatchPolicy::CancelResting, 1234, 1000);
    auto second = runSession(SelfMatchPolicy::CancelResting, 1234, 1000);

    EXPECT_EQ(first, second);
}
