#pragma once

#include "booklevel.hpp"
#include "bookside.hpp"
#include "commands.hpp"
#include "engineconfig.hpp"
#include "eventsink.hpp"
#include "logger.hpp"
#include "order.hpp"
#include "orderindex.hpp"
#include "trade.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tickbook {

// Price-time priority matching for one instrument.
//
// Single-threaded: each command is validated in full, applied, and only then
// are its events handed to the sink. A rejected command leaves the book
// untouched. An internal inconsistency halts the engine for good.
class MatchingEngine {
public:
    explicit MatchingEngine(EngineConfig config = {}, EventSink* sink = nullptr);

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    // Sink is not owned; nullptr discards events
    void setEventSink(EventSink* sink) { m_sink = sink; }
    void setLogStream(std::ostream& out) { m_log.setStream(out); }

    // Main operations
    CommandResult process(const Command& command);
    CommandResult submit(const OrderRequest& request);
    CommandResult newLimitOrder(const NewLimitOrder& command);
    CommandResult newMarketOrder(const NewMarketOrder& command);
    CommandResult cancelOrder(OrderId id);
    CommandResult modifyOrder(const ModifyOrder& command);

    // Queries
    [[nodiscard]] std::optional<Price> bestBid() const { return m_bids.bestPrice(); }
    [[nodiscard]] std::optional<Price> bestAsk() const { return m_asks.bestPrice(); }
    [[nodiscard]] std::optional<Price> spread() const;

    // Top N levels of one side, best first
    [[nodiscard]] std::vector<BookLevel> depthAt(Side side, size_t levels) const;
    [[nodiscard]] std::vector<BookLevel> bidDepth(size_t levels) const { return m_bids.depth(levels); }
    [[nodiscard]] std::vector<BookLevel> askDepth(size_t levels) const { return m_asks.depth(levels); }

    // Status of any order ever accepted; empty if the id was never seen
    [[nodiscard]] std::optional<OrderStatus> orderStatus(OrderId id) const;

    // Resting order lookup. Throws BookError(UnknownOrderId).
    [[nodiscard]] const Order& findOrder(OrderId id) const;

    // Statistics
    [[nodiscard]] size_t bidLevelCount() const { return m_bids.levelCount(); }
    [[nodiscard]] size_t askLevelCount() const { return m_asks.levelCount(); }
    [[nodiscard]] size_t orderCount() const { return m_index.size(); }
    [[nodiscard]] bool isHalted() const { return m_halted; }
    [[nodiscard]] const EngineConfig& config() const { return m_config; }

    // Full consistency audit; empty when the book is sound
    [[nodiscard]] std::vector<std::string> checkInvariants() const;

    // Forget the final status of orders that left the book. Their ids become
    // unknown again (and reusable). Returns the number of entries dropped.
    size_t purgeRetired();
    [[nodiscard]] size_t retiredCount() const { return m_retired.size(); }

    // Largest quantity a limit order may add at `price` without overflowing the level
    [[nodiscard]] Qty levelHeadroom(Side side, Price price) const;

private:
    struct TopOfBook {
        std::optional<Price> price;
        Qty totalQty;

        bool operator!=(const TopOfBook& other) const { return price != other.price || totalQty != other.totalQty; }
    };

    // Everything one command produces before it is committed
    struct Pending {
        CommandResult result;
        std::vector<Event> events;
        TopOfBook bidTop;
        TopOfBook askTop;
        std::vector<std::pair<Side, Price>> touched;    // Levels mutated by the command
    };

    // Checks made before any mutation
    [[nodiscard]] ErrorCode validate(const OrderRequest& request) const;
    [[nodiscard]] ErrorCode validate(const ModifyOrder& command) const;
    [[nodiscard]] bool isKnownId(OrderId id) const;

    // Match, then rest or cancel the residual
    void execute(Order& order, Pending& pending);

    // Walk the opposite side; returns false if self-match prevention stopped the taker
    bool cross(Order& taker, Pending& pending);
    [[nodiscard]] bool isSelfMatch(const Order& taker, const Order& resting) const;

    void rest(Order order, Pending& pending);
    void retire(const Order& order, OrderStatus status);

    [[nodiscard]] Pending startCommand() const;
    CommandResult commit(Pending pending);
    CommandResult reject(OrderId id, ErrorCode code);
    [[noreturn]] void halt(const std::string& reason);
    void verifyAfterCommand(const Pending& pending);
    void auditLevel(const BookSide& book, const PriceLevel& level, std::vector<std::string>& errors) const;

    [[nodiscard]] BookSide& sideFor(Side side) { return side == Side::Buy ? m_bids : m_asks; }
    [[nodiscard]] const BookSide& sideFor(Side side) const { return side == Side::Buy ? m_bids : m_asks; }
    [[nodiscard]] TopOfBook topOf(const BookSide& side) const;

    Sequence nextSequence() { return m_nextSequence++; }

    EngineConfig m_config;
    EventSink* m_sink;
    Logger m_log;

protected:
    // Bids: highest price first; asks: lowest price first
    BookSide m_bids;
    BookSide m_asks;

    // Fast order lookup by ID for resting orders
    OrderIndex m_index;

private:
    // Final status of orders no longer in the book
    std::unordered_map<OrderId, OrderStatus> m_retired;

    Sequence m_nextSequence;
    bool m_halted;
};

} // namespace tickbook
