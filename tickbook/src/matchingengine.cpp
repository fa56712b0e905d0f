#include "matchingengine.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tickbook {

namespace {

// Consecutive trades at one level are recorded once
void touch(std::vector<std::pair<Side, Price>>& touched, Side side, Price price)
{
    if (touched.empty() || touched.back() != std::make_pair(side, price)) {
        touched.emplace_back(side, price);
    }
}

} // namespace

MatchingEngine::MatchingEngine(EngineConfig config, EventSink* sink)
    : m_config(std::move(config)),
      m_sink(sink),
      m_log(m_config.logLevel),
      m_bids(Side::Buy),
      m_asks(Side::Sell),
      m_nextSequence(1),
      m_halted(false)
{
    m_log.info("Order book initialized for " + m_config.symbol + " (self-match policy " +
               toString(m_config.selfMatchPolicy) + ")");
}

CommandResult MatchingEngine::process(const Command& command)
{
    return std::visit(
        [this](const auto& typed) -> CommandResult {
            using T = std::decay_t<decltype(typed)>;
            if constexpr (std::is_same_v<T, NewLimitOrder>) {
                return newLimitOrder(typed);
            } else if constexpr (std::is_same_v<T, NewMarketOrder>) {
                return newMarketOrder(typed);
            } else if constexpr (std::is_same_v<T, CancelOrder>) {
                return cancelOrder(typed.id);
            } else {
                return modifyOrder(typed);
            }
        },
        command);
}

CommandResult MatchingEngine::newLimitOrder(const NewLimitOrder& command)
{
    return submit({command.id, command.side, OrderType::Limit, command.price, command.qty, command.owner});
}

CommandResult MatchingEngine::newMarketOrder(const NewMarketOrder& command)
{
    return submit({command.id, command.side, OrderType::Market, 0, command.qty, command.owner});
}

CommandResult MatchingEngine::submit(const OrderRequest& request)
{
    if (m_halted) {
        return reject(request.id, ErrorCode::EngineHalted);
    }

    ErrorCode error = validate(request);
    if (error != ErrorCode::None) {
        return reject(request.id, error);
    }

    Pending pending = startCommand();
    try {
        Order order{request.id,  request.side,   request.type,        request.price,
                    request.qty, request.qty,    nextSequence(),      OrderStatus::Active,
                    request.owner};
        pending.events.emplace_back(
            OrderAccepted{order.id, order.side, order.type, order.price, order.qty, order.sequence});
        execute(order, pending);
    } catch (const InvariantViolation&) {
        throw;
    } catch (const BookError& bookError) {
        halt(bookError.what());
    }

    return commit(std::move(pending));
}

CommandResult MatchingEngine::cancelOrder(OrderId id)
{
    if (m_halted) {
        return reject(id, ErrorCode::EngineHalted);
    }

    const OrderLocator* locator = m_index.find(id);
    if (locator == nullptr) {
        return reject(id, ErrorCode::UnknownOrderId);
    }

    Pending pending = startCommand();
    try {
        OrderLocator where = *locator;
        BookSide& book = sideFor(where.side);
        PriceLevel* level = book.findLevel(where.price);
        if (level == nullptr || where.handle->id != id) {
            halt("order " + std::to_string(id) + " missing from level " + std::to_string(where.price));
        }

        touch(pending.touched, where.side, where.price);
        Order order = level->remove(where.handle);
        book.removeLevelIfEmpty(where.price);
        m_index.remove(id);

        order.status = OrderStatus::Cancelled;
        retire(order, OrderStatus::Cancelled);

        pending.result.cancelledQty = order.remaining;
        pending.events.emplace_back(OrderCancelled{id, order.remaining, CancelReason::Requested});
    } catch (const InvariantViolation&) {
        throw;
    } catch (const BookError& bookError) {
        halt(bookError.what());
    }

    return commit(std::move(pending));
}

CommandResult MatchingEngine::modifyOrder(const ModifyOrder& command)
{
    if (m_halted) {
        return reject(command.id, ErrorCode::EngineHalted);
    }

    ErrorCode error = validate(command);
    if (error != ErrorCode::None) {
        return reject(command.id, error);
    }

    Pending pending = startCommand();
    try {
        OrderLocator where = m_index.lookup(command.id);
        BookSide& book = sideFor(where.side);
        PriceLevel* level = book.findLevel(where.price);
        if (level == nullptr || where.handle->id != command.id) {
            halt("order " + std::to_string(command.id) + " missing from level " + std::to_string(where.price));
        }

        const Price newPrice = command.newPrice.value_or(where.price);
        const Qty remaining = where.handle->remaining;
        touch(pending.touched, where.side, where.price);

        if (newPrice == where.price && command.newQty <= remaining) {
            // Same price, no increase: adjust in place and keep the queue position
            if (command.newQty < remaining) {
                level->reduce(where.handle, remaining - command.newQty);
            }
            pending.result.restingQty = command.newQty;
            pending.result.cancelledQty = remaining - command.newQty;
            pending.events.emplace_back(OrderModified{command.id, newPrice, command.newQty, true});
        } else {
            // Price change or increase: cancel and re-enter behind everyone
            Order previous = level->remove(where.handle);
            book.removeLevelIfEmpty(where.price);
            m_index.remove(command.id);

            Order replacement{command.id,     previous.side,  OrderType::Limit,    newPrice,
                              command.newQty, command.newQty, nextSequence(),      OrderStatus::Active,
                              previous.owner};
            pending.events.emplace_back(OrderModified{command.id, newPrice, command.newQty, false});
            execute(replacement, pending);
        }
    } catch (const InvariantViolation&) {
        throw;
    } catch (const BookError& bookError) {
        halt(bookError.what());
    }

    return commit(std::move(pending));
}

std::optional<Price> MatchingEngine::spread() const
{
    auto bid = bestBid();
    auto ask = bestAsk();
    if (!bid.has_value() || !ask.has_value()) {
        return std::nullopt;
    }
    return ask.value() - bid.value();
}

std::vector<BookLevel> MatchingEngine::depthAt(Side side, size_t levels) const { return sideFor(side).depth(levels); }

std::optional<OrderStatus> MatchingEngine::orderStatus(OrderId id) const
{
    if (const auto* locator = m_index.find(id)) {
        return locator->handle->status;
    }

    auto iterator = m_retired.find(id);
    if (iterator == m_retired.end()) {
        return std::nullopt;
    }
    return iterator->second;
}

const Order& MatchingEngine::findOrder(OrderId id) const { return *m_index.lookup(id).handle; }

std::vector<std::string> MatchingEngine::checkInvariants() const
{
    std::vector<std::string> errors;
    size_t restingOrders = 0;

    auto checkSide = [&](const BookSide& book) {
        for (const auto& [price, level] : book) {
            if (level.price() != price) {
                errors.push_back(std::string(toString(book.side())) + " level " + std::to_string(price) +
                                 ": keyed under wrong price " + std::to_string(level.price()));
            }
            restingOrders += static_cast<size_t>(level.orderCount());
            auditLevel(book, level, errors);
        }
    };

    checkSide(m_bids);
    checkSide(m_asks);

    if (restingOrders != m_index.size()) {
        errors.push_back("index holds " + std::to_string(m_index.size()) + " entries for " +
                         std::to_string(restingOrders) + " resting orders");
    }

    auto bid = bestBid();
    auto ask = bestAsk();
    if (bid && ask && *bid >= *ask) {
        errors.push_back("crossed book: bid " + std::to_string(*bid) + " >= ask " + std::to_string(*ask));
    }

    return errors;
}

void MatchingEngine::auditLevel(const BookSide& book, const PriceLevel& level, std::vector<std::string>& errors) const
{
    const std::string where = std::string(toString(book.side())) + " level " + std::to_string(level.price());

    if (level.isEmpty() || level.orderCount() == 0) {
        errors.push_back(where + ": empty level left in book");
    }
    if (level.recomputeTotal() != level.totalQty()) {
        errors.push_back(where + ": aggregate " + std::to_string(level.totalQty()) + " != sum " +
                         std::to_string(level.recomputeTotal()));
    }

    std::optional<Sequence> previous;
    for (const auto& order : level) {
        const std::string what = where + " order " + std::to_string(order.id);

        if (order.price != level.price() || order.side != book.side()) {
            errors.push_back(what + ": wrong side or price");
        }
        if (order.remaining <= 0 || order.remaining > order.qty) {
            errors.push_back(what + ": remaining " + std::to_string(order.remaining) + " out of range");
        }
        if (order.status != OrderStatus::Active && order.status != OrderStatus::PartiallyFilled) {
            errors.push_back(what + ": terminal status " + toString(order.status) + " while resting");
        }
        if (previous && *previous >= order.sequence) {
            errors.push_back(what + ": out of time priority");
        }
        previous = order.sequence;

        const OrderLocator* locator = m_index.find(order.id);
        if (locator == nullptr) {
            errors.push_back(what + ": missing from index");
        } else if (locator->side != order.side || locator->price != order.price || &*locator->handle != &order) {
            errors.push_back(what + ": index locator is stale");
        }
    }
}

size_t MatchingEngine::purgeRetired()
{
    size_t dropped = m_retired.size();
    m_retired.clear();
    m_log.info("Purged " + std::to_string(dropped) + " retired orders from " + m_config.symbol + " book");
    return dropped;
}

Qty MatchingEngine::levelHeadroom(Side side, Price price) const
{
    const PriceLevel* level = sideFor(side).findLevel(price);
    return std::numeric_limits<Qty>::max() - (level != nullptr ? level->totalQty() : 0);
}

ErrorCode MatchingEngine::validate(const OrderRequest& request) const
{
    if (isKnownId(request.id)) {
        return ErrorCode::DuplicateOrderId;
    }
    if (request.qty <= 0) {
        return ErrorCode::InvalidQuantity;
    }
    if (request.type == OrderType::Limit && request.price <= 0) {
        return ErrorCode::InvalidPrice;
    }
    if (request.type == OrderType::Market && request.price != 0) {
        return ErrorCode::InvalidPrice;
    }
    // A residual must fit in its level's aggregate
    if (request.type == OrderType::Limit && request.qty > levelHeadroom(request.side, request.price)) {
        return ErrorCode::InvalidQuantity;
    }
    return ErrorCode::None;
}

ErrorCode MatchingEngine::validate(const ModifyOrder& command) const
{
    if (!m_index.contains(command.id)) {
        return ErrorCode::UnknownOrderId;
    }
    if (command.newQty <= 0) {
        return ErrorCode::InvalidQuantity;
    }
    if (command.newPrice.has_value() && *command.newPrice <= 0) {
        return ErrorCode::InvalidPrice;
    }

    const OrderLocator& where = m_index.lookup(command.id);
    const Price newPrice = command.newPrice.value_or(where.price);
    Qty headroom = levelHeadroom(where.side, newPrice);
    if (newPrice == where.price) {
        headroom += where.handle->remaining;
    }
    if (command.newQty > headroom) {
        return ErrorCode::InvalidQuantity;
    }
    return ErrorCode::None;
}

bool MatchingEngine::isKnownId(OrderId id) const { return m_index.contains(id) || m_retired.count(id) != 0; }

void MatchingEngine::execute(Order& order, Pending& pending)
{
    bool takerLive = cross(order, pending);

    if (order.isFilled()) {
        retire(order, OrderStatus::Filled);
        return;
    }

    if (!takerLive || order.type == OrderType::Market) {
        // Residual never rests
        CancelReason reason = takerLive ? CancelReason::MarketRemainder : CancelReason::SelfMatch;
        pending.result.cancelledQty += order.remaining;
        pending.events.emplace_back(OrderCancelled{order.id, order.remaining, reason});
        order.status = OrderStatus::Cancelled;
        retire(order, OrderStatus::Cancelled);
        return;
    }

    rest(std::move(order), pending);
}

bool MatchingEngine::cross(Order& taker, Pending& pending)
{
    BookSide& book = sideFor(opposite(taker.side));

    while (taker.remaining > 0) {
        PriceLevel* level = book.bestLevel();
        if (level == nullptr) {
            break;
        }

        // Market orders take any price
        if (taker.type == OrderType::Limit && !book.crosses(taker.price)) {
            break;
        }

        const Price levelPrice = level->price();
        auto handle = level->frontHandle();
        touch(pending.touched, book.side(), levelPrice);

        if (isSelfMatch(taker, *handle)) {
            if (m_config.selfMatchPolicy == SelfMatchPolicy::CancelTaker) {
                return false;
            }

            Order resting = level->remove(handle);
            m_index.remove(resting.id);
            book.removeLevelIfEmpty(levelPrice);
            pending.events.emplace_back(OrderCancelled{resting.id, resting.remaining, CancelReason::SelfMatch});
            retire(resting, OrderStatus::Cancelled);
            continue;
        }

        Qty tradeQty = std::min(taker.remaining, handle->remaining);
        level->fill(handle, tradeQty);
        taker.fill(tradeQty);

        Trade trade{handle->id, taker.id, taker.side, levelPrice, tradeQty, nextSequence()};
        pending.result.trades.push_back(trade);
        pending.result.filledQty += tradeQty;
        pending.events.emplace_back(TradeExecuted{trade.makerOrderId, trade.takerOrderId, trade.takerSide,
                                                  trade.price, trade.qty, trade.sequence});

        if (handle->isFilled()) {
            Order filled = level->popFront();
            m_index.remove(filled.id);
            retire(filled, OrderStatus::Filled);
            book.removeLevelIfEmpty(levelPrice);
        }
    }

    return true;
}

bool MatchingEngine::isSelfMatch(const Order& taker, const Order& resting) const
{
    return m_config.selfMatchPolicy != SelfMatchPolicy::Allow && taker.owner != 0 && taker.owner == resting.owner;
}

void MatchingEngine::rest(Order order, Pending& pending)
{
    // Residual queues behind everything already at its price
    order.sequence = nextSequence();

    touch(pending.touched, order.side, order.price);
    PriceLevel& level = sideFor(order.side).getOrCreateLevel(order.price);
    auto handle = level.enqueue(std::move(order));
    m_index.insert(handle->id, {handle->side, handle->price, handle});

    pending.result.restingQty = handle->remaining;
    pending.events.emplace_back(OrderRested{handle->id, handle->side, handle->price, handle->remaining, handle->sequence});
}

void MatchingEngine::retire(const Order& order, OrderStatus status) { m_retired[order.id] = status; }

MatchingEngine::Pending MatchingEngine::startCommand() const
{
    Pending pending;
    pending.bidTop = topOf(m_bids);
    pending.askTop = topOf(m_asks);
    return pending;
}

CommandResult MatchingEngine::commit(Pending pending)
{
    TopOfBook bidTop = topOf(m_bids);
    if (bidTop != pending.bidTop) {
        pending.events.emplace_back(BookTopChanged{Side::Buy, bidTop.price, bidTop.totalQty});
    }

    TopOfBook askTop = topOf(m_asks);
    if (askTop != pending.askTop) {
        pending.events.emplace_back(BookTopChanged{Side::Sell, askTop.price, askTop.totalQty});
    }

    verifyAfterCommand(pending);

    if (m_sink != nullptr) {
        for (const auto& event : pending.events) {
            m_sink->publish(event);
        }
    }

    return std::move(pending.result);
}

CommandResult MatchingEngine::reject(OrderId id, ErrorCode code)
{
    m_log.debug("Rejected order " + std::to_string(id) + ": " + toString(code));

    CommandResult result;
    result.error = code;
    if (m_sink != nullptr) {
        m_sink->publish(OrderRejected{id, code});
    }
    return result;
}

void MatchingEngine::halt(const std::string& reason)
{
    m_halted = true;
    m_log.error("Halting " + m_config.symbol + " book: " + reason);
    throw InvariantViolation(reason);
}

void MatchingEngine::verifyAfterCommand(const Pending& pending)
{
    auto bid = bestBid();
    auto ask = bestAsk();
    if (bid && ask && *bid >= *ask) {
        halt("crossed book: bid " + std::to_string(*bid) + " >= ask " + std::to_string(*ask));
    }

    // Levels this command mutated, plus both tops of book
    std::vector<std::string> errors;
    for (const auto& [side, price] : pending.touched) {
        const BookSide& book = sideFor(side);
        if (const PriceLevel* level = book.findLevel(price)) {
            auditLevel(book, *level, errors);
        }
    }
    if (const PriceLevel* best = m_bids.bestLevel()) {
        auditLevel(m_bids, *best, errors);
    }
    if (const PriceLevel* best = m_asks.bestLevel()) {
        auditLevel(m_asks, *best, errors);
    }
    if (!errors.empty()) {
        halt(errors.front());
    }

    if (m_config.verifyInvariants) {
        auto sweep = checkInvariants();
        if (!sweep.empty()) {
            halt(sweep.front());
        }
    }
}

MatchingEngine::TopOfBook MatchingEngine::topOf(const BookSide& side) const
{
    const PriceLevel* best = side.bestLevel();
    if (best == nullptr) {
        return {std::nullopt, 0};
    }
    return {best->price(), best->totalQty()};
}

} // namespace tickbook
