#include "bookprinter.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace tickbook {

std::string formatPrice(Price price, Price priceScale)
{
    if (priceScale <= 1) {
        return std::to_string(price);
    }
    if (!isPowerOfTen(priceScale)) {
        throw std::invalid_argument("price scale " + std::to_string(priceScale) + " is not a power of ten");
    }

    int decimals = 0;
    for (Price scale = priceScale; scale > 1; scale /= 10) {
        ++decimals;
    }

    Price whole = price / priceScale;
    Price fraction = price % priceScale;
    if (fraction < 0) {
        fraction = -fraction;
    }

    std::ostringstream out;
    if (price < 0 && whole == 0) {
        out << '-';
    }
    out << whole << '.' << std::setw(decimals) << std::setfill('0') << fraction;
    return out.str();
}

std::string describe(const Event& event, Price priceScale)
{
    std::ostringstream out;

    std::visit(
        [&](const auto& typed) {
            using T = std::decay_t<decltype(typed)>;
            if constexpr (std::is_same_v<T, OrderAccepted>) {
                out << "ACCEPTED id=" << typed.id << ' ' << toString(typed.side) << ' ' << toString(typed.type)
                    << " qty=" << typed.qty;
                if (typed.type == OrderType::Limit) {
                    out << " price=" << formatPrice(typed.price, priceScale);
                }
                out << " seq=" << typed.sequence;
            } else if constexpr (std::is_same_v<T, OrderRejected>) {
                out << "REJECTED id=" << typed.id << " reason=" << toString(typed.reason);
            } else if constexpr (std::is_same_v<T, TradeExecuted>) {
                out << "TRADE maker=" << typed.makerId << " taker=" << typed.takerId << ' ' << toString(typed.takerSide)
                    << ' ' << typed.qty << " @ " << formatPrice(typed.price, priceScale) << " seq=" << typed.sequence;
            } else if constexpr (std::is_same_v<T, OrderRested>) {
                out << "RESTED id=" << typed.id << ' ' << toString(typed.side) << ' ' << typed.remaining << " @ "
                    << formatPrice(typed.price, priceScale) << " seq=" << typed.sequence;
            } else if constexpr (std::is_same_v<T, OrderCancelled>) {
                out << "CANCELLED id=" << typed.id << " qty=" << typed.cancelledQty
                    << " reason=" << toString(typed.reason);
            } else if constexpr (std::is_same_v<T, OrderModified>) {
                out << "MODIFIED id=" << typed.id << ' ' << typed.remaining << " @ "
                    << formatPrice(typed.price, priceScale) << (typed.priorityKept ? " (priority kept)" : " (requeued)");
            } else {
                out << "TOP " << toString(typed.side) << ' ';
                if (typed.bestPrice) {
                    out << typed.totalQty << " @ " << formatPrice(*typed.bestPrice, priceScale);
                } else {
                    out << "empty";
                }
            }
        },
        event);

    return out.str();
}

void printBook(std::ostream& out, const MatchingEngine& engine)
{
    const auto& config = engine.config();
    auto bids = engine.bidDepth(config.displayDepth);
    auto asks = engine.askDepth(config.displayDepth);

    out << "\n------ " << config.symbol << " -------\n";
    out << "------ ASKS -------\n";
    if (asks.empty()) {
        out << "No asks\n";
    } else {
        // Highest ask on top so the spread sits in the middle
        for (auto iterator = asks.rbegin(); iterator != asks.rend(); ++iterator) {
            out << formatPrice(iterator->price, config.priceScale) << " : " << iterator->totalQty << " ("
                << iterator->orderCount << ")\n";
        }
    }

    out << "------ SPREAD -------\n";
    if (auto spread = engine.spread()) {
        out << "Spread: " << formatPrice(*spread, config.priceScale) << '\n';
    } else {
        out << "Spread: N/A (one sided)\n";
    }

    out << "------ BIDS -------\n";
    if (bids.empty()) {
        out << "No bids\n";
    } else {
        for (const auto& level : bids) {
            out << formatPrice(level.price, config.priceScale) << " : " << level.totalQty << " (" << level.orderCount
                << ")\n";
        }
    }
    out << "-------------------\n";
}

} // namespace tickbook
