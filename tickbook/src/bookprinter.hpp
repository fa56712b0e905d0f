#pragma once

#include "events.hpp"
#include "matchingengine.hpp"

#include <ostream>
#include <string>

namespace tickbook {

// Fixed-point rendering of a tick price, e.g. 99500 at scale 1000 -> "99.500".
// Throws std::invalid_argument unless the scale is a power of ten.
[[nodiscard]] std::string formatPrice(Price price, Price priceScale);

// One-line human readable form of an event
[[nodiscard]] std::string describe(const Event& event, Price priceScale);

// Asks (highest first), spread, then bids, limited to config().displayDepth levels
void printBook(std::ostream& out, const MatchingEngine& engine);

} // namespace tickbook
