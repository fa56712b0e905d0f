#pragma once

#include "logger.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace tickbook {

struct EngineConfig {
    std::string symbol = "UNKNOWN";                     // Instrument label
    Price priceScale = 1;                               // Ticks per display unit, a power of ten
    SelfMatchPolicy selfMatchPolicy = SelfMatchPolicy::Allow;
    bool verifyInvariants = false;                      // Full audit after every command
    LogLevel logLevel = LogLevel::Info;
    size_t displayDepth = 5;                            // Levels shown by printBook

    // Load from JSON file. Throws std::runtime_error.
    static EngineConfig loadFromFile(const std::string& path);

    // Parse a flat JSON object; missing keys keep their defaults
    static EngineConfig parse(const std::string& json);
};

// Accepts "allow", "cancel_taker", "cancel_resting"
[[nodiscard]] std::optional<SelfMatchPolicy> parseSelfMatchPolicy(const std::string& name);

[[nodiscard]] const char* toString(SelfMatchPolicy policy);

// 1, 10, 100, ...
[[nodiscard]] bool isPowerOfTen(Price value);

} // namespace tickbook
