#include "engineconfig.hpp"
#include "jsonutils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tickbook {

using namespace json;

EngineConfig EngineConfig::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

EngineConfig EngineConfig::parse(const std::string& json)
{
    EngineConfig config;

    if (auto symbol = extractString(json, "symbol")) {
        config.symbol = *symbol;
    }

    if (auto scale = extractInt(json, "price_scale")) {
        if (!isPowerOfTen(*scale)) {
            throw std::runtime_error("price_scale must be a positive power of ten: " + std::to_string(*scale));
        }
        config.priceScale = *scale;
    }

    if (auto policyName = extractString(json, "self_match_policy")) {
        auto policy = parseSelfMatchPolicy(*policyName);
        if (!policy) {
            throw std::runtime_error("Unknown self_match_policy: " + *policyName);
        }
        config.selfMatchPolicy = *policy;
    }

    if (auto verify = extractBool(json, "verify_invariants")) {
        config.verifyInvariants = *verify;
    }

    if (auto levelName = extractString(json, "log_level")) {
        auto level = parseLogLevel(*levelName);
        if (!level) {
            throw std::runtime_error("Unknown log_level: " + *levelName);
        }
        config.logLevel = *level;
    }

    if (auto depth = extractInt(json, "display_depth")) {
        if (*depth <= 0) {
            throw std::runtime_error("display_depth must be positive");
        }
        config.displayDepth = static_cast<size_t>(*depth);
    }

    return config;
}

std::optional<SelfMatchPolicy> parseSelfMatchPolicy(const std::string& name)
{
    if (name == "allow") {
        return SelfMatchPolicy::Allow;
    }
    if (name == "cancel_taker") {
        return SelfMatchPolicy::CancelTaker;
    }
    if (name == "cancel_resting") {
        return SelfMatchPolicy::CancelResting;
    }
    return std::nullopt;
}

bool isPowerOfTen(Price value)
{
    if (value <= 0) {
        return false;
    }
    while (value % 10 == 0) {
        value /= 10;
    }
    return value == 1;
}

const char* toString(SelfMatchPolicy policy)
{
    switch (policy) {
    case SelfMatchPolicy::Allow:
        return "allow";
    case SelfMatchPolicy::CancelTaker:
        return "cancel_taker";
    case SelfMatchPolicy::CancelResting:
        return "cancel_resting";
    }
    return "?";
}

} // namespace tickbook
