#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tickbook::json {

// Flat JSON object lookups (no external dependencies)
// Handles only top-level "key": value pairs with string, integer or bool values

// Position of the first character of the value for key, if present
inline std::optional<size_t> findValueStart(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return std::nullopt;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return std::nullopt;

    // Skip whitespace after colon
    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;

    if (valueStart >= json.size())
        return std::nullopt;
    return valueStart;
}

inline std::optional<std::string> extractString(const std::string& json, const std::string& key)
{
    auto valueStart = findValueStart(json, key);
    if (!valueStart || json[*valueStart] != '"')
        return std::nullopt;

    auto endQuote = json.find('"', *valueStart + 1);
    if (endQuote == std::string::npos)
        return std::nullopt;

    return json.substr(*valueStart + 1, endQuote - *valueStart - 1);
}

// Integers only; a fractional value is a configuration error
inline std::optional<int64_t> extractInt(const std::string& json, const std::string& key)
{
    auto valueStart = findValueStart(json, key);
    if (!valueStart)
        return std::nullopt;

    std::string numStr;
    auto pos = *valueStart;
    if (json[pos] == '-') {
        numStr += '-';
        ++pos;
    }
    while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) {
        numStr += json[pos];
        ++pos;
    }

    if (numStr.empty() || numStr == "-")
        return std::nullopt;
    if (pos < json.size() && (json[pos] == '.' || json[pos] == 'e' || json[pos] == 'E'))
        throw std::runtime_error("Expected integer for key: " + key);

    return std::stoll(numStr);
}

inline std::optional<bool> extractBool(const std::string& json, const std::string& key)
{
    auto valueStart = findValueStart(json, key);
    if (!valueStart)
        return std::nullopt;

    if (json.compare(*valueStart, 4, "true") == 0)
        return true;
    if (json.compare(*valueStart, 5, "false") == 0)
        return false;
    return std::nullopt;
}

} // namespace tickbook::json
