#pragma once

#include "commands.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tickbook {

// Request to render the book between commands
struct PrintBook {};

using ScriptStep = std::variant<Command, PrintBook>;

// Parse one script line. Prices are integer ticks.
//   LIMIT  <id> BUY|SELL <price> <qty> [owner]
//   MARKET <id> BUY|SELL <qty> [owner]
//   CANCEL <id>
//   MODIFY <id> <qty> [price]
//   PRINT
// Returns nullopt for blank lines and '#' comments. Throws std::runtime_error
// on malformed input.
[[nodiscard]] std::optional<ScriptStep> parseLine(const std::string& line);

// Parse a whole script file; errors name the offending line
[[nodiscard]] std::vector<ScriptStep> loadScript(const std::string& path);

} // namespace tickbook
