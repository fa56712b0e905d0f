#include "commandparser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tickbook {

namespace {

std::vector<std::string> tokenize(const std::string& line)
{
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        tokens.push_back(token);
    }
    return tokens;
}

int64_t parseNumber(const std::string& token, const char* field)
{
    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(token, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Invalid ") + field + ": " + token);
    }
    if (consumed != token.size()) {
        throw std::runtime_error(std::string("Invalid ") + field + ": " + token);
    }
    return value;
}

OrderId parseId(const std::string& token)
{
    int64_t value = parseNumber(token, "order id");
    if (value < 0) {
        throw std::runtime_error("Invalid order id: " + token);
    }
    return static_cast<OrderId>(value);
}

Side parseSide(const std::string& token)
{
    if (token == "BUY") {
        return Side::Buy;
    }
    if (token == "SELL") {
        return Side::Sell;
    }
    throw std::runtime_error("Invalid side: " + token);
}

void expectArgs(const std::vector<std::string>& tokens, size_t minimum, size_t maximum)
{
    if (tokens.size() < minimum || tokens.size() > maximum) {
        throw std::runtime_error("Wrong number of fields for " + tokens[0]);
    }
}

} // namespace

std::optional<ScriptStep> parseLine(const std::string& line)
{
    auto comment = line.find('#');
    auto tokens = tokenize(line.substr(0, comment));
    if (tokens.empty()) {
        return std::nullopt;
    }

    const std::string& verb = tokens[0];

    if (verb == "LIMIT") {
        expectArgs(tokens, 5, 6);
        NewLimitOrder command{parseId(tokens[1]), parseSide(tokens[2]), parseNumber(tokens[3], "price"),
                              parseNumber(tokens[4], "quantity")};
        if (tokens.size() == 6) {
            command.owner = parseId(tokens[5]);
        }
        return ScriptStep{Command{command}};
    }

    if (verb == "MARKET") {
        expectArgs(tokens, 4, 5);
        NewMarketOrder command{parseId(tokens[1]), parseSide(tokens[2]), parseNumber(tokens[3], "quantity")};
        if (tokens.size() == 5) {
            command.owner = parseId(tokens[4]);
        }
        return ScriptStep{Command{command}};
    }

    if (verb == "CANCEL") {
        expectArgs(tokens, 2, 2);
        return ScriptStep{Command{CancelOrder{parseId(tokens[1])}}};
    }

    if (verb == "MODIFY") {
        expectArgs(tokens, 3, 4);
        ModifyOrder command{parseId(tokens[1]), parseNumber(tokens[2], "quantity"), std::nullopt};
        if (tokens.size() == 4) {
            command.newPrice = parseNumber(tokens[3], "price");
        }
        return ScriptStep{Command{command}};
    }

    if (verb == "PRINT") {
        expectArgs(tokens, 1, 1);
        return ScriptStep{PrintBook{}};
    }

    throw std::runtime_error("Unknown command: " + verb);
}

std::vector<ScriptStep> loadScript(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open script file: " + path);
    }

    std::vector<ScriptStep> steps;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        try {
            if (auto step = parseLine(line)) {
                steps.push_back(std::move(*step));
            }
        } catch (const std::runtime_error& error) {
            throw std::runtime_error(path + ":" + std::to_string(lineNumber) + ": " + error.what());
        }
    }
    return steps;
}

} // namespace tickbook
