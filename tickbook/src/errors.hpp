#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tickbook {

enum class ErrorCode : uint8_t {
    None = 0,
    DuplicateOrderId,
    UnknownOrderId,   // Cancel/modify target missing or already terminal
    InvalidQuantity,  // Zero or negative
    InvalidPrice,     // Non-positive, or supplied for a market order
    EmptyLevel,       // Front access on a level with no orders
    PriceMismatch,    // Order enqueued at a level with another price
    CrossedBookInvariantViolation,
    EngineHalted      // Engine stopped after an invariant violation
};

[[nodiscard]] inline const char* toString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return "None";
    case ErrorCode::DuplicateOrderId:
        return "DuplicateOrderId";
    case ErrorCode::UnknownOrderId:
        return "UnknownOrderId";
    case ErrorCode::InvalidQuantity:
        return "InvalidQuantity";
    case ErrorCode::InvalidPrice:
        return "InvalidPrice";
    case ErrorCode::EmptyLevel:
        return "EmptyLevel";
    case ErrorCode::PriceMismatch:
        return "PriceMismatch";
    case ErrorCode::CrossedBookInvariantViolation:
        return "CrossedBookInvariantViolation";
    case ErrorCode::EngineHalted:
        return "EngineHalted";
    }
    return "?";
}

// Thrown by the book building blocks when they are misused
class BookError : public std::runtime_error {
public:
    BookError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(toString(code)) + ": " + message), m_code(code)
    {
    }

    [[nodiscard]] ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

// Internal consistency failure. The engine that raised it is halted.
class InvariantViolation : public BookError {
public:
    explicit InvariantViolation(const std::string& message)
        : BookError(ErrorCode::CrossedBookInvariantViolation, message)
    {
    }
};

} // namespace tickbook
