#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace tickbook {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

[[nodiscard]] inline const char* toString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "?";
}

// Accepts "debug", "info", "warn", "error", "off"
[[nodiscard]] inline std::optional<LogLevel> parseLogLevel(const std::string& name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    if (name == "off")
        return LogLevel::Off;
    return std::nullopt;
}

// Line-oriented logger over a plain stream (no external dependencies)
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info, std::ostream& out = std::clog) : m_level(level), m_out(&out) {}

    void setLevel(LogLevel level) { m_level = level; }
    void setStream(std::ostream& out) { m_out = &out; }

    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] bool enabled(LogLevel level) const { return level != LogLevel::Off && level >= m_level; }

    void debug(const std::string& message) const { write(LogLevel::Debug, message); }
    void info(const std::string& message) const { write(LogLevel::Info, message); }
    void warn(const std::string& message) const { write(LogLevel::Warn, message); }
    void error(const std::string& message) const { write(LogLevel::Error, message); }

private:
    void write(LogLevel level, const std::string& message) const
    {
        if (!enabled(level)) {
            return;
        }
        *m_out << "[tickbook] " << toString(level) << ' ' << message << '\n';
    }

    LogLevel m_level;
    std::ostream* m_out;
};

} // namespace tickbook
