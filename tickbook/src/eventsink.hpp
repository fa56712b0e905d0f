#pragma once

#include "events.hpp"

#include <cstddef>
#include <vector>

namespace tickbook {

// Receives engine output. Implemented by collaborators (market data,
// journaling, gateways); the engine never owns its sink.
class EventSink {
public:
    virtual ~EventSink() = default;

    // Called once per event, in generation order, after a command completes
    virtual void publish(const Event& event) = 0;
};

// Keeps every event in memory
class EventRecorder : public EventSink {
public:
    void publish(const Event& event) override { m_events.push_back(event); }

    [[nodiscard]] const std::vector<Event>& events() const { return m_events; }
    [[nodiscard]] size_t size() const { return m_events.size(); }
    void clear() { m_events.clear(); }

    // All recorded events of one kind, in order
    template <typename T>
    [[nodiscard]] std::vector<T> ofType() const
    {
        std::vector<T> result;
        for (const auto& event : m_events) {
            if (const auto* typed = std::get_if<T>(&event)) {
                result.push_back(*typed);
            }
        }
        return result;
    }

private:
    std::vector<Event> m_events;
};

} // namespace tickbook
