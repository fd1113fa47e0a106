#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace tollgate {

using EventHandler = std::function<void(const Event&)>;

// Subscribing with this tag receives every published event.
constexpr const char* ANY_EVENT = "*";

class EventBus {
public:
    // Subscribe to events with a given tag (or ANY_EVENT). Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously: tag handlers first, then ANY_EVENT handlers,
    // each group in registration order. Handlers run without the mutex held.
    void publish(const Event& event);

    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

    // Total events published since construction.
    uint64_t published_count() const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
    uint64_t published_ = 0;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish only if a bus is attached. Components hold an optional EventBus*.
inline void publish_to(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace tollgate
