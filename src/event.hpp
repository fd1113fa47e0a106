#pragma once
#include <string>
#include <cstdint>

namespace tollgate {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* CacheHit        = "CacheHit";
    constexpr const char* CacheMiss       = "CacheMiss";
    constexpr const char* TierDegraded    = "TierDegraded";
    constexpr const char* QuotaDenied     = "QuotaDenied";
    constexpr const char* LimiterFallback = "LimiterFallback";
    constexpr const char* StateSaved      = "StateSaved";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct CacheHitEvent : Event {
    static constexpr const char* TAG = event_tags::CacheHit;
    std::string key;
    std::string tier;   // tier that served the hit (l1, l2, l3)

    CacheHitEvent() { type_tag = TAG; }
};

struct CacheMissEvent : Event {
    static constexpr const char* TAG = event_tags::CacheMiss;
    std::string key;

    CacheMissEvent() { type_tag = TAG; }
};

struct TierDegradedEvent : Event {
    static constexpr const char* TAG = event_tags::TierDegraded;
    std::string tier;
    std::string operation;  // get, set, erase
    std::string reason;

    TierDegradedEvent() { type_tag = TAG; }
};

struct QuotaDeniedEvent : Event {
    static constexpr const char* TAG = event_tags::QuotaDenied;
    std::string endpoint;
    uint32_t remaining = 0;

    QuotaDeniedEvent() { type_tag = TAG; }
};

struct LimiterFallbackEvent : Event {
    static constexpr const char* TAG = event_tags::LimiterFallback;
    std::string reason;

    LimiterFallbackEvent() { type_tag = TAG; }
};

struct StateSavedEvent : Event {
    static constexpr const char* TAG = event_tags::StateSaved;
    std::string task_id;
    std::string field;  // empty for a whole-record save

    StateSavedEvent() { type_tag = TAG; }
};

} // namespace tollgate
