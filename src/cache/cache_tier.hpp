#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace tollgate {

struct CacheEntry {
    std::string key;
    nlohmann::json value;
    double written_at = 0.0;  // epoch seconds
};

// An entry is expired once strictly more than ttl seconds have passed.
inline bool is_expired(double written_at, uint32_t ttl_seconds, double now) {
    return (now - written_at) > static_cast<double>(ttl_seconds);
}

// Shared JSON record layout used by the L2 and L3 tiers.
inline nlohmann::json entry_to_json(const CacheEntry& entry) {
    return {
        {"key", entry.key},
        {"value", entry.value},
        {"timestamp", entry.written_at}
    };
}

// Returns nullopt when required fields are missing or mistyped.
inline std::optional<CacheEntry> entry_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("key") || !j["key"].is_string()) return std::nullopt;
    if (!j.contains("timestamp") || !j["timestamp"].is_number()) return std::nullopt;
    if (!j.contains("value")) return std::nullopt;
    CacheEntry entry;
    entry.key = j["key"].get<std::string>();
    entry.value = j["value"];
    entry.written_at = j["timestamp"].get<double>();
    return entry;
}

// One level of the tiered cache. Each tier enforces its own TTL.
// lookup/store/erase may throw when the backing medium fails; the
// TieredCache absorbs those failures for L2 and L3.
class CacheTier {
public:
    explicit CacheTier(uint32_t ttl_seconds) : ttl_seconds_(ttl_seconds) {}
    virtual ~CacheTier() = default;

    virtual std::string tier_name() const = 0;

    // Unexpired entry for key, or nullopt. Expired entries may be dropped.
    virtual std::optional<CacheEntry> lookup(const std::string& key) = 0;

    virtual void store(const CacheEntry& entry) = 0;

    // Returns true if an entry was removed.
    virtual bool erase(const std::string& key) = 0;

    // Drop every expired entry. Returns count removed.
    virtual uint32_t purge_expired() { return 0; }

    uint32_t ttl_seconds() const { return ttl_seconds_; }

protected:
    uint32_t ttl_seconds_;
};

} // namespace tollgate
