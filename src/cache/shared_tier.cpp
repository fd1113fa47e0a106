#include "shared_tier.hpp"
#include "../clock.hpp"
#include "../store.hpp"
#include <iostream>

namespace tollgate {

SharedTier::SharedTier(KvStore& store, std::string key_prefix, uint32_t ttl_seconds,
                       Clock& clock)
    : CacheTier(ttl_seconds), store_(store), prefix_(std::move(key_prefix)), clock_(clock) {}

std::optional<CacheEntry> SharedTier::lookup(const std::string& key) {
    auto raw = store_.get(store_key(key));
    if (!raw) return std::nullopt;

    std::optional<CacheEntry> entry;
    try {
        entry = entry_from_json(nlohmann::json::parse(*raw));
    } catch (const nlohmann::json::parse_error&) {
        entry = std::nullopt;
    }
    if (!entry || entry->key != key) {
        std::cerr << "[cache] Discarding malformed l2 record for key: " << key << "\n";
        store_.remove(store_key(key));
        return std::nullopt;
    }

    if (is_expired(entry->written_at, ttl_seconds_, clock_.now())) {
        return std::nullopt;
    }
    return entry;
}

void SharedTier::store(const CacheEntry& entry) {
    store_.set(store_key(entry.key), entry_to_json(entry).dump(), ttl_seconds_);
}

bool SharedTier::erase(const std::string& key) {
    return store_.remove(store_key(key));
}

} // namespace tollgate
