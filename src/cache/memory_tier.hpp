#pragma once
#include "cache_tier.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace tollgate {

class Clock; // forward declaration

// L1: process-local map guarded by a mutex. Bounded by max_entries with
// least-recently-accessed eviction.
class MemoryTier : public CacheTier {
public:
    MemoryTier(uint32_t ttl_seconds, uint32_t max_entries, Clock& clock);

    std::string tier_name() const override { return "l1"; }

    std::optional<CacheEntry> lookup(const std::string& key) override;
    void store(const CacheEntry& entry) override;
    bool erase(const std::string& key) override;
    uint32_t purge_expired() override;

    uint32_t size() const;
    void clear();

private:
    struct Slot {
        CacheEntry entry;
        double last_access = 0.0;
    };

    void evict(); // must be called with mutex_ held

    uint32_t max_entries_;
    Clock& clock_;
    std::unordered_map<std::string, Slot> slots_;
    mutable std::mutex mutex_;
};

} // namespace tollgate
