#pragma once
#include "cache_tier.hpp"
#include "memory_tier.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace tollgate {

class Clock;    // forward declaration
class EventBus; // forward declaration
class KvStore;  // forward declaration
struct Config;  // forward declaration

struct CacheStats {
    uint64_t l1_hits = 0;
    uint64_t l2_hits = 0;
    uint64_t l3_hits = 0;
    uint64_t misses = 0;
    uint64_t tier_failures = 0;  // absorbed L2/L3 errors on any operation
};

// Read-through / write-through cache over L1 (memory), L2 (shared store)
// and L3 (disk). L2 and L3 are optional and best-effort: their failures are
// logged, counted and published, never thrown to the caller.
class TieredCache {
public:
    TieredCache(std::unique_ptr<MemoryTier> l1,
                std::unique_ptr<CacheTier> l2,
                std::unique_ptr<CacheTier> l3,
                Clock& clock,
                EventBus* bus = nullptr);

    // First unexpired hit in L1, L2, L3 order. Hits in a lower tier are
    // promoted into every tier above it with a fresh timestamp.
    std::optional<nlohmann::json> get(const std::string& key);

    // Write to all tiers. Returns false only when L1 rejected the write.
    bool set(const std::string& key, const nlohmann::json& value);

    // Remove key from every tier.
    void invalidate(const std::string& key);

    // Sweep expired entries from L1 and L3 (L2 relies on store expiry).
    uint32_t purge_expired();

    CacheStats stats() const;

    MemoryTier& l1() { return *l1_; }
    CacheTier* l2() { return l2_.get(); }
    CacheTier* l3() { return l3_.get(); }

private:
    std::optional<CacheEntry> try_lookup(CacheTier* tier, const std::string& key);
    void try_store(CacheTier* tier, const CacheEntry& entry);
    void degraded(const CacheTier& tier, const std::string& operation,
                  const std::string& reason);
    void hit(const std::string& key, const std::string& tier);

    std::unique_ptr<MemoryTier> l1_;
    std::unique_ptr<CacheTier> l2_;
    std::unique_ptr<CacheTier> l3_;
    Clock& clock_;
    EventBus* bus_;

    std::atomic<uint64_t> l1_hits_{0};
    std::atomic<uint64_t> l2_hits_{0};
    std::atomic<uint64_t> l3_hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> tier_failures_{0};
};

// Assemble the cache from config. shared may be null (no L2). The L3
// backend comes from the registry; if it cannot be created the cache runs
// without L3.
std::unique_ptr<TieredCache> create_tiered_cache(const Config& config, KvStore* shared,
                                                 Clock& clock, EventBus* bus);

} // namespace tollgate
