#include "tiered_cache.hpp"
#include "shared_tier.hpp"
#include "../clock.hpp"
#include "../config.hpp"
#include "../event_bus.hpp"
#include "../plugin.hpp"
#include "../store.hpp"
#include <iostream>
#include <stdexcept>

namespace tollgate {

TieredCache::TieredCache(std::unique_ptr<MemoryTier> l1,
                         std::unique_ptr<CacheTier> l2,
                         std::unique_ptr<CacheTier> l3,
                         Clock& clock,
                         EventBus* bus)
    : l1_(std::move(l1)), l2_(std::move(l2)), l3_(std::move(l3)),
      clock_(clock), bus_(bus) {
    if (!l1_) {
        throw std::invalid_argument("TieredCache requires an L1 tier");
    }
}

void TieredCache::degraded(const CacheTier& tier, const std::string& operation,
                           const std::string& reason) {
    ++tier_failures_;
    std::cerr << "[cache] " << tier.tier_name() << " " << operation
              << " failed: " << reason << "\n";

    TierDegradedEvent ev;
    ev.tier = tier.tier_name();
    ev.operation = operation;
    ev.reason = reason;
    publish_to(bus_, ev);
}

void TieredCache::hit(const std::string& key, const std::string& tier) {
    CacheHitEvent ev;
    ev.key = key;
    ev.tier = tier;
    publish_to(bus_, ev);
}

std::optional<CacheEntry> TieredCache::try_lookup(CacheTier* tier, const std::string& key) {
    if (!tier) return std::nullopt;
    try {
        return tier->lookup(key);
    } catch (const std::exception& e) {
        degraded(*tier, "get", e.what());
        return std::nullopt;
    }
}

void TieredCache::try_store(CacheTier* tier, const CacheEntry& entry) {
    if (!tier) return;
    try {
        tier->store(entry);
    } catch (const std::exception& e) {
        degraded(*tier, "set", e.what());
    }
}

std::optional<nlohmann::json> TieredCache::get(const std::string& key) {
    if (auto entry = l1_->lookup(key)) {
        ++l1_hits_;
        hit(key, l1_->tier_name());
        return entry->value;
    }

    if (auto entry = try_lookup(l2_.get(), key)) {
        ++l2_hits_;
        l1_->store(CacheEntry{key, entry->value, clock_.now()});
        hit(key, l2_->tier_name());
        return entry->value;
    }

    if (auto entry = try_lookup(l3_.get(), key)) {
        ++l3_hits_;
        CacheEntry promoted{key, entry->value, clock_.now()};
        l1_->store(promoted);
        try_store(l2_.get(), promoted);
        hit(key, l3_->tier_name());
        return entry->value;
    }

    ++misses_;
    CacheMissEvent ev;
    ev.key = key;
    publish_to(bus_, ev);
    return std::nullopt;
}

bool TieredCache::set(const std::string& key, const nlohmann::json& value) {
    CacheEntry entry{key, value, clock_.now()};
    try {
        l1_->store(entry);
    } catch (const std::exception& e) {
        std::cerr << "[cache] l1 set failed for key " << key << ": " << e.what() << "\n";
        return false;
    }

    try_store(l2_.get(), entry);
    try_store(l3_.get(), entry);
    return true;
}

void TieredCache::invalidate(const std::string& key) {
    l1_->erase(key);
    for (CacheTier* tier : {l2_.get(), l3_.get()}) {
        if (!tier) continue;
        try {
            tier->erase(key);
        } catch (const std::exception& e) {
            degraded(*tier, "erase", e.what());
        }
    }
}

uint32_t TieredCache::purge_expired() {
    uint32_t removed = l1_->purge_expired();
    if (l3_) {
        try {
            removed += l3_->purge_expired();
        } catch (const std::exception& e) {
            degraded(*l3_, "purge", e.what());
        }
    }
    return removed;
}

CacheStats TieredCache::stats() const {
    CacheStats s;
    s.l1_hits = l1_hits_.load();
    s.l2_hits = l2_hits_.load();
    s.l3_hits = l3_hits_.load();
    s.misses = misses_.load();
    s.tier_failures = tier_failures_.load();
    return s;
}

std::unique_ptr<TieredCache> create_tiered_cache(const Config& config, KvStore* shared,
                                                 Clock& clock, EventBus* bus) {
    auto l1 = std::make_unique<MemoryTier>(config.cache.l1_ttl, config.cache.l1_max_entries,
                                           clock);

    std::unique_ptr<CacheTier> l2;
    if (shared) {
        l2 = std::make_unique<SharedTier>(*shared, config.cache.key_prefix,
                                          config.cache.l2_ttl, clock);
    }

    std::unique_ptr<CacheTier> l3;
    const std::string& backend = config.cache.disk_backend;
    if (!backend.empty() && backend != "none") {
        try {
            l3 = PluginRegistry::instance().create_disk_tier(backend, config, clock);
        } catch (const std::exception& e) {
            std::cerr << "[cache] Disk tier '" << backend
                      << "' unavailable, running without L3: " << e.what() << "\n";
        }
    }

    return std::make_unique<TieredCache>(std::move(l1), std::move(l2), std::move(l3),
                                         clock, bus);
}

} // namespace tollgate
