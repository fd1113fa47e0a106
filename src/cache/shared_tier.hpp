#pragma once
#include "cache_tier.hpp"
#include <string>

namespace tollgate {

class KvStore; // forward declaration
class Clock;   // forward declaration

// L2: records in the shared key-value store under key_prefix + key.
// The store's own expiry is set to the tier TTL; the record timestamp is
// checked as well so a record outliving its TTL is still a miss.
class SharedTier : public CacheTier {
public:
    SharedTier(KvStore& store, std::string key_prefix, uint32_t ttl_seconds, Clock& clock);

    std::string tier_name() const override { return "l2"; }

    std::optional<CacheEntry> lookup(const std::string& key) override;
    void store(const CacheEntry& entry) override;
    bool erase(const std::string& key) override;

private:
    std::string store_key(const std::string& key) const { return prefix_ + key; }

    KvStore& store_;
    std::string prefix_;
    Clock& clock_;
};

} // namespace tollgate
