#pragma once
#include "cache_tier.hpp"
#include <string>

namespace tollgate {

class Clock; // forward declaration

// L3 on the local filesystem: one JSON record per key, in a file named by
// the SHA-256 digest of the key. The record keeps the original key so a
// digest collision reads as a miss. Writes go through atomic rename.
class FileTier : public CacheTier {
public:
    FileTier(std::string dir, uint32_t ttl_seconds, Clock& clock);

    std::string tier_name() const override { return "l3"; }

    std::optional<CacheEntry> lookup(const std::string& key) override;
    void store(const CacheEntry& entry) override;
    bool erase(const std::string& key) override;
    uint32_t purge_expired() override;

    // File that holds (or would hold) the record for key.
    std::string path_for(const std::string& key) const;

    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
    Clock& clock_;
};

} // namespace tollgate
