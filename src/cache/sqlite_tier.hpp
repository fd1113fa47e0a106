#pragma once
#include "cache_tier.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace tollgate {

class Clock; // forward declaration

// L3 in a single SQLite database file. Rows are keyed by the SHA-256
// digest of the cache key; the key itself is stored alongside for the
// collision check.
class SqliteTier : public CacheTier {
public:
    SqliteTier(const std::string& path, uint32_t ttl_seconds, Clock& clock);
    ~SqliteTier() override;

    // Non-copyable
    SqliteTier(const SqliteTier&) = delete;
    SqliteTier& operator=(const SqliteTier&) = delete;

    std::string tier_name() const override { return "l3"; }

    std::optional<CacheEntry> lookup(const std::string& key) override;
    void store(const CacheEntry& entry) override;
    bool erase(const std::string& key) override;
    uint32_t purge_expired() override;

    uint32_t count();

private:
    void init_schema();
    bool delete_hash(const std::string& key_hash);

    sqlite3* db_ = nullptr;
    std::string path_;
    Clock& clock_;
    mutable std::mutex mutex_;
};

} // namespace tollgate
