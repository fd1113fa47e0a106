#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace tollgate {

struct StoreConfig {
#ifdef TOLLGATE_HAS_REDIS
    std::string backend = "redis";
#else
    std::string backend = "none";
#endif
    std::string url = "redis://localhost:6379";
    uint32_t connect_timeout_ms = 500;
    uint32_t command_timeout_ms = 500;
    uint32_t reconnect_interval = 5;  // seconds between reconnect attempts
};

struct CacheConfig {
    uint32_t l1_ttl = 3600;        // 1 hour
    uint32_t l2_ttl = 86400;       // 24 hours
    uint32_t l3_ttl = 604800;      // 7 days
    uint32_t l1_max_entries = 10000;
    std::string disk_backend = "file";
    std::string dir;               // empty = ~/.tollgate/cache
    std::string key_prefix = "cache:";
};

struct QuotaConfig {
    uint32_t requests = 5000;      // calls allowed per period
    uint32_t period = 3600;        // seconds
    uint32_t low_water = 100;
    uint32_t max_wait = 30;        // seconds
    std::string bucket_key = "quota:bucket";
    uint32_t bucket_expire = 3600;

    double refill_rate() const {
        return period == 0 ? 0.0 : static_cast<double>(requests) / period;
    }
};

struct StateConfig {
    std::string key_prefix = "state:";
    uint32_t retention = 604800;   // 7 days, 0 = keep forever
};

struct Config {
    StoreConfig store;
    CacheConfig cache;
    QuotaConfig quota;
    StateConfig state;

    // Load from ~/.tollgate/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if missing)
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config document on top of the current values.
    void apply_json(const nlohmann::json& j);

    // Environment variables override whatever the file said.
    void apply_env();

    // Cache directory with ~ expanded (default when unset).
    std::string cache_dir() const;
};

// Components of a redis:// URL.
struct RedisEndpoint {
    std::string host = "localhost";
    int port = 6379;
    int database = 0;
    std::string password;
};

// Parse redis://[:password@]host[:port][/db]. Throws std::invalid_argument.
RedisEndpoint parse_redis_url(const std::string& url);

} // namespace tollgate
