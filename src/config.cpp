#include "config.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tollgate {

nlohmann::json Config::defaults_json() {
    StoreConfig store;
    CacheConfig cache;
    QuotaConfig quota;
    StateConfig state;
    return {
        {"store", {
            {"backend", store.backend},
            {"url", store.url},
            {"connect_timeout_ms", store.connect_timeout_ms},
            {"command_timeout_ms", store.command_timeout_ms},
            {"reconnect_interval", store.reconnect_interval}
        }},
        {"cache", {
            {"l1_ttl", cache.l1_ttl},
            {"l2_ttl", cache.l2_ttl},
            {"l3_ttl", cache.l3_ttl},
            {"l1_max_entries", cache.l1_max_entries},
            {"disk_backend", cache.disk_backend},
            {"dir", ""},
            {"key_prefix", cache.key_prefix}
        }},
        {"quota", {
            {"requests", quota.requests},
            {"period", quota.period},
            {"low_water", quota.low_water},
            {"max_wait", quota.max_wait},
            {"bucket_key", quota.bucket_key},
            {"bucket_expire", quota.bucket_expire}
        }},
        {"state", {
            {"key_prefix", state.key_prefix},
            {"retention", state.retention}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_unsigned())
        out = obj[name].get<uint32_t>();
}

static void read_string(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string())
        out = obj[name].get<std::string>();
}

void Config::apply_json(const nlohmann::json& j) {
    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        read_string(s, "backend", store.backend);
        read_string(s, "url", store.url);
        read_u32(s, "connect_timeout_ms", store.connect_timeout_ms);
        read_u32(s, "command_timeout_ms", store.command_timeout_ms);
        read_u32(s, "reconnect_interval", store.reconnect_interval);
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        read_u32(c, "l1_ttl", cache.l1_ttl);
        read_u32(c, "l2_ttl", cache.l2_ttl);
        read_u32(c, "l3_ttl", cache.l3_ttl);
        read_u32(c, "l1_max_entries", cache.l1_max_entries);
        read_string(c, "disk_backend", cache.disk_backend);
        read_string(c, "dir", cache.dir);
        read_string(c, "key_prefix", cache.key_prefix);
    }

    if (j.contains("quota") && j["quota"].is_object()) {
        auto& q = j["quota"];
        read_u32(q, "requests", quota.requests);
        read_u32(q, "period", quota.period);
        read_u32(q, "low_water", quota.low_water);
        read_u32(q, "max_wait", quota.max_wait);
        read_string(q, "bucket_key", quota.bucket_key);
        read_u32(q, "bucket_expire", quota.bucket_expire);
    }

    if (j.contains("state") && j["state"].is_object()) {
        auto& st = j["state"];
        read_string(st, "key_prefix", state.key_prefix);
        read_u32(st, "retention", state.retention);
    }
}

static bool env_u32(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    unsigned long parsed = std::strtoul(v, &end, 10);
    if (end == v || *end != '\0') {
        std::cerr << "[config] Ignoring non-numeric " << name << "=" << v << "\n";
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

void Config::apply_env() {
    if (const char* v = std::getenv("REDIS_URL")) {
        store.url = v;
#ifdef TOLLGATE_HAS_REDIS
        // An explicit URL means the operator wants the shared store.
        store.backend = "redis";
#endif
    }
    env_u32("RATE_LIMIT_REQUESTS", quota.requests);
    env_u32("RATE_LIMIT_PERIOD", quota.period);
    if (const char* v = std::getenv("TOLLGATE_CACHE_DIR"))
        cache.dir = v;
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config " << config_path
                      << " (" << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    cfg.apply_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.tollgate/config.json"));
}

std::string Config::cache_dir() const {
    if (cache.dir.empty()) return expand_home("~/.tollgate/cache");
    return expand_home(cache.dir);
}

static int parse_port_or_db(const std::string& s, const std::string& url, const char* what) {
    if (s.empty() || s.size() > 5) {
        throw std::invalid_argument(std::string("Invalid ") + what + " in redis URL: " + url);
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument(std::string("Invalid ") + what + " in redis URL: " + url);
        }
    }
    return std::stoi(s);
}

RedisEndpoint parse_redis_url(const std::string& url) {
    const std::string scheme = "redis://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Redis URL must start with redis://: " + url);
    }

    RedisEndpoint ep;
    std::string rest = url.substr(scheme.size());

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        std::string auth = rest.substr(0, at);
        rest = rest.substr(at + 1);
        // user:password or :password; only the password is used
        auto colon = auth.find(':');
        ep.password = colon == std::string::npos ? auth : auth.substr(colon + 1);
    }

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        std::string db = rest.substr(slash + 1);
        rest = rest.substr(0, slash);
        if (!db.empty()) ep.database = parse_port_or_db(db, url, "database");
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        ep.port = parse_port_or_db(rest.substr(colon + 1), url, "port");
        rest = rest.substr(0, colon);
    }

    if (!rest.empty()) ep.host = rest;
    if (ep.port <= 0 || ep.port > 65535) {
        throw std::invalid_argument("Redis port out of range: " + url);
    }
    return ep;
}

} // namespace tollgate
