#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace tollgate;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default TTLs and quota", "[config]") {
    Config cfg;
    REQUIRE(cfg.cache.l1_ttl == 3600);
    REQUIRE(cfg.cache.l2_ttl == 86400);
    REQUIRE(cfg.cache.l3_ttl == 604800);
    REQUIRE(cfg.quota.requests == 5000);
    REQUIRE(cfg.quota.period == 3600);
    REQUIRE(cfg.quota.low_water == 100);
    REQUIRE(cfg.quota.max_wait == 30);
    REQUIRE(cfg.state.key_prefix == "state:");
}

TEST_CASE("QuotaConfig: refill_rate is requests per second", "[config]") {
    QuotaConfig q;
    q.requests = 3600;
    q.period = 3600;
    REQUIRE(q.refill_rate() == 1.0);

    q.period = 0;
    REQUIRE(q.refill_rate() == 0.0);
}

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "tollgate_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("REDIS_URL");
        unsetenv("RATE_LIMIT_REQUESTS");
        unsetenv("RATE_LIMIT_PERIOD");
        unsetenv("TOLLGATE_CACHE_DIR");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("REDIS_URL");
        unsetenv("RATE_LIMIT_REQUESTS");
        unsetenv("RATE_LIMIT_PERIOD");
        unsetenv("TOLLGATE_CACHE_DIR");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.tollgate/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.tollgate");
        std::ofstream f(config_path());
        f << content;
    }
};

// ── Config::load ────────────────────────────────────────────────

TEST_CASE("Config::load: creates default file when missing", "[config]") {
    ConfigTestGuard guard;
    auto cfg = Config::load();

    REQUIRE(std::filesystem::exists(guard.config_path()));
    REQUIRE(cfg.cache.disk_backend == "file");
    REQUIRE(cfg.cache_dir() == guard.dir + "/.tollgate/cache");
}

TEST_CASE("Config::load: file values override defaults", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({
        "cache": {"l1_ttl": 1, "disk_backend": "sqlite", "dir": "/tmp/tg"},
        "quota": {"requests": 60, "period": 60},
        "state": {"retention": 0}
    })");

    auto cfg = Config::load();
    REQUIRE(cfg.cache.l1_ttl == 1);
    REQUIRE(cfg.cache.l2_ttl == 86400);
    REQUIRE(cfg.cache.disk_backend == "sqlite");
    REQUIRE(cfg.cache_dir() == "/tmp/tg");
    REQUIRE(cfg.quota.requests == 60);
    REQUIRE(cfg.quota.refill_rate() == 1.0);
    REQUIRE(cfg.state.retention == 0);
}

TEST_CASE("Config::load: missing keys are merged back into the file", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({"quota": {"requests": 10}})");

    Config::load();

    std::ifstream f(guard.config_path());
    auto j = nlohmann::json::parse(f);
    REQUIRE(j["quota"]["requests"] == 10);
    REQUIRE(j["quota"]["period"] == 3600);
    REQUIRE(j.contains("cache"));
    REQUIRE(j.contains("state"));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard guard;
    guard.write_config("{ not json");

    auto cfg = Config::load();
    REQUIRE(cfg.quota.requests == 5000);
}

TEST_CASE("Config::load: wrongly typed values are ignored", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({"cache": {"l1_ttl": "soon"}, "quota": {"requests": -5}})");

    auto cfg = Config::load();
    REQUIRE(cfg.cache.l1_ttl == 3600);
    REQUIRE(cfg.quota.requests == 5000);
}

// ── Environment overrides ───────────────────────────────────────

TEST_CASE("Config::load: env vars override file", "[config]") {
    ConfigTestGuard guard;
    guard.write_config(R"({"quota": {"requests": 10, "period": 10}})");
    setenv("RATE_LIMIT_REQUESTS", "120", 1);
    setenv("RATE_LIMIT_PERIOD", "60", 1);
    setenv("TOLLGATE_CACHE_DIR", "/tmp/tg_env", 1);
    setenv("REDIS_URL", "redis://cache.internal:6380/2", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.quota.requests == 120);
    REQUIRE(cfg.quota.period == 60);
    REQUIRE(cfg.cache_dir() == "/tmp/tg_env");
    REQUIRE(cfg.store.url == "redis://cache.internal:6380/2");
}

TEST_CASE("Config::load: non-numeric env value is ignored", "[config]") {
    ConfigTestGuard guard;
    setenv("RATE_LIMIT_REQUESTS", "lots", 1);

    auto cfg = Config::load();
    REQUIRE(cfg.quota.requests == 5000);
}

// ── parse_redis_url ─────────────────────────────────────────────

TEST_CASE("parse_redis_url: host only uses defaults", "[config]") {
    auto ep = parse_redis_url("redis://cache.internal");
    REQUIRE(ep.host == "cache.internal");
    REQUIRE(ep.port == 6379);
    REQUIRE(ep.database == 0);
    REQUIRE(ep.password.empty());
}

TEST_CASE("parse_redis_url: password, port and database", "[config]") {
    auto ep = parse_redis_url("redis://:s3cret@10.0.0.5:6380/3");
    REQUIRE(ep.host == "10.0.0.5");
    REQUIRE(ep.port == 6380);
    REQUIRE(ep.database == 3);
    REQUIRE(ep.password == "s3cret");
}

TEST_CASE("parse_redis_url: user:password keeps only the password", "[config]") {
    auto ep = parse_redis_url("redis://default:pw@localhost:6379");
    REQUIRE(ep.password == "pw");
    REQUIRE(ep.host == "localhost");
}

TEST_CASE("parse_redis_url: empty host falls back to localhost", "[config]") {
    auto ep = parse_redis_url("redis://:7000");
    REQUIRE(ep.host == "localhost");
    REQUIRE(ep.port == 7000);
}

TEST_CASE("parse_redis_url: rejects malformed URLs", "[config]") {
    REQUIRE_THROWS_AS(parse_redis_url("http://localhost:6379"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_redis_url("redis://localhost:abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_redis_url("redis://localhost:99999"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_redis_url("redis://localhost:0"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_redis_url("redis://localhost:1234567"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_redis_url("redis://localhost/x"), std::invalid_argument);
}
