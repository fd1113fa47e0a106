#include "sqlite_tier.hpp"
#include "../clock.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static tollgate::DiskTierRegistrar reg_sqlite("sqlite",
    [](const tollgate::Config& config, tollgate::Clock& clock) {
        std::string path = config.cache_dir() + "/cache.db";
        return std::make_unique<tollgate::SqliteTier>(path, config.cache.l3_ttl, clock);
    });

namespace tollgate {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteTier::SqliteTier(const std::string& path, uint32_t ttl_seconds, Clock& clock)
    : CacheTier(ttl_seconds), path_(path), clock_(clock) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteTier: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    init_schema();
}

SqliteTier::~SqliteTier() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteTier::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS cache_entries ("
        "  key_hash  TEXT PRIMARY KEY,"
        "  key       TEXT NOT NULL,"
        "  value     TEXT NOT NULL,"
        "  timestamp REAL NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteTier: schema creation failed: " + msg);
    }
}

bool SqliteTier::delete_hash(const std::string& key_hash) {
    StmtGuard g;
    const char* sql = "DELETE FROM cache_entries WHERE key_hash = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteTier: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, key_hash.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteTier: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

std::optional<CacheEntry> SqliteTier::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key_hash = sha256_hex(key);

    StmtGuard g;
    const char* sql = "SELECT key, value, timestamp FROM cache_entries WHERE key_hash = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteTier: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, key_hash.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    CacheEntry entry;
    if (auto* v = sqlite3_column_text(g.stmt, 0)) entry.key = reinterpret_cast<const char*>(v);
    std::string raw;
    if (auto* v = sqlite3_column_text(g.stmt, 1)) raw = reinterpret_cast<const char*>(v);
    entry.written_at = sqlite3_column_double(g.stmt, 2);

    if (entry.key != key) return std::nullopt;

    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        std::cerr << "[cache] Removing corrupt l3 row for key: " << key << "\n";
        delete_hash(key_hash);
        return std::nullopt;
    }
    entry.value = std::move(parsed);

    if (is_expired(entry.written_at, ttl_seconds_, clock_.now())) {
        delete_hash(key_hash);
        return std::nullopt;
    }
    return entry;
}

void SqliteTier::store(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key_hash = sha256_hex(entry.key);
    std::string value = entry.value.dump();

    StmtGuard g;
    const char* sql =
        "INSERT INTO cache_entries (key_hash, key, value, timestamp) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(key_hash) DO UPDATE SET key = excluded.key, "
        "value = excluded.value, timestamp = excluded.timestamp;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteTier: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, key_hash.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, entry.key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, value.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 4, entry.written_at);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteTier: ") + sqlite3_errmsg(db_));
    }
}

bool SqliteTier::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_hash(sha256_hex(key));
}

uint32_t SqliteTier::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    double cutoff = clock_.now() - static_cast<double>(ttl_seconds_);

    StmtGuard g;
    const char* sql = "DELETE FROM cache_entries WHERE timestamp < ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    sqlite3_bind_double(g.stmt, 1, cutoff);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return 0;
    return static_cast<uint32_t>(sqlite3_changes(db_));
}

uint32_t SqliteTier::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "SELECT COUNT(*) FROM cache_entries;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

} // namespace tollgate
