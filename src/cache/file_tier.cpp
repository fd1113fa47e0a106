#include "file_tier.hpp"
#include "../clock.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

static tollgate::DiskTierRegistrar reg_file("file",
    [](const tollgate::Config& config, tollgate::Clock& clock) {
        return std::make_unique<tollgate::FileTier>(
            config.cache_dir(), config.cache.l3_ttl, clock);
    });

namespace tollgate {

static const char* RECORD_SUFFIX = ".cache";

// Parse a record file; nullopt if unreadable or malformed.
static std::optional<CacheEntry> read_record(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return std::nullopt;
    try {
        return entry_from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
}

FileTier::FileTier(std::string dir, uint32_t ttl_seconds, Clock& clock)
    : CacheTier(ttl_seconds), dir_(std::move(dir)), clock_(clock) {
    if (dir_.empty()) {
        throw std::invalid_argument("FileTier requires a cache directory");
    }
    std::filesystem::create_directories(dir_);
}

std::string FileTier::path_for(const std::string& key) const {
    return (std::filesystem::path(dir_) / (sha256_hex(key) + RECORD_SUFFIX)).string();
}

std::optional<CacheEntry> FileTier::lookup(const std::string& key) {
    std::string path = path_for(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    auto entry = read_record(path);
    if (!entry) {
        std::cerr << "[cache] Removing corrupt l3 record " << path << "\n";
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }
    if (entry->key != key) return std::nullopt;

    if (is_expired(entry->written_at, ttl_seconds_, clock_.now())) {
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }
    return entry;
}

void FileTier::store(const CacheEntry& entry) {
    std::string path = path_for(entry.key);
    if (!atomic_write_file(path, entry_to_json(entry).dump())) {
        throw std::runtime_error("cannot write cache record " + path);
    }
}

bool FileTier::erase(const std::string& key) {
    std::error_code ec;
    bool removed = std::filesystem::remove(path_for(key), ec);
    if (ec) {
        throw std::runtime_error("cannot remove cache record for " + key + ": " + ec.message());
    }
    return removed;
}

uint32_t FileTier::purge_expired() {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir_, ec);
    if (ec) return 0;

    double now = clock_.now();
    uint32_t removed = 0;
    for (const auto& dirent : it) {
        if (!dirent.is_regular_file(ec)) continue;
        if (dirent.path().extension() != RECORD_SUFFIX) continue;

        auto entry = read_record(dirent.path().string());
        if (!entry || is_expired(entry->written_at, ttl_seconds_, now)) {
            if (std::filesystem::remove(dirent.path(), ec)) ++removed;
        }
    }
    return removed;
}

} // namespace tollgate
