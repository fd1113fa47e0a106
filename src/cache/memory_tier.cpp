#include "memory_tier.hpp"
#include "../clock.hpp"
#include <algorithm>
#include <vector>

namespace tollgate {

MemoryTier::MemoryTier(uint32_t ttl_seconds, uint32_t max_entries, Clock& clock)
    : CacheTier(ttl_seconds), max_entries_(max_entries), clock_(clock) {}

std::optional<CacheEntry> MemoryTier::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(key);
    if (it == slots_.end()) return std::nullopt;

    double now = clock_.now();
    if (is_expired(it->second.entry.written_at, ttl_seconds_, now)) {
        slots_.erase(it);
        return std::nullopt;
    }

    it->second.last_access = now;
    return it->second.entry;
}

void MemoryTier::store(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[entry.key] = Slot{entry, clock_.now()};
    evict();
}

bool MemoryTier::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.erase(key) > 0;
}

uint32_t MemoryTier::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    double now = clock_.now();
    uint32_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end(); ) {
        if (is_expired(it->second.entry.written_at, ttl_seconds_, now)) {
            it = slots_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void MemoryTier::evict() {
    if (max_entries_ == 0 || slots_.size() <= max_entries_) return;

    double now = clock_.now();
    for (auto it = slots_.begin(); it != slots_.end(); ) {
        if (is_expired(it->second.entry.written_at, ttl_seconds_, now)) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
    if (slots_.size() <= max_entries_) return;

    // Still over capacity: drop the least recently accessed.
    std::vector<std::pair<double, std::string>> by_access; // {last_access, key}
    by_access.reserve(slots_.size());
    for (const auto& [key, slot] : slots_) {
        by_access.emplace_back(slot.last_access, key);
    }
    std::sort(by_access.begin(), by_access.end());

    size_t to_remove = slots_.size() - max_entries_;
    for (size_t i = 0; i < to_remove; ++i) {
        slots_.erase(by_access[i].second);
    }
}

uint32_t MemoryTier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(slots_.size());
}

void MemoryTier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
}

} // namespace tollgate
