#include "plugin.hpp"
#include "store.hpp"
#include "cache/cache_tier.hpp"
#include <stdexcept>
#include <algorithm>

namespace tollgate {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

void PluginRegistry::register_disk_tier(const std::string& name, DiskTierFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    disk_tiers_[name] = std::move(factory);
}

std::unique_ptr<KvStore> PluginRegistry::create_store(const std::string& name,
                                                      const Config& config,
                                                      Clock& clock) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(name);
    if (it == stores_.end()) {
        throw std::invalid_argument("Unknown store backend: " + name);
    }
    return it->second(config, clock);
}

std::unique_ptr<CacheTier> PluginRegistry::create_disk_tier(const std::string& name,
                                                            const Config& config,
                                                            Clock& clock) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = disk_tiers_.find(name);
    if (it == disk_tiers_.end()) {
        throw std::invalid_argument("Unknown disk cache backend: " + name);
    }
    return it->second(config, clock);
}

template<typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, factory] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(stores_);
}

std::vector<std::string> PluginRegistry::disk_tier_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(disk_tiers_);
}

bool PluginRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

bool PluginRegistry::has_disk_tier(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disk_tiers_.count(name) > 0;
}

} // namespace tollgate
