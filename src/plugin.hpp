#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace tollgate {

class KvStore;    // forward declaration
class CacheTier;  // forward declaration
class Clock;      // forward declaration

// Factory function types
using StoreFactory = std::function<std::unique_ptr<KvStore>(
    const Config& config, Clock& clock)>;

using DiskTierFactory = std::function<std::unique_ptr<CacheTier>(
    const Config& config, Clock& clock)>;

// Central registry for self-registering backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_store(const std::string& name, StoreFactory factory);
    void register_disk_tier(const std::string& name, DiskTierFactory factory);

    // Creation. Throws std::invalid_argument for unknown names.
    std::unique_ptr<KvStore> create_store(const std::string& name,
                                          const Config& config,
                                          Clock& clock) const;

    std::unique_ptr<CacheTier> create_disk_tier(const std::string& name,
                                                const Config& config,
                                                Clock& clock) const;

    // Query
    std::vector<std::string> store_names() const;
    std::vector<std::string> disk_tier_names() const;
    bool has_store(const std::string& name) const;
    bool has_disk_tier(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
    std::unordered_map<std::string, DiskTierFactory> disk_tiers_;
};

// ── Self-registrar helpers (used at file scope in each backend .cpp) ──

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        PluginRegistry::instance().register_store(name, std::move(factory));
    }
};

struct DiskTierRegistrar {
    DiskTierRegistrar(const std::string& name, DiskTierFactory factory) {
        PluginRegistry::instance().register_disk_tier(name, std::move(factory));
    }
};

} // namespace tollgate
