#pragma once
#include "cache/tiered_cache.hpp"
#include "limiter/quota_limiter.hpp"
#include "state/state_tracker.hpp"
#include "store.hpp"
#include <memory>

namespace tollgate {

struct Config;  // forward declaration
class Clock;    // forward declaration
class EventBus; // forward declaration

// The per-process set of shared components. Built once at startup and
// passed by reference to whatever needs the cache, limiter or tracker.
class Runtime {
    // Only create() can name this, so only create() can construct.
    struct Key {
        explicit Key() = default;
    };

public:
    explicit Runtime(Key) {}

    // A shared store that cannot be created (bad URL, backend missing) is
    // logged and the components run in their local modes.
    static std::unique_ptr<Runtime> create(const Config& config, Clock& clock,
                                           EventBus* bus = nullptr);

    // Null when running without a shared store.
    KvStore* shared_store() { return shared_.get(); }

    TieredCache& cache() { return *cache_; }
    QuotaLimiter& limiter() { return *limiter_; }
    StateTracker& tracker() { return *tracker_; }

private:
    // Declared first: the components below hold references into it.
    std::unique_ptr<KvStore> shared_;
    std::unique_ptr<TieredCache> cache_;
    std::unique_ptr<QuotaLimiter> limiter_;
    std::unique_ptr<StateTracker> tracker_;
};

} // namespace tollgate
