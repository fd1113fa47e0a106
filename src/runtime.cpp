#include "runtime.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include <iostream>

namespace tollgate {

std::unique_ptr<Runtime> Runtime::create(const Config& config, Clock& clock, EventBus* bus) {
    auto rt = std::make_unique<Runtime>(Key{});

    try {
        rt->shared_ = create_store(config, clock);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[config] Shared store misconfigured, running locally: " << e.what() << "\n";
    }

    KvStore* shared = rt->shared_.get();
    rt->cache_ = create_tiered_cache(config, shared, clock, bus);
    rt->limiter_ = std::make_unique<QuotaLimiter>(config.quota, shared, clock, bus);
    rt->tracker_ = std::make_unique<StateTracker>(config.state, shared, clock, bus);
    return rt;
}

} // namespace tollgate
