#include "quota_limiter.hpp"
#include "../clock.hpp"
#include "../event_bus.hpp"
#include "../store.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace tollgate {

static BucketSpec spec_from(const QuotaConfig& config) {
    if (config.requests == 0 || config.period == 0) {
        throw std::invalid_argument("quota requests and period must be positive");
    }
    BucketSpec spec;
    spec.capacity = static_cast<double>(config.requests);
    spec.refill_rate = config.refill_rate();
    spec.expire_seconds = config.bucket_expire;
    return spec;
}

QuotaLimiter::QuotaLimiter(const QuotaConfig& config, KvStore* shared, Clock& clock,
                           EventBus* bus)
    : config_(config), spec_(spec_from(config)), clock_(clock), bus_(bus),
      local_(spec_, clock) {
    if (shared) {
        shared_ = std::make_unique<SharedBucket>(*shared, config_.bucket_key, spec_, clock_);
    }
}

void QuotaLimiter::enter_fallback(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fallback_) return;
        fallback_ = true;
    }
    std::cerr << "[quota] Shared bucket unavailable, limiting locally: " << reason << "\n";
    LimiterFallbackEvent ev;
    ev.reason = reason;
    publish_to(bus_, ev);
}

void QuotaLimiter::leave_fallback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fallback_) {
        fallback_ = false;
        std::cerr << "[quota] Shared bucket reachable again\n";
    }
}

bool QuotaLimiter::try_acquire(const std::string& endpoint) {
    bool granted = false;
    bool served = false;
    if (shared_) {
        try {
            granted = shared_->consume(1.0);
            served = true;
            leave_fallback();
        } catch (const StoreError& e) {
            enter_fallback(e.what());
        }
    }
    if (!served) {
        granted = local_.consume(1.0);
    }

    if (!granted) {
        uint32_t remaining = remaining_estimate();
        std::cerr << "[quota] Denied call to " << endpoint
                  << " (" << remaining << " remaining)\n";
        QuotaDeniedEvent ev;
        ev.endpoint = endpoint;
        ev.remaining = remaining;
        publish_to(bus_, ev);
    }
    return granted;
}

void QuotaLimiter::acquire(const std::string& endpoint) {
    if (!try_acquire(endpoint)) {
        throw QuotaExceeded(endpoint, remaining_estimate());
    }
}

uint32_t QuotaLimiter::remaining_estimate() {
    double tokens = 0.0;
    bool served = false;
    if (shared_) {
        try {
            tokens = shared_->available();
            served = true;
        } catch (const StoreError& e) {
            enter_fallback(e.what());
        }
    }
    if (!served) {
        tokens = local_.available();
    }
    return static_cast<uint32_t>(std::floor(std::max(0.0, tokens)));
}

double QuotaLimiter::wait_if_needed() {
    uint32_t remaining = remaining_estimate();
    if (remaining >= config_.low_water) return 0.0;

    double wait = static_cast<double>(config_.low_water - remaining) / spec_.refill_rate;
    wait = std::min(wait, static_cast<double>(config_.max_wait));
    std::cerr << "[quota] Low on quota (" << remaining << " remaining), waiting "
              << wait << "s\n";
    clock_.sleep_for(wait);
    return wait;
}

bool QuotaLimiter::using_fallback() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallback_;
}

} // namespace tollgate
