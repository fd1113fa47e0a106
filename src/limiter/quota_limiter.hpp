#pragma once
#include "quota_bucket.hpp"
#include "../config.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <cstdint>

namespace tollgate {

class KvStore;  // forward declaration
class Clock;    // forward declaration
class EventBus; // forward declaration

// The quota would be overspent by this call. Expected and frequent:
// callers serve from cache or defer.
class QuotaExceeded : public std::runtime_error {
public:
    QuotaExceeded(const std::string& endpoint, uint32_t remaining)
        : std::runtime_error("quota exceeded for " + endpoint),
          endpoint_(endpoint), remaining_(remaining) {}

    const std::string& endpoint() const { return endpoint_; }
    uint32_t remaining() const { return remaining_; }

private:
    std::string endpoint_;
    uint32_t remaining_;
};

// Sole gate on the external API quota. With a shared store the
// coordinated bucket is tried on every call; if the store fails the call
// is served by the local bucket instead and the degradation is logged.
class QuotaLimiter {
public:
    QuotaLimiter(const QuotaConfig& config, KvStore* shared, Clock& clock,
                 EventBus* bus = nullptr);

    // Take one token or throw QuotaExceeded.
    void acquire(const std::string& endpoint);

    // Take one token; false when denied.
    bool try_acquire(const std::string& endpoint);

    // Best-effort whole tokens left. Optimistic while on the local fallback.
    uint32_t remaining_estimate();

    // Sleep when the estimate is below the low-water mark, for the
    // shortfall divided by the refill rate, capped at max_wait.
    // Returns the seconds slept (0 when no wait was needed).
    double wait_if_needed();

    // True when the last call was served by the local bucket although a
    // shared store is configured.
    bool using_fallback() const;

    bool coordinated() const { return shared_ != nullptr; }

    const BucketSpec& spec() const { return spec_; }

private:
    void enter_fallback(const std::string& reason);
    void leave_fallback();

    QuotaConfig config_;
    BucketSpec spec_;
    Clock& clock_;
    EventBus* bus_;
    std::unique_ptr<QuotaBucket> shared_;
    LocalBucket local_;

    mutable std::mutex mutex_;
    bool fallback_ = false;
};

} // namespace tollgate
