#pragma once
#include <cstdint>
#include <mutex>

namespace tollgate {

class Clock; // forward declaration

// Fixed parameters of a bucket, derived from the API's published quota.
struct BucketSpec {
    double capacity = 0.0;
    double refill_rate = 0.0;      // tokens per second
    uint32_t expire_seconds = 0;   // idle expiry of shared bucket state (0 = none)
};

// Mutable bucket state. 0 <= tokens <= capacity; last_refill never decreases.
struct BucketState {
    double tokens = 0.0;
    double last_refill = 0.0;
};

// Add elapsed * refill_rate tokens, capped at capacity, and advance
// last_refill to now. A clock that went backwards adds nothing.
void refill(BucketState& state, const BucketSpec& spec, double now);

// Refill, then take n tokens if available. Returns true if granted;
// on denial tokens are left as refilled.
bool refill_and_consume(BucketState& state, const BucketSpec& spec, double n, double now);

// Token count as it would be after a refill at `now`, without mutating.
double projected_tokens(const BucketState& state, const BucketSpec& spec, double now);

// Process-local token bucket. Lazy refill, no background timer.
class TokenBucket {
public:
    TokenBucket(double capacity, double refill_rate, Clock& clock);

    bool consume(double tokens = 1.0);

    // Tokens available right now (refill included, not consumed).
    double available_tokens() const;

    const BucketSpec& spec() const { return spec_; }
    BucketState snapshot() const;

private:
    BucketSpec spec_;
    BucketState state_;
    Clock& clock_;
    mutable std::mutex mutex_;
};

} // namespace tollgate
