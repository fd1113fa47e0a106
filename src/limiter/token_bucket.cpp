#include "token_bucket.hpp"
#include "../clock.hpp"
#include <algorithm>
#include <stdexcept>

namespace tollgate {

void refill(BucketState& state, const BucketSpec& spec, double now) {
    double elapsed = now - state.last_refill;
    if (elapsed > 0.0) {
        state.tokens = std::min(spec.capacity, state.tokens + elapsed * spec.refill_rate);
        state.last_refill = now;
    }
    // Clamp state restored from elsewhere (e.g. a shared store) into bounds.
    state.tokens = std::max(0.0, std::min(spec.capacity, state.tokens));
}

bool refill_and_consume(BucketState& state, const BucketSpec& spec, double n, double now) {
    refill(state, spec, now);
    if (state.tokens >= n) {
        state.tokens -= n;
        return true;
    }
    return false;
}

double projected_tokens(const BucketState& state, const BucketSpec& spec, double now) {
    BucketState copy = state;
    refill(copy, spec, now);
    return copy.tokens;
}

TokenBucket::TokenBucket(double capacity, double refill_rate, Clock& clock)
    : clock_(clock) {
    if (capacity <= 0.0) {
        throw std::invalid_argument("TokenBucket capacity must be positive");
    }
    if (refill_rate <= 0.0) {
        throw std::invalid_argument("TokenBucket refill rate must be positive");
    }
    spec_.capacity = capacity;
    spec_.refill_rate = refill_rate;
    state_.tokens = capacity;
    state_.last_refill = clock_.now();
}

bool TokenBucket::consume(double tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    return refill_and_consume(state_, spec_, tokens, clock_.now());
}

double TokenBucket::available_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projected_tokens(state_, spec_, clock_.now());
}

BucketState TokenBucket::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

} // namespace tollgate
