#include "quota_bucket.hpp"
#include "../clock.hpp"
#include "../store.hpp"

namespace tollgate {

LocalBucket::LocalBucket(const BucketSpec& spec, Clock& clock)
    : bucket_(spec.capacity, spec.refill_rate, clock) {}

bool LocalBucket::consume(double n) {
    return bucket_.consume(n);
}

double LocalBucket::available() {
    return bucket_.available_tokens();
}

SharedBucket::SharedBucket(KvStore& store, std::string key, const BucketSpec& spec,
                           Clock& clock)
    : store_(store), key_(std::move(key)), spec_(spec), clock_(clock) {}

bool SharedBucket::consume(double n) {
    return store_.bucket_consume(key_, spec_, n, clock_.now());
}

double SharedBucket::available() {
    auto state = store_.bucket_peek(key_);
    // No stored state yet: the first consumer will find the bucket full.
    if (!state) return spec_.capacity;
    return projected_tokens(*state, spec_, clock_.now());
}

} // namespace tollgate
