#pragma once
#include "limiter/token_bucket.hpp"
#include <string>
#include <optional>
#include <unordered_map>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace tollgate {

struct Config; // forward declaration
class Clock;   // forward declaration

// A shared-store command failed (script error, wrong type, ...).
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The store could not be reached (connect failure, timeout, backoff).
class StoreUnavailable : public StoreError {
public:
    using StoreError::StoreError;
};

using FieldMap = std::unordered_map<std::string, std::string>;

// Network-accessible key-value store shared by cooperating processes.
// Every method may throw StoreError/StoreUnavailable; callers degrade.
// A ttl_seconds of 0 means no expiry.
class KvStore {
public:
    virtual ~KvStore() = default;

    virtual std::string backend_name() const = 0;

    // True when a round-trip to the store succeeds. Never throws.
    virtual bool ping() = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value,
                     uint32_t ttl_seconds) = 0;

    // Returns true if the key existed.
    virtual bool remove(const std::string& key) = 0;

    // Atomically replace the whole hash at key with fields.
    virtual void hash_replace(const std::string& key, const FieldMap& fields,
                              uint32_t ttl_seconds) = 0;

    // All fields of the hash at key (empty when absent).
    virtual FieldMap hash_get_all(const std::string& key) = 0;

    // Atomically set one field if the hash exists, refreshing its TTL.
    // Returns false when the hash does not exist.
    virtual bool hash_set_if_exists(const std::string& key, const std::string& field,
                                    const std::string& value, uint32_t ttl_seconds) = 0;

    // Atomic refill-and-consume of the bucket stored at key. A missing
    // bucket starts full. Returns whether n tokens were granted.
    virtual bool bucket_consume(const std::string& key, const BucketSpec& spec,
                                double n, double now) = 0;

    // Stored bucket state, if any (no refill applied).
    virtual std::optional<BucketState> bucket_peek(const std::string& key) = 0;
};

// Create the configured shared store through the plugin registry.
// Returns nullptr when the backend is "none" or not compiled in.
std::unique_ptr<KvStore> create_store(const Config& config, Clock& clock);

} // namespace tollgate
