#pragma once
#include "token_bucket.hpp"
#include <string>

namespace tollgate {

class KvStore; // forward declaration
class Clock;   // forward declaration

// One place tokens can be drawn from. SharedBucket may throw StoreError.
class QuotaBucket {
public:
    virtual ~QuotaBucket() = default;

    virtual std::string kind() const = 0;

    virtual bool consume(double n) = 0;

    // Best-effort token count right now.
    virtual double available() = 0;
};

// Bucket private to this process.
class LocalBucket : public QuotaBucket {
public:
    LocalBucket(const BucketSpec& spec, Clock& clock);

    std::string kind() const override { return "local"; }
    bool consume(double n) override;
    double available() override;

    const TokenBucket& bucket() const { return bucket_; }

private:
    TokenBucket bucket_;
};

// Bucket state held in the shared store under key, refilled and consumed
// in one atomic store operation so cooperating processes cannot overspend.
class SharedBucket : public QuotaBucket {
public:
    SharedBucket(KvStore& store, std::string key, const BucketSpec& spec, Clock& clock);

    std::string kind() const override { return "shared"; }
    bool consume(double n) override;
    double available() override;

private:
    KvStore& store_;
    std::string key_;
    BucketSpec spec_;
    Clock& clock_;
};

} // namespace tollgate
