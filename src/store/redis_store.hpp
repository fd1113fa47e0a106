#pragma once
#include "../store.hpp"
#include "../config.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct redisContext; // forward declare
struct redisReply;   // forward declare

namespace tollgate {

// KvStore over a single synchronous hiredis connection.
// Connect and command timeouts bound every call. A lost connection is
// re-established lazily on the next call; failed attempts back off for
// reconnect_interval seconds, during which calls fail fast with
// StoreUnavailable.
class RedisStore : public KvStore {
public:
    RedisStore(const RedisEndpoint& endpoint,
               uint32_t connect_timeout_ms,
               uint32_t command_timeout_ms,
               uint32_t reconnect_interval);
    ~RedisStore() override;

    // Non-copyable
    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::string backend_name() const override { return "redis"; }

    bool ping() override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             uint32_t ttl_seconds) override;
    bool remove(const std::string& key) override;

    void hash_replace(const std::string& key, const FieldMap& fields,
                      uint32_t ttl_seconds) override;
    FieldMap hash_get_all(const std::string& key) override;
    bool hash_set_if_exists(const std::string& key, const std::string& field,
                            const std::string& value, uint32_t ttl_seconds) override;

    bool bucket_consume(const std::string& key, const BucketSpec& spec,
                        double n, double now) override;
    std::optional<BucketState> bucket_peek(const std::string& key) override;

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    // Must be called with mutex_ held.
    void ensure_connected();
    void disconnect();

    // Run one command. Throws StoreUnavailable on I/O failure and
    // StoreError on an error reply.
    ReplyPtr command(const std::vector<std::string>& args);

    ReplyPtr eval(const char* script,
                  const std::string& key,
                  const std::vector<std::string>& args);

    RedisEndpoint endpoint_;
    uint32_t connect_timeout_ms_;
    uint32_t command_timeout_ms_;
    std::chrono::seconds reconnect_interval_;

    redisContext* ctx_ = nullptr;
    std::chrono::steady_clock::time_point next_attempt_{};
    std::mutex mutex_;
};

} // namespace tollgate
