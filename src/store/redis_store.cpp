#include "redis_store.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <hiredis/hiredis.h>
#include <sys/time.h>
#include <iostream>

static tollgate::StoreRegistrar reg_redis("redis",
    [](const tollgate::Config& config, tollgate::Clock&) {
        return std::make_unique<tollgate::RedisStore>(
            tollgate::parse_redis_url(config.store.url),
            config.store.connect_timeout_ms,
            config.store.command_timeout_ms,
            config.store.reconnect_interval);
    });

namespace tollgate {

// ── Lua scripts (each runs atomically inside the server) ────────

// KEYS[1] bucket; ARGV capacity, refill_rate, requested, now, expire
static const char* BUCKET_CONSUME_SCRIPT = R"lua(
local capacity = tonumber(ARGV[1])
local rate = tonumber(ARGV[2])
local requested = tonumber(ARGV[3])
local now = tonumber(ARGV[4])
local expire = tonumber(ARGV[5])
local current = redis.call('HMGET', KEYS[1], 'tokens', 'last_refill')
local tokens = tonumber(current[1]) or capacity
local last = tonumber(current[2]) or now
local elapsed = now - last
if elapsed > 0 then
  tokens = math.min(capacity, tokens + elapsed * rate)
  last = now
end
tokens = math.max(0, math.min(capacity, tokens))
local granted = 0
if tokens >= requested then
  tokens = tokens - requested
  granted = 1
end
redis.call('HSET', KEYS[1], 'tokens', tostring(tokens), 'last_refill', tostring(last))
if expire > 0 then
  redis.call('EXPIRE', KEYS[1], expire)
end
return granted
)lua";

// KEYS[1] hash; ARGV ttl, field1, value1, field2, value2, ...
static const char* HASH_REPLACE_SCRIPT = R"lua(
redis.call('DEL', KEYS[1])
for i = 2, #ARGV, 2 do
  redis.call('HSET', KEYS[1], ARGV[i], ARGV[i + 1])
end
local ttl = tonumber(ARGV[1])
if ttl > 0 then
  redis.call('EXPIRE', KEYS[1], ttl)
end
return 1
)lua";

// KEYS[1] hash; ARGV field, value, ttl
static const char* HASH_SET_IF_EXISTS_SCRIPT = R"lua(
if redis.call('EXISTS', KEYS[1]) == 0 then
  return 0
end
redis.call('HSET', KEYS[1], ARGV[1], ARGV[2])
local ttl = tonumber(ARGV[3])
if ttl > 0 then
  redis.call('EXPIRE', KEYS[1], ttl)
end
return 1
)lua";

static timeval to_timeval(uint32_t ms) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    return tv;
}

static std::string reply_string(const redisReply* reply) {
    if (!reply || !reply->str) return {};
    return std::string(reply->str, reply->len);
}

void RedisStore::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) freeReplyObject(reply);
}

RedisStore::RedisStore(const RedisEndpoint& endpoint,
                       uint32_t connect_timeout_ms,
                       uint32_t command_timeout_ms,
                       uint32_t reconnect_interval)
    : endpoint_(endpoint),
      connect_timeout_ms_(connect_timeout_ms),
      command_timeout_ms_(command_timeout_ms),
      reconnect_interval_(reconnect_interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        ensure_connected();
    } catch (const StoreUnavailable& e) {
        // Not fatal: every call retries once the backoff has elapsed.
        std::cerr << "[redis] " << e.what() << "; will retry on demand\n";
    }
}

RedisStore::~RedisStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect();
}

void RedisStore::disconnect() {
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
}

void RedisStore::ensure_connected() {
    if (ctx_ && ctx_->err == 0) return;
    disconnect();

    auto now = std::chrono::steady_clock::now();
    if (now < next_attempt_) {
        throw StoreUnavailable("redis: " + endpoint_.host + ":" +
                               std::to_string(endpoint_.port) + " unreachable (backing off)");
    }

    auto fail = [this](const std::string& why) {
        disconnect();
        next_attempt_ = std::chrono::steady_clock::now() + reconnect_interval_;
        throw StoreUnavailable("redis: " + why);
    };

    ctx_ = redisConnectWithTimeout(endpoint_.host.c_str(), endpoint_.port,
                                   to_timeval(connect_timeout_ms_));
    if (!ctx_) {
        fail("cannot allocate context");
    }
    if (ctx_->err) {
        fail("connect to " + endpoint_.host + ":" + std::to_string(endpoint_.port) +
             " failed: " + ctx_->errstr);
    }
    if (redisSetTimeout(ctx_, to_timeval(command_timeout_ms_)) != REDIS_OK) {
        fail("cannot set command timeout");
    }

    auto handshake = [this, &fail](std::vector<std::string> args, const char* what) {
        std::vector<const char*> argv;
        std::vector<size_t> argvlen;
        for (const auto& a : args) {
            argv.push_back(a.data());
            argvlen.push_back(a.size());
        }
        ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
            ctx_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
        if (!reply) {
            fail(std::string(what) + " failed: " + ctx_->errstr);
        }
        if (reply->type == REDIS_REPLY_ERROR) {
            fail(std::string(what) + " rejected: " + reply_string(reply.get()));
        }
    };

    if (!endpoint_.password.empty()) {
        handshake({"AUTH", endpoint_.password}, "AUTH");
    }
    if (endpoint_.database != 0) {
        handshake({"SELECT", std::to_string(endpoint_.database)}, "SELECT");
    }

    next_attempt_ = {};
    std::cerr << "[redis] Connected to " << endpoint_.host << ":" << endpoint_.port
              << "/" << endpoint_.database << "\n";
}

RedisStore::ReplyPtr RedisStore::command(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_connected();

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& a : args) {
        argv.push_back(a.data());
        argvlen.push_back(a.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
        ctx_, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        // Connection is unusable after an I/O error; reconnect next call.
        std::string err = ctx_->errstr;
        disconnect();
        throw StoreUnavailable("redis: " + args.front() + " failed: " + err);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreError("redis: " + args.front() + " error: " + reply_string(reply.get()));
    }
    return reply;
}

RedisStore::ReplyPtr RedisStore::eval(const char* script,
                                      const std::string& key,
                                      const std::vector<std::string>& args) {
    std::vector<std::string> full = {"EVAL", script, "1", key};
    full.insert(full.end(), args.begin(), args.end());
    return command(full);
}

bool RedisStore::ping() {
    try {
        auto reply = command({"PING"});
        return reply->type == REDIS_REPLY_STATUS;
    } catch (const StoreError&) {
        return false;
    }
}

std::optional<std::string> RedisStore::get(const std::string& key) {
    auto reply = command({"GET", key});
    if (reply->type == REDIS_REPLY_NIL) return std::nullopt;
    if (reply->type != REDIS_REPLY_STRING) {
        throw StoreError("redis: unexpected GET reply type for " + key);
    }
    return reply_string(reply.get());
}

void RedisStore::set(const std::string& key, const std::string& value,
                     uint32_t ttl_seconds) {
    if (ttl_seconds > 0) {
        command({"SET", key, value, "EX", std::to_string(ttl_seconds)});
    } else {
        command({"SET", key, value});
    }
}

bool RedisStore::remove(const std::string& key) {
    auto reply = command({"DEL", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

void RedisStore::hash_replace(const std::string& key, const FieldMap& fields,
                              uint32_t ttl_seconds) {
    std::vector<std::string> args;
    args.reserve(fields.size() * 2 + 1);
    args.push_back(std::to_string(ttl_seconds));
    for (const auto& [field, value] : fields) {
        args.push_back(field);
        args.push_back(value);
    }
    eval(HASH_REPLACE_SCRIPT, key, args);
}

FieldMap RedisStore::hash_get_all(const std::string& key) {
    auto reply = command({"HGETALL", key});
    FieldMap fields;
    if (reply->type != REDIS_REPLY_ARRAY) return fields;
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        fields[reply_string(reply->element[i])] = reply_string(reply->element[i + 1]);
    }
    return fields;
}

bool RedisStore::hash_set_if_exists(const std::string& key, const std::string& field,
                                    const std::string& value, uint32_t ttl_seconds) {
    auto reply = eval(HASH_SET_IF_EXISTS_SCRIPT, key,
                      {field, value, std::to_string(ttl_seconds)});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer == 1;
}

bool RedisStore::bucket_consume(const std::string& key, const BucketSpec& spec,
                                double n, double now) {
    auto reply = eval(BUCKET_CONSUME_SCRIPT, key, {
        format_double(spec.capacity),
        format_double(spec.refill_rate),
        format_double(n),
        format_double(now),
        std::to_string(spec.expire_seconds)
    });
    return reply->type == REDIS_REPLY_INTEGER && reply->integer == 1;
}

std::optional<BucketState> RedisStore::bucket_peek(const std::string& key) {
    auto reply = command({"HMGET", key, "tokens", "last_refill"});
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) return std::nullopt;
    auto tokens = parse_double(reply_string(reply->element[0]));
    auto last = parse_double(reply_string(reply->element[1]));
    if (!tokens || !last) return std::nullopt;
    return BucketState{*tokens, *last};
}

} // namespace tollgate
