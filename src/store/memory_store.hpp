#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

namespace tollgate {

class Clock; // forward declaration

// In-process KvStore. Not shared across processes: used when no network
// store is reachable, and as the backing store in tests.
class InMemoryStore : public KvStore {
public:
    explicit InMemoryStore(Clock& clock);

    std::string backend_name() const override { return "memory"; }

    bool ping() override { return true; }

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

    // Number of live (unexpired) keys.
    size_t size();

private:
    struct Slot {
        std::string value;       // plain string values
        FieldMap fields;         // hash values
        bool is_hash = false;
        double expires_at = 0.0; // 0 = never
    };

    // Must be called with mutex_ held. Drops the slot if expired.
    Slot* find_live(const std::string& key);
    double expiry_for(uint32_t ttl_seconds);

    Clock& clock_;
    std::unordered_map<std::string, Slot> slots_;
    std::mutex mutex_;
};

} // namespace tollgate
