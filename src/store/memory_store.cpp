#include "memory_store.hpp"
#include "../clock.hpp"
#include "../plugin.hpp"
#include "../util.hpp"

static tollgate::StoreRegistrar reg_memory("memory",
    [](const tollgate::Config&, tollgate::Clock& clock) {
        return std::make_unique<tollgate::InMemoryStore>(clock);
    });

namespace tollgate {

InMemoryStore::InMemoryStore(Clock& clock) : clock_(clock) {}

double InMemoryStore::expiry_for(uint32_t ttl_seconds) {
    return ttl_seconds == 0 ? 0.0 : clock_.now() + ttl_seconds;
}

InMemoryStore::Slot* InMemoryStore::find_live(const std::string& key) {
    auto it = slots_.find(key);
    if (it == slots_.end()) return nullptr;
    if (it->second.expires_at > 0.0 && clock_.now() >= it->second.expires_at) {
        slots_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> InMemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_live(key);
    if (!slot) return std::nullopt;
    if (slot->is_hash) {
        throw StoreError("WRONGTYPE key holds a hash: " + key);
    }
    return slot->value;
}

void InMemoryStore::set(const std::string& key, const std::string& value,
                        uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot slot;
    slot.value = value;
    slot.expires_at = expiry_for(ttl_seconds);
    slots_[key] = std::move(slot);
}

bool InMemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!find_live(key)) return false;
    slots_.erase(key);
    return true;
}

void InMemoryStore::hash_replace(const std::string& key, const FieldMap& fields,
                                 uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot slot;
    slot.fields = fields;
    slot.is_hash = true;
    slot.expires_at = expiry_for(ttl_seconds);
    slots_[key] = std::move(slot);
}

FieldMap InMemoryStore::hash_get_all(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_live(key);
    if (!slot) return {};
    if (!slot->is_hash) {
        throw StoreError("WRONGTYPE key holds a string: " + key);
    }
    return slot->fields;
}

bool InMemoryStore::hash_set_if_exists(const std::string& key, const std::string& field,
                                       const std::string& value, uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_live(key);
    if (!slot) return false;
    if (!slot->is_hash) {
        throw StoreError("WRONGTYPE key holds a string: " + key);
    }
    slot->fields[field] = value;
    if (ttl_seconds > 0) slot->expires_at = expiry_for(ttl_seconds);
    return true;
}

bool InMemoryStore::bucket_consume(const std::string& key, const BucketSpec& spec,
                                   double n, double now) {
    std::lock_guard<std::mutex> lock(mutex_);

    BucketState state{spec.capacity, now};
    Slot* slot = find_live(key);
    if (slot && slot->is_hash) {
        auto tokens = parse_double(slot->fields["tokens"]);
        auto last = parse_double(slot->fields["last_refill"]);
        if (tokens) state.tokens = *tokens;
        if (last) state.last_refill = *last;
    }

    bool granted = refill_and_consume(state, spec, n, now);

    Slot updated;
    updated.is_hash = true;
    updated.fields["tokens"] = format_double(state.tokens);
    updated.fields["last_refill"] = format_double(state.last_refill);
    updated.expires_at = expiry_for(spec.expire_seconds);
    slots_[key] = std::move(updated);
    return granted;
}

std::optional<BucketState> InMemoryStore::bucket_peek(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = find_live(key);
    if (!slot || !slot->is_hash) return std::nullopt;
    auto tokens = parse_double(slot->fields["tokens"]);
    auto last = parse_double(slot->fields["last_refill"]);
    if (!tokens || !last) return std::nullopt;
    return BucketState{*tokens, *last};
}

size_t InMemoryStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    double now = clock_.now();
    size_t live = 0;
    for (const auto& [key, slot] : slots_) {
        if (slot.expires_at == 0.0 || now < slot.expires_at) ++live;
    }
    return live;
}

} // namespace tollgate
