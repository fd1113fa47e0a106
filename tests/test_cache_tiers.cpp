#include <catch2/catch_test_macros.hpp>
#include "mock_clock.hpp"
#include "mock_store.hpp"
#include "cache/memory_tier.hpp"
#include "cache/shared_tier.hpp"

using namespace tollgate;

// ── Record layout ───────────────────────────────────────────────

TEST_CASE("entry_from_json: accepts the shared record layout", "[cache]") {
    CacheEntry e{"profile:octocat", {{"bio", "x"}}, 1700000000.5};
    auto parsed = entry_from_json(entry_to_json(e));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->key == "profile:octocat");
    REQUIRE(parsed->value["bio"] == "x");
    REQUIRE(parsed->written_at == 1700000000.5);
}

TEST_CASE("entry_from_json: rejects malformed records", "[cache]") {
    REQUIRE_FALSE(entry_from_json(nlohmann::json::array()).has_value());
    REQUIRE_FALSE(entry_from_json({{"value", 1}, {"timestamp", 1.0}}).has_value());
    REQUIRE_FALSE(entry_from_json({{"key", "k"}, {"value", 1}, {"timestamp", "now"}}).has_value());
    REQUIRE_FALSE(entry_from_json({{"key", "k"}, {"timestamp", 1.0}}).has_value());
}

TEST_CASE("is_expired: strictly older than ttl", "[cache]") {
    REQUIRE_FALSE(is_expired(100.0, 10, 110.0));
    REQUIRE(is_expired(100.0, 10, 110.5));
}

// ── MemoryTier ──────────────────────────────────────────────────

struct MemoryTierFixture {
    ManualClock clock;
    MemoryTier tier{60, 3, clock};

    void put(const std::string& key, int v) {
        tier.store(CacheEntry{key, v, clock.now()});
    }
};

TEST_CASE("MemoryTier: hit after store, miss for other keys", "[cache]") {
    MemoryTierFixture f;
    f.put("a", 1);
    REQUIRE(f.tier.lookup("a")->value == 1);
    REQUIRE_FALSE(f.tier.lookup("b").has_value());
}

TEST_CASE("MemoryTier: expired entry is a miss and is dropped", "[cache]") {
    MemoryTierFixture f;
    f.put("a", 1);
    f.clock.advance(61);
    REQUIRE_FALSE(f.tier.lookup("a").has_value());
    REQUIRE(f.tier.size() == 0);
}

TEST_CASE("MemoryTier: evicts least recently accessed over capacity", "[cache]") {
    MemoryTierFixture f;
    f.put("a", 1);
    f.clock.advance(1);
    f.put("b", 2);
    f.clock.advance(1);
    f.put("c", 3);
    f.clock.advance(1);
    f.tier.lookup("a");  // a is now the most recently used
    f.clock.advance(1);
    f.put("d", 4);

    REQUIRE(f.tier.size() == 3);
    REQUIRE(f.tier.lookup("a").has_value());
    REQUIRE_FALSE(f.tier.lookup("b").has_value());
    REQUIRE(f.tier.lookup("c").has_value());
    REQUIRE(f.tier.lookup("d").has_value());
}

TEST_CASE("MemoryTier: eviction prefers expired entries", "[cache]") {
    MemoryTierFixture f;
    f.put("old", 0);
    f.clock.advance(30);
    f.put("b", 2);
    f.put("c", 3);
    f.clock.advance(31);  // "old" is now expired
    f.tier.lookup("b");
    f.tier.lookup("c");
    f.put("d", 4);

    REQUIRE(f.tier.size() == 3);
    REQUIRE(f.tier.lookup("b").has_value());
}

TEST_CASE("MemoryTier: purge_expired counts removals", "[cache]") {
    MemoryTierFixture f;
    f.put("a", 1);
    f.put("b", 2);
    f.clock.advance(61);
    f.put("c", 3);
    REQUIRE(f.tier.purge_expired() == 2);
    REQUIRE(f.tier.size() == 1);
}

TEST_CASE("MemoryTier: erase and clear", "[cache]") {
    MemoryTierFixture f;
    f.put("a", 1);
    f.put("b", 2);
    REQUIRE(f.tier.erase("a"));
    REQUIRE_FALSE(f.tier.erase("a"));
    f.tier.clear();
    REQUIRE(f.tier.size() == 0);
}

// ── SharedTier ──────────────────────────────────────────────────

struct SharedTierFixture {
    ManualClock clock;
    FlakyStore store{clock};
    SharedTier tier{store, "cache:", 86400, clock};
};

TEST_CASE("SharedTier: stores prefixed JSON records with the tier ttl", "[cache]") {
    SharedTierFixture f;
    f.tier.store(CacheEntry{"p1", {{"bio", "x"}}, f.clock.now()});

    auto raw = f.store.get("cache:p1");
    REQUIRE(raw.has_value());
    auto j = nlohmann::json::parse(*raw);
    REQUIRE(j["key"] == "p1");
    REQUIRE(j["value"]["bio"] == "x");

    f.clock.advance(86400);
    REQUIRE_FALSE(f.store.get("cache:p1").has_value());
}

TEST_CASE("SharedTier: lookup checks the record timestamp", "[cache]") {
    SharedTierFixture f;
    // Written long ago by another process, store expiry not yet reached.
    CacheEntry old{"p1", 1, f.clock.now() - 90000};
    f.store.set("cache:p1", entry_to_json(old).dump(), 0);
    REQUIRE_FALSE(f.tier.lookup("p1").has_value());
}

TEST_CASE("SharedTier: malformed record is discarded", "[cache]") {
    SharedTierFixture f;
    f.store.set("cache:p1", "not json", 0);
    REQUIRE_FALSE(f.tier.lookup("p1").has_value());
    REQUIRE_FALSE(f.store.get("cache:p1").has_value());
}

TEST_CASE("SharedTier: record for a different key is discarded", "[cache]") {
    SharedTierFixture f;
    CacheEntry other{"p2", 1, f.clock.now()};
    f.store.set("cache:p1", entry_to_json(other).dump(), 0);
    REQUIRE_FALSE(f.tier.lookup("p1").has_value());
}

TEST_CASE("SharedTier: store errors propagate to the caller", "[cache]") {
    SharedTierFixture f;
    f.store.reachable = false;
    REQUIRE_THROWS_AS(f.tier.lookup("p1"), StoreUnavailable);
    REQUIRE_THROWS_AS(f.tier.store(CacheEntry{"p1", 1, f.clock.now()}), StoreUnavailable);
}
