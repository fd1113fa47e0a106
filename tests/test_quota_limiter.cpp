#include <catch2/catch_test_macros.hpp>
#include "mock_clock.hpp"
#include "mock_store.hpp"
#include "limiter/quota_limiter.hpp"
#include "event_bus.hpp"
#include <stdexcept>

using namespace tollgate;

static QuotaConfig small_quota(uint32_t requests = 10, uint32_t period = 10) {
    QuotaConfig q;
    q.requests = requests;
    q.period = period;
    q.low_water = 5;
    q.max_wait = 30;
    return q;
}

// ── Local variant ───────────────────────────────────────────────

TEST_CASE("QuotaLimiter: local acquire until exhausted then QuotaExceeded", "[quota]") {
    ManualClock clock;
    QuotaLimiter limiter(small_quota(3, 3600), nullptr, clock);

    REQUIRE_FALSE(limiter.coordinated());
    limiter.acquire("/users/octocat");
    limiter.acquire("/users/octocat");
    limiter.acquire("/users/octocat");

    try {
        limiter.acquire("/users/octocat/repos");
        FAIL("expected QuotaExceeded");
    } catch (const QuotaExceeded& e) {
        REQUIRE(e.endpoint() == "/users/octocat/repos");
        REQUIRE(e.remaining() == 0);
    }
}

TEST_CASE("QuotaLimiter: capacity + 1 calls yield exactly capacity grants", "[quota]") {
    ManualClock clock;
    QuotaLimiter limiter(small_quota(100, 3600), nullptr, clock);

    int granted = 0;
    for (int i = 0; i < 101; ++i) {
        if (limiter.try_acquire("/x")) granted++;
    }
    REQUIRE(granted == 100);
}

TEST_CASE("QuotaLimiter: zero quota is rejected", "[quota]") {
    ManualClock clock;
    REQUIRE_THROWS_AS(QuotaLimiter(small_quota(0, 60), nullptr, clock), std::invalid_argument);
    REQUIRE_THROWS_AS(QuotaLimiter(small_quota(10, 0), nullptr, clock), std::invalid_argument);
}

TEST_CASE("QuotaLimiter: remaining_estimate floors the token count", "[quota]") {
    ManualClock clock;
    QuotaLimiter limiter(small_quota(10, 10), nullptr, clock);  // 1 token/s

    REQUIRE(limiter.remaining_estimate() == 10);
    for (int i = 0; i < 4; ++i) limiter.acquire("/x");
    REQUIRE(limiter.remaining_estimate() == 6);

    clock.advance(1.5);
    REQUIRE(limiter.remaining_estimate() == 7);
}

TEST_CASE("QuotaLimiter: denial publishes QuotaDenied", "[quota]") {
    ManualClock clock;
    EventBus bus;
    QuotaLimiter limiter(small_quota(1, 3600), nullptr, clock, &bus);

    std::string endpoint;
    subscribe<QuotaDeniedEvent>(bus, [&](const QuotaDeniedEvent& ev) { endpoint = ev.endpoint; });

    REQUIRE(limiter.try_acquire("/a"));
    REQUIRE_FALSE(limiter.try_acquire("/b"));
    REQUIRE(endpoint == "/b");
}

// ── wait_if_needed ──────────────────────────────────────────────

TEST_CASE("QuotaLimiter: no wait above the low-water mark", "[quota]") {
    ManualClock clock;
    QuotaLimiter limiter(small_quota(10, 10), nullptr, clock);

    REQUIRE(limiter.wait_if_needed() == 0.0);
    REQUIRE(clock.sleeps.empty());
}

TEST_CASE("QuotaLimiter: wait is shortfall divided by refill rate", "[quota]") {
    ManualClock clock;
    QuotaLimiter limiter(small_quota(10, 20), nullptr, clock);  // 0.5 token/s, low water 5

    for (int i = 0; i < 8; ++i) limiter.acquire("/x");  // 2 left
    double waited = limiter.wait_if_needed();

    REQUIRE(waited == 6.0);  // (5 - 2) / 0.5
    REQUIRE(clock.sleeps.size() == 1);
    REQUIRE(clock.sleeps[0] == 6.0);
}

TEST_CASE("QuotaLimiter: wait is capped at max_wait", "[quota]") {
    ManualClock clock;
    QuotaConfig q;  // 5000/h, low water 100, cap 30s
    QuotaLimiter limiter(q, nullptr, clock);

    for (int i = 0; i < 4950; ++i) limiter.acquire("/x");  // 50 left
    // (100 - 50) / (5000/3600) = 36s, capped
    REQUIRE(limiter.wait_if_needed() == 30.0);
    REQUIRE(clock.sleeps.back() == 30.0);
}

// ── Coordinated variant ─────────────────────────────────────────

TEST_CASE("QuotaLimiter: coordinated limiters share one budget", "[quota]") {
    ManualClock clock;
    FlakyStore store(clock);
    QuotaLimiter a(small_quota(5, 3600), &store, clock);
    QuotaLimiter b(small_quota(5, 3600), &store, clock);

    REQUIRE(a.coordinated());
    int granted = 0;
    for (int i = 0; i < 4; ++i) {
        if (a.try_acquire("/a")) granted++;
        if (b.try_acquire("/b")) granted++;
    }
    REQUIRE(granted == 5);
    REQUIRE(a.remaining_estimate() == 0);
    REQUIRE(b.remaining_estimate() == 0);
    REQUIRE_FALSE(a.using_fallback());
}

TEST_CASE("QuotaLimiter: bucket state lives under the configured key", "[quota]") {
    ManualClock clock;
    FlakyStore store(clock);
    auto q = small_quota(5, 3600);
    q.bucket_key = "quota:test";
    QuotaLimiter limiter(q, &store, clock);

    limiter.acquire("/x");
    auto state = store.bucket_peek("quota:test");
    REQUIRE(state.has_value());
    REQUIRE(state->tokens == 4.0);
}

TEST_CASE("QuotaLimiter: store outage falls back to the local bucket", "[quota]") {
    ManualClock clock;
    FlakyStore store(clock);
    EventBus bus;
    QuotaLimiter limiter(small_quota(5, 3600), &store, clock, &bus);

    int fallbacks = 0;
    subscribe<LimiterFallbackEvent>(bus, [&](const LimiterFallbackEvent&) { fallbacks++; });

    store.reachable = false;
    REQUIRE(limiter.try_acquire("/x"));
    REQUIRE(limiter.try_acquire("/x"));
    REQUIRE(limiter.using_fallback());
    REQUIRE(fallbacks == 1);

    // Local bucket still enforces its own budget.
    int granted = 0;
    for (int i = 0; i < 10; ++i) {
        if (limiter.try_acquire("/x")) granted++;
    }
    REQUIRE(granted == 3);
}

TEST_CASE("QuotaLimiter: recovers the shared bucket once the store is back", "[quota]") {
    ManualClock clock;
    FlakyStore store(clock);
    QuotaLimiter limiter(small_quota(5, 3600), &store, clock);

    store.reachable = false;
    limiter.acquire("/x");
    REQUIRE(limiter.using_fallback());

    store.reachable = true;
    limiter.acquire("/x");
    REQUIRE_FALSE(limiter.using_fallback());
    REQUIRE(store.bucket_peek("quota:bucket")->tokens == 4.0);
}

TEST_CASE("QuotaLimiter: remaining_estimate falls back when the store is down", "[quota]") {
    ManualClock clock;
    FlakyStore store(clock);
    QuotaLimiter limiter(small_quota(5, 3600), &store, clock);

    store.reachable = false;
    REQUIRE(limiter.remaining_estimate() == 5);
    REQUIRE(limiter.using_fallback());
}
