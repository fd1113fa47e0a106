#include <catch2/catch_test_macros.hpp>
#include "mock_clock.hpp"
#include "limiter/token_bucket.hpp"
#include <stdexcept>
#include <thread>
#include <atomic>
#include <vector>

using namespace tollgate;

// ── refill / refill_and_consume ─────────────────────────────────

TEST_CASE("refill: adds elapsed * rate capped at capacity", "[token_bucket]") {
    BucketSpec spec{10, 2.0, 0};
    BucketState state{4, 100.0};

    refill(state, spec, 101.5);
    REQUIRE(state.tokens == 7.0);
    REQUIRE(state.last_refill == 101.5);

    refill(state, spec, 200.0);
    REQUIRE(state.tokens == 10.0);
}

TEST_CASE("refill: clock going backwards adds nothing and keeps last_refill", "[token_bucket]") {
    BucketSpec spec{10, 1.0, 0};
    BucketState state{5, 100.0};

    refill(state, spec, 90.0);
    REQUIRE(state.tokens == 5.0);
    REQUIRE(state.last_refill == 100.0);
}

TEST_CASE("refill: out-of-range stored state is clamped", "[token_bucket]") {
    BucketSpec spec{10, 1.0, 0};
    BucketState over{25, 100.0};
    refill(over, spec, 100.0);
    REQUIRE(over.tokens == 10.0);

    BucketState under{-3, 100.0};
    refill(under, spec, 100.0);
    REQUIRE(under.tokens == 0.0);
}

TEST_CASE("refill_and_consume: grant subtracts n after refill", "[token_bucket]") {
    BucketSpec spec{10, 1.0, 0};
    BucketState state{3, 100.0};

    REQUIRE(refill_and_consume(state, spec, 1, 102.0));
    REQUIRE(state.tokens == 4.0);  // 3 + 2 refill - 1
}

TEST_CASE("refill_and_consume: denial leaves tokens as refilled", "[token_bucket]") {
    BucketSpec spec{10, 0.25, 0};
    BucketState state{0, 100.0};

    REQUIRE_FALSE(refill_and_consume(state, spec, 1, 102.0));
    REQUIRE(state.tokens == 0.5);
    REQUIRE(state.last_refill == 102.0);
}

TEST_CASE("projected_tokens: does not mutate", "[token_bucket]") {
    BucketSpec spec{10, 1.0, 0};
    BucketState state{2, 100.0};
    REQUIRE(projected_tokens(state, spec, 103.0) == 5.0);
    REQUIRE(state.tokens == 2.0);
    REQUIRE(state.last_refill == 100.0);
}

// ── TokenBucket ─────────────────────────────────────────────────

TEST_CASE("TokenBucket: starts full", "[token_bucket]") {
    ManualClock clock;
    TokenBucket bucket(5, 1.0, clock);
    REQUIRE(bucket.available_tokens() == 5.0);
}

TEST_CASE("TokenBucket: rejects non-positive parameters", "[token_bucket]") {
    ManualClock clock;
    REQUIRE_THROWS_AS(TokenBucket(0, 1.0, clock), std::invalid_argument);
    REQUIRE_THROWS_AS(TokenBucket(5, 0.0, clock), std::invalid_argument);
    REQUIRE_THROWS_AS(TokenBucket(5, -1.0, clock), std::invalid_argument);
}

TEST_CASE("TokenBucket: capacity + 1 calls without elapsed time grant exactly capacity", "[token_bucket]") {
    ManualClock clock;
    TokenBucket bucket(50, 5000.0 / 3600.0, clock);

    int granted = 0;
    int denied = 0;
    for (int i = 0; i < 51; ++i) {
        if (bucket.consume()) granted++; else denied++;
    }
    REQUIRE(granted == 50);
    REQUIRE(denied == 1);
}

TEST_CASE("TokenBucket: tokens stay within bounds for any call sequence", "[token_bucket]") {
    ManualClock clock;
    TokenBucket bucket(4, 0.7, clock);

    const double steps[] = {0, 0.3, 5, 0, 0, 0, 0, 0.1, 100, 0, 2.5, 0};
    for (double dt : steps) {
        clock.advance(dt);
        bucket.consume(1.0);
        auto s = bucket.snapshot();
        REQUIRE(s.tokens >= 0.0);
        REQUIRE(s.tokens <= 4.0);
    }
}

TEST_CASE("TokenBucket: refills at the configured rate", "[token_bucket]") {
    ManualClock clock;
    TokenBucket bucket(2, 0.5, clock);
    REQUIRE(bucket.consume());
    REQUIRE(bucket.consume());
    REQUIRE_FALSE(bucket.consume());

    clock.advance(2.0);
    REQUIRE(bucket.consume());
    REQUIRE_FALSE(bucket.consume());
}

TEST_CASE("TokenBucket: concurrent consumers never overdraw", "[token_bucket]") {
    ManualClock clock;  // time frozen: no refill during the race
    TokenBucket bucket(100, 1.0, clock);
    std::atomic<int> granted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                if (bucket.consume()) granted++;
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(granted.load() == 100);
    REQUIRE(bucket.snapshot().tokens == 0.0);
}
