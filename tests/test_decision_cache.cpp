#include <catch2/catch_test_macros.hpp>
#include "cache/decision_cache.hpp"
#include "policy_fixtures.hpp"

using namespace rlsengine;
using namespace rlsengine::testing;
using namespace std::chrono_literals;

using Clock = DecisionCache::Clock;

static CombinedFilter make_filter(const std::string& clause) {
    CombinedFilter f;
    f.has_filters = true;
    f.where_clause = clause;
    f.policies_applied = {"p1"};
    return f;
}

TEST_CASE("DecisionCache: put then get within TTL", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 100, .num_shards = 4});
    const auto t0 = Clock::now();

    CHECK_FALSE(cache.get("k", 1, 60s, t0).has_value());

    cache.put("k", 1, make_filter("a = 1"), t0);
    auto hit = cache.get("k", 1, 60s, t0 + 59s);
    REQUIRE(hit.has_value());
    CHECK(*hit == make_filter("a = 1"));

    auto stats = cache.get_stats();
    CHECK(stats.hits == 1);
    CHECK(stats.misses == 1);
    CHECK(stats.current_entries == 1);
}

TEST_CASE("DecisionCache: never served at or past TTL", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 100, .num_shards = 1});
    const auto t0 = Clock::now();
    cache.put("k", 1, make_filter("a = 1"), t0);

    CHECK_FALSE(cache.get("k", 1, 60s, t0 + 60s).has_value());

    // Lazily removed on the failed lookup
    auto stats = cache.get_stats();
    CHECK(stats.expirations == 1);
    CHECK(stats.current_entries == 0);
}

TEST_CASE("DecisionCache: a generation bump makes entries stale", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 100, .num_shards = 1});
    const auto t0 = Clock::now();
    cache.put("k", 1, make_filter("a = 1"), t0);

    CHECK_FALSE(cache.get("k", 2, 300s, t0 + 1s).has_value());
}

TEST_CASE("DecisionCache: zero TTL disables caching", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 100, .num_shards = 1});
    const auto t0 = Clock::now();
    cache.put("k", 1, make_filter("a = 1"), t0);

    CHECK_FALSE(cache.get("k", 1, 0s, t0).has_value());
}

TEST_CASE("DecisionCache: sweep removes stale entries", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 100, .num_shards = 2});
    const auto t0 = Clock::now();
    cache.put("old_gen", 1, make_filter("a = 1"), t0);
    cache.put("expired", 2, make_filter("b = 1"), t0 - 120s);
    cache.put("fresh", 2, make_filter("c = 1"), t0);

    CHECK(cache.sweep(2, 60s, t0 + 1s) == 2);
    CHECK(cache.get_stats().current_entries == 1);
    CHECK(cache.get("fresh", 2, 60s, t0 + 1s).has_value());
}

TEST_CASE("DecisionCache: LRU eviction per shard", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 2, .num_shards = 1});
    const auto t0 = Clock::now();
    cache.put("a", 1, make_filter("a = 1"), t0);
    cache.put("b", 1, make_filter("b = 1"), t0);

    // Touch "a" so "b" is least recently used
    CHECK(cache.get("a", 1, 60s, t0).has_value());
    cache.put("c", 1, make_filter("c = 1"), t0);

    CHECK(cache.get_stats().evictions == 1);
    CHECK(cache.get("a", 1, 60s, t0).has_value());
    CHECK_FALSE(cache.get("b", 1, 60s, t0).has_value());
    CHECK(cache.get("c", 1, 60s, t0).has_value());
}

TEST_CASE("DecisionCache: clear empties every shard", "[cache]") {
    DecisionCache cache(DecisionCache::Config{.max_entries = 100, .num_shards = 4});
    for (int i = 0; i < 10; ++i) {
        cache.put("k" + std::to_string(i), 1, make_filter("a = 1"));
    }
    CHECK(cache.get_stats().current_entries == 10);
    cache.clear();
    CHECK(cache.get_stats().current_entries == 0);
}

TEST_CASE("DecisionCache: key covers table, roles, generation and identity", "[cache][key]") {
    const auto alice = make_user("alice", {"analyst", "admin"}, {{"department", "sales"}});
    const auto key = DecisionCache::make_key(kOrders, alice, 7);

    SECTION("stable for the same input") {
        auto same_roles = make_user("alice", {"admin", "analyst"}, {{"department", "sales"}});
        CHECK(DecisionCache::make_key(kOrders, same_roles, 7) == key);
    }

    SECTION("table") {
        CHECK(DecisionCache::make_key(TableIdentity("main", "public", "customers"), alice, 7) != key);
        CHECK(DecisionCache::make_key(TableIdentity("other", "public", "orders"), alice, 7) != key);
    }

    SECTION("roles") {
        auto fewer = make_user("alice", {"analyst"}, {{"department", "sales"}});
        CHECK(DecisionCache::make_key(kOrders, fewer, 7) != key);
    }

    SECTION("generation") {
        CHECK(DecisionCache::make_key(kOrders, alice, 8) != key);
    }

    SECTION("attributes") {
        auto moved = make_user("alice", {"analyst", "admin"}, {{"department", "ops"}});
        CHECK(DecisionCache::make_key(kOrders, moved, 7) != key);
    }

    SECTION("user id") {
        auto other = make_user("bob", {"analyst", "admin"}, {{"department", "sales"}});
        CHECK(DecisionCache::make_key(kOrders, other, 7) != key);
    }
}

TEST_CASE("DecisionCache: key fields cannot bleed into each other", "[cache][key]") {
    const auto user = make_user("alice", {"analyst"});

    SECTION("separator inside connection or schema") {
        CHECK(DecisionCache::make_key(TableIdentity("warehouse|public", "orders", "t"), user, 1) !=
              DecisionCache::make_key(TableIdentity("warehouse", "public|orders", "t"), user, 1));
        CHECK(DecisionCache::make_key(TableIdentity("a", "b.c", "d"), user, 1) !=
              DecisionCache::make_key(TableIdentity("a", "b", "c.d"), user, 1));
    }

    SECTION("role ids containing a comma") {
        CHECK(DecisionCache::make_key(kOrders, make_user("alice", {"a,b"}), 1) !=
              DecisionCache::make_key(kOrders, make_user("alice", {"a", "b"}), 1));
    }

    SECTION("user id against username") {
        auto a = make_user("x");
        a.username = "yz";
        auto b = make_user("xy");
        b.username = "z";
        CHECK(DecisionCache::make_key(kOrders, a, 1) != DecisionCache::make_key(kOrders, b, 1));
    }

    SECTION("absent email against empty email") {
        auto with_empty = user;
        with_empty.email = "";
        CHECK(DecisionCache::make_key(kOrders, user, 1) != DecisionCache::make_key(kOrders, with_empty, 1));
    }

    SECTION("attribute value types") {
        CHECK(DecisionCache::make_key(kOrders, make_user("alice", {}, {{"level", 1}}), 1) !=
              DecisionCache::make_key(kOrders, make_user("alice", {}, {{"level", "1"}}), 1));
        CHECK(DecisionCache::make_key(kOrders, make_user("alice", {}, {{"region", AttributeValue::array({"US", "EU"})}}), 1) !=
              DecisionCache::make_key(kOrders, make_user("alice", {}, {{"region", AttributeValue::array({"US,EU"})}}), 1));
    }

    SECTION("attribute order does not matter") {
        auto forward = make_user("alice", {}, {{"a", 1}, {"b", 2}});
        auto reverse = make_user("alice", {}, {{"b", 2}, {"a", 1}});
        CHECK(DecisionCache::make_key(kOrders, forward, 1) == DecisionCache::make_key(kOrders, reverse, 1));
    }

    SECTION("bytes that are not valid UTF-8") {
        auto latin1 = make_user("alice", {}, {{"department", std::string("M\xfc" "ller")}});
        auto other = make_user("alice", {}, {{"department", std::string("M\xfd" "ller")}});
        std::string key;
        REQUIRE_NOTHROW(key = DecisionCache::make_key(kOrders, latin1, 1));
        CHECK(DecisionCache::make_key(kOrders, other, 1) != key);
    }
}
