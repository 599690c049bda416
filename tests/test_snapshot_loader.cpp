#include <catch2/catch_test_macros.hpp>
#include "engine/snapshot_loader.hpp"
#include "mocks/mock_policy_store.hpp"
#include "policy_fixtures.hpp"

#include <memory>

using namespace rlsengine;
using namespace rlsengine::testing;
using namespace std::chrono_literals;

static RefreshConfig fast_refresh() {
    RefreshConfig cfg;
    cfg.interval = 1s;
    cfg.max_staleness = 300s;
    cfg.max_retries = 3;
    cfg.initial_backoff_ms = 1;
    cfg.max_backoff_ms = 4;
    return cfg;
}

TEST_CASE("SnapshotLoader: publishes a consistent snapshot", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    REQUIRE(store->inner().create_role(make_role("analyst")).is_ok());
    REQUIRE(store->inner().create_policy(region_policy("us", "US", {"analyst"})).is_ok());

    SnapshotLoader loader(store, fast_refresh());
    CHECK(loader.current() == nullptr);

    REQUIRE(loader.refresh().is_ok());
    auto snap = loader.current();
    REQUIRE(snap != nullptr);
    CHECK(snap->generation == store->generation());
    CHECK(snap->roles.size() == 1);
    CHECK(snap->policies.size() == 1);
    CHECK(loader.last_refresh_ok());
}

TEST_CASE("SnapshotLoader: store mutations refresh immediately", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    SnapshotLoader loader(store, fast_refresh());
    REQUIRE(loader.refresh().is_ok());
    const auto before = loader.latest();

    REQUIRE(store->create_policy(region_policy("us", "US")).is_ok());

    auto after = loader.latest();
    REQUIRE(after != nullptr);
    CHECK(after->generation == store->generation());
    CHECK(after->policies.size() == 1);

    // Readers holding the old snapshot keep a stable view
    CHECK(before->policies.empty());
}

TEST_CASE("SnapshotLoader: transient failures are retried", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    store->fail_next(2);

    SnapshotLoader loader(store, fast_refresh());
    REQUIRE(loader.refresh().is_ok());
    CHECK(loader.get_stats().retries == 2);
    CHECK(loader.get_stats().failures == 0);
}

TEST_CASE("SnapshotLoader: unreachable store", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    store->set_available(false);

    SnapshotLoader loader(store, fast_refresh());
    auto result = loader.refresh();
    CHECK(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STORE_UNAVAILABLE);
    CHECK(loader.current() == nullptr);

    // One initial attempt plus max_retries
    CHECK(store->read_count() == 4);
    CHECK(loader.get_stats().failures == 1);
}

TEST_CASE("SnapshotLoader: bounded staleness after a failed refresh", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    SnapshotLoader loader(store, fast_refresh());
    REQUIRE(loader.refresh().is_ok());
    const auto snap = loader.latest();

    store->set_available(false);
    CHECK(loader.refresh().is_error());
    CHECK_FALSE(loader.last_refresh_ok());

    SECTION("last good snapshot is served within the window") {
        CHECK(loader.current(snap->loaded_at + 299s) == snap);
    }

    SECTION("past the window nothing is served") {
        CHECK(loader.current(snap->loaded_at + 301s) == nullptr);
        CHECK(loader.latest() == snap);
    }

    SECTION("recovery restores service") {
        store->set_available(true);
        REQUIRE(loader.refresh().is_ok());
        CHECK(loader.current(std::chrono::steady_clock::now() + 3600s) != nullptr);
    }
}

TEST_CASE("SnapshotLoader: a write during load is not mixed into the snapshot", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    store->set_notifications(false);
    store->set_mid_load_hook([&store] {
        (void)store->inner().create_role(make_role("late"));
    });

    SnapshotLoader loader(store, fast_refresh());
    REQUIRE(loader.refresh().is_ok());

    // First attempt saw the generation move and was retried
    CHECK(loader.get_stats().retries == 1);
    auto snap = loader.current();
    REQUIRE(snap != nullptr);
    CHECK(snap->generation == store->generation());
    CHECK(snap->roles.size() == 1);
}

TEST_CASE("SnapshotLoader: store outlives the loader", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    {
        SnapshotLoader loader(store, fast_refresh());
        REQUIRE(loader.refresh().is_ok());
    }
    // The subscription must not reach the destroyed loader
    CHECK(store->create_role(make_role("after")).is_ok());
}

TEST_CASE("SnapshotLoader: start and stop the refresher", "[loader]") {
    auto store = std::make_shared<MockPolicyStore>();
    SnapshotLoader loader(store, fast_refresh());
    REQUIRE(loader.refresh().is_ok());

    loader.start();
    CHECK(loader.is_running());
    loader.start();
    loader.stop();
    CHECK_FALSE(loader.is_running());
    loader.stop();
}
