#include <catch2/catch_test_macros.hpp>
#include "policy/policy_tester.hpp"
#include "policy_fixtures.hpp"

using namespace rlsengine;
using namespace rlsengine::testing;

TEST_CASE("PolicyTester: single policy dry run", "[tester]") {
    const auto policy = region_policy("us", "US", {"us_team"});
    RlsConfiguration config;

    SECTION("user holding the role") {
        auto r = PolicyTester::test_policy(policy, make_user("u", {"us_team"}), config, kOrders);
        CHECK(r.policy_would_apply);
        CHECK(r.where_clause == "region = 'US'");
        CHECK_FALSE(r.access_denied);
        CHECK(r.decision.policies_applied == std::vector<std::string>{"us"});
    }

    SECTION("user without the role") {
        auto r = PolicyTester::test_policy(policy, make_user("u", {"eu_team"}), config, kOrders);
        CHECK_FALSE(r.policy_would_apply);
        CHECK_FALSE(r.where_clause.has_value());
        CHECK_FALSE(r.access_denied);
    }

    SECTION("user without the role under defaultDeny") {
        config.default_deny = true;
        auto r = PolicyTester::test_policy(policy, make_user("u"), config, kOrders);
        CHECK_FALSE(r.policy_would_apply);
        CHECK(r.access_denied);
        CHECK(r.denial_reason == "no_matching_policy");
    }

    SECTION("other table") {
        auto r = PolicyTester::test_policy(policy, make_user("u", {"us_team"}), config,
                                           TableIdentity("main", "public", "customers"));
        CHECK_FALSE(r.policy_would_apply);
    }

    SECTION("RLS disabled") {
        config.enabled = false;
        auto r = PolicyTester::test_policy(policy, make_user("u", {"us_team"}), config, kOrders);
        CHECK_FALSE(r.policy_would_apply);
        CHECK(r.decision == FilterDecision::unrestricted());
    }
}

TEST_CASE("PolicyTester: audit mode does not hide the enforcing decision", "[tester]") {
    RlsConfiguration config;
    config.audit_mode = true;
    config.default_deny = true;

    auto filtered = PolicyTester::test_policy(region_policy("us", "US"), make_user("u"), config, kOrders);
    CHECK(filtered.where_clause == "region = 'US'");

    auto denied = PolicyTester::evaluate({}, config, kOrders, make_user("u"));
    CHECK(denied.access_denied);
}

TEST_CASE("PolicyTester: simulate a proposed policy set", "[tester][simulate]") {
    RlsConfiguration config;
    config.default_deny = true;

    const std::vector<RlsPolicy> with_us = {region_policy("us", "US")};
    const std::vector<RlsPolicy> empty;

    const std::vector<EvaluationRequest> requests = {
        {kOrders, make_user("u1")},
        {kOrders, make_user("u2")},
        {TableIdentity("main", "public", "customers"), make_user("u3")},
    };

    SECTION("removing a policy denies its users") {
        auto r = PolicyTester::simulate(with_us, empty, config, requests);
        CHECK(r.total_requests == 3);
        CHECK(r.changed == 2);
        CHECK(r.newly_denied == 2);
        CHECK(r.newly_allowed == 0);
        CHECK(r.unchanged == 1);
        REQUIRE(r.diffs.size() == 2);
        CHECK(r.diffs[0].request_index == 0);
        CHECK(r.diffs[0].user_id == "u1");
        CHECK(r.diffs[0].baseline.where_clause == "region = 'US'");
        CHECK(r.diffs[0].proposed.denial_reason == "no_matching_policy");
    }

    SECTION("adding a policy allows them") {
        auto r = PolicyTester::simulate(empty, with_us, config, requests);
        CHECK(r.newly_allowed == 2);
        CHECK(r.newly_denied == 0);
    }

    SECTION("diffs are capped") {
        auto r = PolicyTester::simulate(with_us, empty, config, requests, 1);
        CHECK(r.changed == 2);
        CHECK(r.diffs.size() == 1);
    }

    SECTION("identical sets change nothing") {
        auto r = PolicyTester::simulate(with_us, with_us, config, requests);
        CHECK(r.changed == 0);
        CHECK(r.unchanged == 3);
        CHECK(r.diffs.empty());
    }
}
