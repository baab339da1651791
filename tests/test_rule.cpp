#include <catch2/catch_test_macros.hpp>
#include "warden/rule.hpp"

using namespace warden;

namespace
{
    Rule valid_rule(const std::string &id = "r1")
    {
        Rule r;
        r.id = id;
        r.event_types = {EventType::LoginFailure};
        r.conditions.threshold = 3;
        r.actions = {ActionKind::Alert};
        return r;
    }
}

TEST_CASE("Rule invariants are enforced", "[rule]")
{
    SECTION("valid rule gets its id as name")
    {
        auto r = valid_rule();
        REQUIRE(r.prepare());
        REQUIRE(r.name == "r1");
    }

    SECTION("threshold below one")
    {
        auto r = valid_rule();
        r.conditions.threshold = 0;
        auto res = r.prepare();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().code == ErrorCode::ConfigurationError);
    }

    SECTION("non-positive window")
    {
        auto r = valid_rule();
        r.conditions.time_window = Duration::zero();
        REQUIRE_FALSE(r.prepare());
    }

    SECTION("window longer than a year")
    {
        auto r = valid_rule();
        r.conditions.time_window = RuleConditions::kMaxTimeWindow + std::chrono::hours(1);
        REQUIRE_FALSE(r.prepare());
        r.conditions.time_window = RuleConditions::kMaxTimeWindow;
        REQUIRE(r.prepare());
    }

    SECTION("no event types")
    {
        auto r = valid_rule();
        r.event_types.clear();
        REQUIRE_FALSE(r.prepare());
    }

    SECTION("empty id")
    {
        auto r = valid_rule("");
        REQUIRE_FALSE(r.prepare());
    }

    SECTION("pattern must compile")
    {
        auto r = valid_rule();
        r.conditions.pattern = "(unclosed";
        REQUIRE_FALSE(r.prepare());
    }
}

TEST_CASE("Patterns match case-insensitively", "[rule]")
{
    auto r = valid_rule();
    r.conditions.pattern = "union|select";
    REQUIRE(r.prepare());
    REQUIRE(r.pattern_matches("/q?x=1 UNION all"));
    REQUIRE_FALSE(r.pattern_matches("/healthz"));

    auto open = valid_rule();
    REQUIRE(open.prepare());
    REQUIRE(open.pattern_matches("anything"));
}

TEST_CASE("Rule from JSON", "[rule]")
{
    auto r = Rule::from_json({{"id", "burst"},
                              {"name", "Burst"},
                              {"event_types", {"login_failure", "invalid_api_key"}},
                              {"time_window_minutes", 10},
                              {"threshold", 4},
                              {"severity", "high"},
                              {"actions", {"alert", "block_ip", "page_oncall"}}});
    REQUIRE(r);
    REQUIRE(r->event_types.size() == 2);
    REQUIRE(r->conditions.time_window == std::chrono::minutes(10));
    REQUIRE(r->conditions.threshold == 4);
    REQUIRE(r->severity == Severity::High);
    REQUIRE(r->actions == std::vector<ActionKind>{ActionKind::Alert, ActionKind::BlockActor, ActionKind::Log});

    SECTION("seconds take precedence and round-trip through to_json")
    {
        auto s = Rule::from_json({{"id", "s"}, {"event_types", {"xss_attempt"}}, {"time_window_seconds", 90}});
        REQUIRE(s);
        REQUIRE(s->conditions.time_window == std::chrono::seconds(90));
        REQUIRE(s->to_json()["time_window_seconds"] == 90);
        REQUIRE(s->severity == Severity::Medium);
    }

    SECTION("unknown severity maps to medium")
    {
        auto s = Rule::from_json({{"id", "s"}, {"event_types", {"xss_attempt"}}, {"severity", "apocalyptic"}});
        REQUIRE(s);
        REQUIRE(s->severity == Severity::Medium);
    }

    SECTION("unknown event type is rejected")
    {
        REQUIRE_FALSE(Rule::from_json({{"id", "s"}, {"event_types", {"teleport"}}}));
    }
}

TEST_CASE("Huge windows in JSON are rejected before conversion", "[rule]")
{
    for (const char *key : {"time_window_minutes", "time_window_seconds"})
    {
        nlohmann::json j{{"id", "wide"}, {"event_types", nlohmann::json::array({"login_failure"})}, {key, std::int64_t{1} << 60}};
        auto rule = Rule::from_json(j);
        REQUIRE_FALSE(rule);
        REQUIRE(rule.error().code == ErrorCode::ConfigurationError);

        j[key] = -(std::int64_t{1} << 60);
        REQUIRE_FALSE(Rule::from_json(j));
    }
}

TEST_CASE("RuleSet CRUD", "[rule]")
{
    RuleSet rules;
    REQUIRE(rules.add(valid_rule("a")));
    REQUIRE(rules.add(valid_rule("b")));

    auto dup = rules.add(valid_rule("a"));
    REQUIRE_FALSE(dup);
    REQUIRE(dup.error().code == ErrorCode::AlreadyExists);

    auto changed = valid_rule("b");
    changed.conditions.threshold = 9;
    REQUIRE(rules.update(changed));
    REQUIRE(rules.get("b")->conditions.threshold == 9);
    REQUIRE(rules.update(valid_rule("zzz")).error().code == ErrorCode::NotFound);

    REQUIRE(rules.set_enabled("a", false));
    REQUIRE_FALSE(rules.get("a")->applies_to(EventType::LoginFailure));

    REQUIRE(rules.remove("a"));
    REQUIRE_FALSE(rules.remove("a"));
    REQUIRE(rules.size() == 1);
    REQUIRE(rules.snapshot().front().id == "b");
}

TEST_CASE("Default rule pack", "[rule]")
{
    auto rules = default_rules();
    REQUIRE(rules.size() == 4);

    RuleSet set;
    for (auto &r : rules)
        REQUIRE(set.add(r));

    auto brute = set.get("brute_force_detection");
    REQUIRE(brute);
    REQUIRE(brute->conditions.threshold == 5);
    REQUIRE(brute->conditions.time_window == std::chrono::minutes(5));

    auto sql = set.get("sql_injection_detection");
    REQUIRE(sql);
    REQUIRE(sql->severity == Severity::Critical);
    REQUIRE(sql->pattern_matches("/x DROP table"));
}
