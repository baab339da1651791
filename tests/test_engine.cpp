#include <catch2/catch_test_macros.hpp>
#include "warden/engine.hpp"
#include "support.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <set>
#include <thread>
#include <vector>

using namespace warden;
using namespace std::chrono_literals;

namespace
{
    struct Harness
    {
        boost::asio::io_context ioc;
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
        std::shared_ptr<testing::RecordingNotifier> notifier = std::make_shared<testing::RecordingNotifier>();
        std::shared_ptr<testing::RecordingObservability> observability = std::make_shared<testing::RecordingObservability>();
        std::unique_ptr<Engine> engine;

        explicit Harness(WardenConfig cfg = testing::test_config(),
                         std::shared_ptr<ObservabilitySink> sink = nullptr)
        {
            EngineDependencies deps;
            deps.clock = clock;
            deps.notifier = notifier;
            deps.observability = sink ? sink : observability;
            deps.dispatch_executor = ioc.get_executor();
            engine = Engine::create(cfg, std::move(deps)).value();
        }

        /** Run queued dispatch work to completion */
        void drain()
        {
            ioc.restart();
            ioc.run();
        }
    };

    Rule rule(const std::string &id, EventType type, int threshold, Duration window, std::vector<ActionKind> actions)
    {
        Rule r;
        r.id = id;
        r.name = id;
        r.event_types = {type};
        r.conditions.threshold = threshold;
        r.conditions.time_window = window;
        r.actions = std::move(actions);
        return r;
    }
}

TEST_CASE("Engine refuses to start without a salt", "[engine]")
{
    boost::asio::io_context ioc;
    WardenConfig cfg;
    EngineDependencies deps;
    deps.dispatch_executor = ioc.get_executor();

    auto engine = Engine::create(cfg, deps);
    REQUIRE_FALSE(engine);
    REQUIRE(engine.error().code == ErrorCode::ConfigurationError);
}

TEST_CASE("Engine loads the default rule pack", "[engine]")
{
    auto cfg = testing::test_config();
    cfg.use_default_rules = true;
    cfg.rules.push_back(rule("brute_force_detection", EventType::LoginFailure, 3, 2min, {ActionKind::Log}));
    Harness h(cfg);

    auto rules = h.engine->rules();
    REQUIRE(rules.size() == 4);
    REQUIRE(rules[0].id == "brute_force_detection");
    REQUIRE(rules[0].conditions.threshold == 3);
}

TEST_CASE("Scenario: five failed logins within four minutes", "[engine][scenario]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("brute", EventType::LoginFailure, 5, 5min, {ActionKind::Alert, ActionKind::BlockActor})));

    const std::string address = "203.0.113.50";
    for (int i = 0; i < 5; ++i)
    {
        REQUIRE(h.engine->record_event(testing::occurrence("login_failure", address)));
        if (i < 4)
            h.clock->advance(1min);
    }
    h.drain();

    auto incidents = h.engine->list_incidents();
    REQUIRE(incidents.size() == 1);
    REQUIRE(incidents[0].rule_id == "brute");
    REQUIRE(incidents[0].actor_hash == h.engine->hash_network(address));
    REQUIRE(incidents[0].status == IncidentStatus::Open);

    REQUIRE(h.engine->is_blocked_address(address));
    REQUIRE_FALSE(h.engine->is_blocked_address("203.0.113.51"));
    REQUIRE(h.notifier->sent().size() == 1);

    auto outcomes = h.engine->action_outcomes();
    REQUIRE(outcomes.size() == 2);
    REQUIRE(outcomes[0].action == ActionKind::Alert);
    REQUIRE(outcomes[1].action == ActionKind::BlockActor);

    SECTION("further failures merge into the same incident")
    {
        h.clock->advance(30s);
        REQUIRE(h.engine->record_event(testing::occurrence("login_failure", address)));
        h.drain();
        auto merged = h.engine->list_incidents();
        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].events.size() == 2);
    }
}

TEST_CASE("Scenario: a late fifth event does not trigger", "[engine][scenario]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("brute", EventType::LoginFailure, 5, 5min, {ActionKind::Alert, ActionKind::BlockActor})));

    for (int i = 0; i < 4; ++i)
    {
        REQUIRE(h.engine->record_event(testing::occurrence("login_failure")));
        h.clock->advance(30s);
    }
    h.clock->advance(6min);
    REQUIRE(h.engine->record_event(testing::occurrence("login_failure")));
    h.drain();

    REQUIRE(h.engine->list_incidents().empty());
    REQUIRE(h.engine->action_outcomes().empty());
    REQUIRE(h.notifier->sent().empty());
}

TEST_CASE("Scenario: two rules on one event open two incidents", "[engine][scenario]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("export-watch", EventType::DataExport, 1, 1min, {ActionKind::Log})));
    REQUIRE(h.engine->add_rule(rule("export-alert", EventType::DataExport, 1, 10min, {ActionKind::Alert})));

    REQUIRE(h.engine->record_event(testing::occurrence("data_export")));
    h.drain();

    auto incidents = h.engine->list_incidents();
    REQUIRE(incidents.size() == 2);
    REQUIRE(incidents[0].rule_id != incidents[1].rule_id);
    REQUIRE(h.engine->action_outcomes().size() == 2);
}

TEST_CASE("Scenario: a resolved incident stays resolved", "[engine][scenario]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("sqli", EventType::SqlInjection, 1, 1min, {ActionKind::Log})));
    REQUIRE(h.engine->record_event(testing::occurrence("sql_injection")));

    auto id = h.engine->list_incidents().at(0).id;
    Resolution resolution;
    resolution.summary = "WAF rule deployed";
    REQUIRE(h.engine->set_status(id, IncidentStatus::Resolved, "analyst", "", resolution));

    auto res = h.engine->set_status(id, IncidentStatus::Investigating, "analyst", "reopen");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().code == ErrorCode::TransitionError);
    REQUIRE(h.engine->get_incident(id)->status == IncidentStatus::Resolved);
}

TEST_CASE("Rejected events leave no trace", "[engine]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("any", EventType::LoginFailure, 1, 1min, {ActionKind::Log})));

    auto res = h.engine->record_event(testing::occurrence("warp_drive"));
    REQUIRE_FALSE(res);
    REQUIRE(res.error().code == ErrorCode::ValidationError);
    REQUIRE(h.engine->list_recent_events().empty());
    REQUIRE(h.engine->metrics_summary()["tracked_actors"] == 0);
}

TEST_CASE("Recording updates the ledger and emits metrics", "[engine]")
{
    Harness h;
    auto id = h.engine->record_event(testing::occurrence("brute_force"));
    REQUIRE(id);

    auto event = h.engine->find_event(*id);
    REQUIRE(event);
    REQUIRE(h.engine->risk_of(event->actor.network_hash) == 7.0);
    REQUIRE(h.observability->has_metric("security.event.recorded"));

    auto recent = h.engine->list_recent_events();
    REQUIRE(recent.size() == 1);
    REQUIRE(recent[0].id == *id);

    auto metrics = h.engine->metrics_summary();
    REQUIRE(metrics["total_events"] == 1);
    REQUIRE(metrics["events_by_severity"]["high"] == 1);
}

TEST_CASE("Threat indicators raise later risk scores", "[engine]")
{
    Harness h;
    auto indicator = h.engine->add_threat_indicator("192.0.2.200", "feed", Severity::High, {"botnet"});
    REQUIRE(indicator.network_hash == h.engine->hash_network("192.0.2.200"));

    auto known = h.engine->threat_indicators();
    REQUIRE(known.size() == 1);
    REQUIRE(known[0].source == "feed");
    REQUIRE(known[0].tags.contains("botnet"));

    auto id = h.engine->record_event(testing::occurrence("login_failure", "192.0.2.200")).value();
    auto event = h.engine->find_event(id).value();
    REQUIRE(event.detection.risk_score == 40.0);
    REQUIRE(event.detection.indicators.contains("known-threat-actor"));
}

TEST_CASE("Operator mutations are audited", "[engine]")
{
    Harness h;
    REQUIRE_FALSE(h.engine->audit_head());

    REQUIRE(h.engine->add_rule(rule("r", EventType::Logout, 1, 1min, {ActionKind::Log}), "ops"));
    auto after_add = h.engine->audit_head();
    REQUIRE(after_add);

    REQUIRE(h.engine->set_rule_enabled("r", false, "ops"));
    REQUIRE(h.engine->audit_head() != after_add);
    REQUIRE_FALSE(h.engine->remove_rule("missing", "ops"));

    auto records = h.engine->audit_chain().records();
    REQUIRE(records.size() == 3);
    REQUIRE(records[0].action == "rule_added");
    REQUIRE(records[1].action == "rule_disabled");
    REQUIRE(records[2].result != "ok");
    REQUIRE(h.engine->audit_chain().verify());
}

TEST_CASE("Acknowledge through the engine", "[engine]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("r", EventType::PrivilegeEscalation, 1, 1min, {ActionKind::Escalate})));
    REQUIRE(h.engine->record_event(testing::occurrence("privilege_escalation")));
    h.drain();

    auto id = h.engine->list_incidents(IncidentStatus::Open).at(0).id;
    auto acked = h.engine->acknowledge(id, "frank");
    REQUIRE(acked);
    REQUIRE(acked->assignee == "frank");
    REQUIRE(h.engine->list_incidents(IncidentStatus::Open).empty());
    REQUIRE(h.engine->list_incidents(IncidentStatus::Investigating).size() == 1);
}

TEST_CASE("A throwing metrics sink does not stop detection", "[engine]")
{
    Harness h(testing::test_config(), std::make_shared<testing::BrokenMetrics>());
    REQUIRE(h.engine->add_rule(rule("sqli", EventType::SqlInjection, 1, 1min, {ActionKind::BlockActor})));

    auto id = h.engine->record_event(testing::occurrence("sql_injection", "192.0.2.91"));
    REQUIRE(id);
    h.drain();

    REQUIRE(h.engine->list_recent_events().size() == 1);
    auto incidents = h.engine->list_incidents();
    REQUIRE(incidents.size() == 1);
    REQUIRE(incidents[0].events == std::vector<std::string>{*id});
    REQUIRE(h.engine->is_blocked_address("192.0.2.91"));
}

TEST_CASE("Concurrent arrivals for one actor share one incident", "[engine]")
{
    Harness h;
    REQUIRE(h.engine->add_rule(rule("fail", EventType::LoginFailure, 1, 5min, {ActionKind::Log})));

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&]
                             {
            for (int i = 0; i < kPerThread; ++i)
            {
                if (!h.engine->record_event(testing::occurrence("login_failure", "198.51.100.200")))
                    ++rejected;
            } });
    }
    for (auto &t : threads)
        t.join();
    h.drain();

    REQUIRE(rejected.load() == 0);

    auto incidents = h.engine->list_incidents();
    REQUIRE(incidents.size() == 1);
    REQUIRE(incidents[0].events.size() == kThreads * kPerThread);

    std::set<std::string> incident_events(incidents[0].events.begin(), incidents[0].events.end());
    REQUIRE(incident_events.size() == kThreads * kPerThread);

    auto outcomes = h.engine->action_outcomes();
    REQUIRE(outcomes.size() == kThreads * kPerThread);
    std::set<std::string> dispatched;
    for (const auto &outcome : outcomes)
        dispatched.insert(outcome.event_id);
    REQUIRE(dispatched == incident_events);
    REQUIRE(h.engine->pending_dispatches() == 0);
}
