#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "warden/housekeeping.hpp"
#include "support.hpp"

using namespace warden;
using namespace std::chrono_literals;
using Catch::Approx;
using testing::make_event;

namespace
{
    struct Fixture
    {
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
        EventLog events;
        IncidentCorrelator incidents{*clock};
        RiskLedger ledger;
        BlockList blocks;
        std::shared_ptr<testing::RecordingObservability> observability = std::make_shared<testing::RecordingObservability>();

        Housekeeper make(HousekeepingConfig cfg = {}, std::shared_ptr<ObservabilitySink> sink = nullptr)
        {
            return Housekeeper(cfg, {events, incidents, ledger, blocks},
                               sink ? sink : observability, clock);
        }

        Event record(const std::string &actor, EventType type, double risk = 10.0)
        {
            auto e = make_event(actor, type, clock->now());
            e.severity = type == EventType::SqlInjection ? Severity::Critical : Severity::Low;
            e.detection.risk_score = risk;
            events.append(e);
            return e;
        }
    };
}

TEST_CASE("Scheduled jobs run on their periods", "[housekeeping]")
{
    Fixture f;
    auto keeper = f.make();
    ManualScheduler scheduler(f.clock);
    keeper.start(scheduler);
    REQUIRE(scheduler.job_count() == 4);

    f.ledger.bump("actor", 100.0, f.clock->now());
    REQUIRE(scheduler.advance(30s) == 2); // decay + metrics
    REQUIRE(f.ledger.get("actor") == Approx(10.0 * 0.999));
    REQUIRE(f.observability->has_metric("security.active_incidents"));

    scheduler.advance(24h);
    REQUIRE(f.observability->reports.size() == 1);
}

TEST_CASE("A failing job does not stop the others", "[housekeeping]")
{
    Fixture f;
    auto keeper = f.make({}, std::make_shared<testing::BrokenMetrics>());
    ManualScheduler scheduler(f.clock);
    keeper.start(scheduler);

    f.ledger.bump("actor", 100.0, f.clock->now());
    scheduler.advance(30s);
    scheduler.advance(30s);

    REQUIRE(f.ledger.get("actor") == Approx(10.0 * 0.999 * 0.999));
    auto failures = keeper.job_failures();
    REQUIRE(failures["metrics"] == 2);
    REQUIRE_FALSE(failures.contains("decay"));
}

TEST_CASE("Metrics cover the last five minutes", "[housekeeping]")
{
    Fixture f;
    auto keeper = f.make();
    f.record("a", EventType::LoginFailure);
    f.clock->advance(10min);
    f.record("a", EventType::LoginFailure);
    f.record("b", EventType::SqlInjection);
    f.blocks.block_network("a");

    keeper.emit_metrics();

    auto value_of = [&](const std::string &name)
    {
        for (const auto &[n, v] : f.observability->metrics)
        {
            if (n == name)
                return v;
        }
        return -1.0;
    };
    REQUIRE(value_of("security.events.login_failure") == 1.0);
    REQUIRE(value_of("security.events.sql_injection") == 1.0);
    REQUIRE(value_of("security.events_by_severity.critical") == 1.0);
    REQUIRE(value_of("security.blocked_networks") == 1.0);
    REQUIRE(value_of("security.blocked_accounts") == 0.0);
}

TEST_CASE("Retention drops old events and old closed incidents", "[housekeeping]")
{
    Fixture f;
    HousekeepingConfig cfg;
    cfg.event_retention = 24h;
    cfg.incident_retention = 48h;
    auto keeper = f.make(cfg);

    Rule rule;
    rule.id = "r";
    rule.name = "r";
    auto old_event = f.record("a", EventType::LoginFailure);
    auto closed = f.incidents.correlate(rule, old_event);
    Resolution resolution;
    resolution.summary = "handled";
    REQUIRE(f.incidents.set_status(closed.id, IncidentStatus::Resolved, "x", "", resolution));

    Rule other;
    other.id = "r2";
    other.name = "r2";
    auto open = f.incidents.correlate(other, old_event);

    f.clock->advance(72h);
    f.record("a", EventType::LoginFailure);

    auto swept = keeper.retention_sweep();
    REQUIRE(swept.events_removed == 1);
    REQUIRE(swept.incidents_removed == 1);
    REQUIRE(f.events.size() == 1);
    REQUIRE(f.incidents.get(open.id));
    REQUIRE_FALSE(f.incidents.get(closed.id));
}

TEST_CASE("Summary report", "[housekeeping]")
{
    Fixture f;
    auto keeper = f.make();

    f.record("old", EventType::LoginFailure);
    f.clock->advance(25h);
    for (int i = 0; i < 3; ++i)
        f.record("a", EventType::LoginFailure, 10.0);
    f.record("b", EventType::SqlInjection, 95.0);
    f.blocks.block_network("b");

    auto report = keeper.summary_report();
    REQUIRE(f.observability->reports.size() == 1);

    const auto &summary = report["summary"];
    REQUIRE(report["period_hours"] == 24);
    REQUIRE(summary["total_events"] == 4);
    REQUIRE(summary["critical_events"] == 1);
    REQUIRE(summary["high_risk_events"] == 1);
    REQUIRE(summary["blocked_networks"] == 1);
    REQUIRE(summary["events_by_type"]["login_failure"] == 3);
    REQUIRE(summary["top_event_types"][0]["type"] == "login_failure");
    REQUIRE(summary["top_risk_actors"][0]["actor"] == "b");
    REQUIRE(summary["top_risk_actors"].size() == 2);
}
