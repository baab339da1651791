#include <catch2/catch_test_macros.hpp>
#include "warden/incident.hpp"
#include "support.hpp"

using namespace warden;
using namespace std::chrono_literals;
using testing::make_event;

namespace
{
    Rule make_rule(const std::string &id, Severity severity = Severity::High)
    {
        Rule r;
        r.id = id;
        r.name = "Rule " + id;
        r.description = "test rule";
        r.event_types = {EventType::LoginFailure};
        r.severity = severity;
        return r;
    }

    Resolution closing(const std::string &summary = "blocked upstream")
    {
        Resolution r;
        r.summary = summary;
        r.actions_taken = {"blocked network"};
        return r;
    }
}

TEST_CASE("Transition table", "[incident]")
{
    using S = IncidentStatus;
    REQUIRE(is_valid_transition(S::Open, S::Investigating));
    REQUIRE(is_valid_transition(S::Open, S::Resolved));
    REQUIRE(is_valid_transition(S::Open, S::FalsePositive));
    REQUIRE(is_valid_transition(S::Investigating, S::Resolved));
    REQUIRE(is_valid_transition(S::Investigating, S::FalsePositive));

    REQUIRE_FALSE(is_valid_transition(S::Open, S::Open));
    REQUIRE_FALSE(is_valid_transition(S::Investigating, S::Investigating));
    REQUIRE_FALSE(is_valid_transition(S::Investigating, S::Open));
    REQUIRE_FALSE(is_valid_transition(S::Resolved, S::Investigating));
    REQUIRE_FALSE(is_valid_transition(S::Resolved, S::Open));
    REQUIRE_FALSE(is_valid_transition(S::FalsePositive, S::Resolved));
}

TEST_CASE("New trigger opens an incident", "[incident]")
{
    ManualClock clock;
    IncidentCorrelator correlator(clock);
    auto rule = make_rule("r1");
    auto event = make_event("actor-1", EventType::LoginFailure, clock.now());

    auto incident = correlator.correlate(rule, event);
    REQUIRE(incident.id.rfind("inc_", 0) == 0);
    REQUIRE(incident.status == IncidentStatus::Open);
    REQUIRE(incident.severity == Severity::High);
    REQUIRE(incident.title == "Rule r1 - actor-1");
    REQUIRE(incident.events == std::vector<std::string>{event.id});
    REQUIRE(incident.timeline.size() == 1);
    REQUIRE(incident.timeline[0].action == "incident_created");
    REQUIRE(incident.timeline[0].actor == "system");
    REQUIRE(incident.created == clock.now());
    REQUIRE(correlator.active_count() == 1);
}

TEST_CASE("At most one active incident per rule and actor", "[incident]")
{
    ManualClock clock;
    IncidentCorrelator correlator(clock);
    auto rule = make_rule("r1");

    auto first = correlator.correlate(rule, make_event("actor-1", EventType::LoginFailure, clock.now()));
    clock.advance(1min);
    auto merged = correlator.correlate(rule, make_event("actor-1", EventType::LoginFailure, clock.now()));

    REQUIRE(merged.id == first.id);
    REQUIRE(merged.events.size() == 2);
    REQUIRE(merged.timeline.back().action == "event_added");
    REQUIRE(merged.updated == clock.now());
    REQUIRE(correlator.size() == 1);

    SECTION("different actor or rule gets its own incident")
    {
        auto other_actor = correlator.correlate(rule, make_event("actor-2", EventType::LoginFailure, clock.now()));
        auto other_rule = correlator.correlate(make_rule("r2"), make_event("actor-1", EventType::LoginFailure, clock.now()));
        REQUIRE(other_actor.id != first.id);
        REQUIRE(other_rule.id != first.id);
        REQUIRE(correlator.active_count() == 3);
    }

    SECTION("investigating incidents still absorb triggers")
    {
        REQUIRE(correlator.acknowledge(first.id, "oncall"));
        auto again = correlator.correlate(rule, make_event("actor-1", EventType::LoginFailure, clock.now()));
        REQUIRE(again.id == first.id);
        REQUIRE(again.status == IncidentStatus::Investigating);
    }

    SECTION("a closed incident is not reopened")
    {
        REQUIRE(correlator.set_status(first.id, IncidentStatus::Resolved, "oncall", "done", closing()));
        auto fresh = correlator.correlate(rule, make_event("actor-1", EventType::LoginFailure, clock.now()));
        REQUIRE(fresh.id != first.id);
        REQUIRE(fresh.status == IncidentStatus::Open);
        REQUIRE(correlator.get(first.id)->events.size() == 2);
    }
}

TEST_CASE("Resolved incidents reject further transitions", "[incident]")
{
    ManualClock clock;
    IncidentCorrelator correlator(clock);
    auto incident = correlator.correlate(make_rule("r1"), make_event("actor-1", EventType::LoginFailure, clock.now()));

    auto resolved = correlator.set_status(incident.id, IncidentStatus::Resolved, "analyst", "patched", closing());
    REQUIRE(resolved);
    REQUIRE(resolved->resolution);
    REQUIRE(resolved->resolution->timestamp == clock.now());
    REQUIRE(resolved->timeline.back().action == "status_changed");
    REQUIRE(resolved->timeline.back().actor == "analyst");

    auto reopen = correlator.set_status(incident.id, IncidentStatus::Investigating, "analyst", "");
    REQUIRE_FALSE(reopen);
    REQUIRE(reopen.error().code == ErrorCode::TransitionError);

    auto stored = correlator.get(incident.id);
    REQUIRE(stored->status == IncidentStatus::Resolved);
    REQUIRE(stored->timeline.size() == resolved->timeline.size());
    REQUIRE(correlator.active_count() == 0);

    REQUIRE_FALSE(correlator.set_status(incident.id, IncidentStatus::FalsePositive, "analyst", "", closing()));
    REQUIRE_FALSE(correlator.acknowledge(incident.id, "analyst"));
}

TEST_CASE("Closing requires a resolution summary", "[incident]")
{
    ManualClock clock;
    IncidentCorrelator correlator(clock);
    auto incident = correlator.correlate(make_rule("r1"), make_event("actor-1", EventType::LoginFailure, clock.now()));

    auto res = correlator.set_status(incident.id, IncidentStatus::FalsePositive, "analyst", "");
    REQUIRE_FALSE(res);
    REQUIRE(res.error().code == ErrorCode::ValidationError);
    REQUIRE(correlator.get(incident.id)->status == IncidentStatus::Open);

    REQUIRE_FALSE(correlator.set_status(incident.id, IncidentStatus::Resolved, "analyst", "", closing("")));
    REQUIRE(correlator.set_status(incident.id, IncidentStatus::FalsePositive, "analyst", "", closing("scanner test")));
}

TEST_CASE("Acknowledge assigns and starts investigation", "[incident]")
{
    ManualClock clock;
    IncidentCorrelator correlator(clock);
    auto incident = correlator.correlate(make_rule("r1"), make_event("actor-1", EventType::LoginFailure, clock.now()));

    auto acked = correlator.acknowledge(incident.id, "erin");
    REQUIRE(acked);
    REQUIRE(acked->status == IncidentStatus::Investigating);
    REQUIRE(acked->assignee == "erin");

    REQUIRE_FALSE(correlator.acknowledge(incident.id, "erin"));
    REQUIRE(correlator.acknowledge("inc_missing", "erin").error().code == ErrorCode::NotFound);
}

TEST_CASE("Listing and pruning", "[incident]")
{
    ManualClock clock;
    IncidentCorrelator correlator(clock);

    auto older = correlator.correlate(make_rule("r1"), make_event("a", EventType::LoginFailure, clock.now()));
    clock.advance(1h);
    auto newer = correlator.correlate(make_rule("r2"), make_event("a", EventType::LoginFailure, clock.now()));

    auto all = correlator.list();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].id == newer.id);

    REQUIRE(correlator.set_status(older.id, IncidentStatus::Resolved, "x", "", closing()));
    REQUIRE(correlator.list(IncidentStatus::Open).size() == 1);
    REQUIRE(correlator.list(IncidentStatus::Resolved).size() == 1);

    clock.advance(std::chrono::hours(24 * 400));
    REQUIRE(correlator.prune_terminal(clock.now() - std::chrono::hours(24 * 365)) == 1);
    REQUIRE(correlator.size() == 1);
    REQUIRE(correlator.get(newer.id));
}
