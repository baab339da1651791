#include <catch2/catch_test_macros.hpp>
#include "warden/event_log.hpp"
#include "support.hpp"

using namespace warden;
using namespace std::chrono_literals;
using testing::make_event;

namespace
{
    const Timestamp t0 = from_epoch_ms(1'700'000'000'000);
}

TEST_CASE("Window counts are per actor and type", "[event_log]")
{
    EventLog log;
    log.append(make_event("a", EventType::LoginFailure, t0));
    log.append(make_event("a", EventType::LoginFailure, t0 + 1min));
    log.append(make_event("a", EventType::LoginSuccess, t0 + 2min));
    log.append(make_event("b", EventType::LoginFailure, t0 + 2min));

    REQUIRE(log.count_in_window("a", {EventType::LoginFailure}, t0) == 2);
    REQUIRE(log.count_in_window("a", {EventType::LoginFailure, EventType::LoginSuccess}, t0) == 3);
    REQUIRE(log.count_in_window("b", {EventType::LoginFailure}, t0) == 1);
    REQUIRE(log.count_in_window("c", {EventType::LoginFailure}, t0) == 0);
}

TEST_CASE("Window lower bound is inclusive", "[event_log]")
{
    EventLog log;
    log.append(make_event("a", EventType::LoginFailure, t0));
    log.append(make_event("a", EventType::LoginFailure, t0 + 5min));

    REQUIRE(log.count_in_window("a", {EventType::LoginFailure}, t0) == 2);
    REQUIRE(log.count_in_window("a", {EventType::LoginFailure}, t0 + 1ms) == 1);
}

TEST_CASE("Out-of-order timestamps stay indexed", "[event_log]")
{
    EventLog log;
    log.append(make_event("a", EventType::LoginFailure, t0 + 3min));
    log.append(make_event("a", EventType::LoginFailure, t0 + 1min));
    REQUIRE(log.count_in_window("a", {EventType::LoginFailure}, t0 + 2min) == 1);
}

TEST_CASE("Recent and since keep ingestion order", "[event_log]")
{
    EventLog log;
    for (int i = 0; i < 5; ++i)
        log.append(make_event("a", EventType::Logout, t0 + std::chrono::minutes(i)));

    auto recent = log.recent(2);
    REQUIRE(recent.size() == 2);
    REQUIRE(recent[0].timestamp == t0 + 3min);
    REQUIRE(recent[1].timestamp == t0 + 4min);
    REQUIRE(log.recent(100).size() == 5);

    REQUIRE(log.since(t0 + 2min).size() == 3);
    REQUIRE(log.find(recent[1].id));
    REQUIRE_FALSE(log.find("evt_missing"));
}

TEST_CASE("Prune drops old events and their index entries", "[event_log]")
{
    EventLog log;
    log.append(make_event("a", EventType::LoginFailure, t0));
    log.append(make_event("a", EventType::LoginFailure, t0 + 10min));
    log.append(make_event("b", EventType::LoginFailure, t0 + 1min));

    REQUIRE(log.prune_before(t0 + 5min) == 2);
    REQUIRE(log.size() == 1);
    REQUIRE(log.count_in_window("a", {EventType::LoginFailure}, t0) == 1);
    REQUIRE(log.count_in_window("b", {EventType::LoginFailure}, t0) == 0);
}
