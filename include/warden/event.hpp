#pragma once

#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

namespace warden
{
    /**
     * Raw identity as seen by the host application. Lives only for the
     * duration of ingestion.
     */
    struct RawSource
    {
        std::string address;
        std::string user_agent;
        std::optional<std::string> country;
    };

    struct RawActor
    {
        std::optional<std::string> id;
        std::optional<std::string> email;
        std::optional<std::string> role;
    };

    struct RequestInfo
    {
        std::string method{"GET"};
        std::string path{"/"};
        std::map<std::string, std::string> headers;
        std::map<std::string, std::string> query;
        nlohmann::json body; // null when absent
    };

    struct ResponseInfo
    {
        int status_code{200};
        std::optional<std::string> content_type;
        std::optional<std::size_t> size;
    };

    struct EventContext
    {
        std::optional<std::string> session_id;
        std::optional<std::string> request_id;
        std::optional<std::string> correlation_id;
        nlohmann::json metadata = nlohmann::json::object();
    };

    /**
     * Everything a host passes to record_event(). `type` is a wire name and
     * is validated during enrichment.
     */
    struct RawOccurrence
    {
        std::string type;
        RawSource source;
        RawActor actor;
        RequestInfo request;
        ResponseInfo response;
        EventContext context;
        std::string rule_hint{"manual"};
        double confidence{1.0};

        /** Parse the JSON body accepted by POST /api/events and the replay file format. */
        static Result<RawOccurrence> from_json(const nlohmann::json &j);
    };

    struct ActorIdentity
    {
        std::string network_hash;
        std::optional<std::string> account_hash;
        std::optional<std::string> account_id_hash;
        std::optional<std::string> role;
        std::optional<std::string> country;
    };

    struct Detection
    {
        std::string rule_hint{"manual"};
        double confidence{1.0};
        double risk_score{0.0};
        std::set<std::string> indicators;
    };

    /**
     * A normalized security event. Immutable after enrichment.
     */
    struct Event
    {
        std::string id;
        EventType type{EventType::SuspiciousPattern};
        Severity severity{Severity::Medium};
        Timestamp timestamp{};
        ActorIdentity actor;
        RequestInfo target;
        ResponseInfo response;
        Detection detection;
        EventContext context;

        /** "<path> <serialized body>", the subject of rule patterns */
        std::string pattern_subject() const;

        /** "<METHOD> <path>", the resource handed to quarantine */
        std::string resource_ref() const;

        nlohmann::json to_json() const;
    };

} // namespace warden
