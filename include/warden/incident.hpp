#pragma once

#include "clock.hpp"
#include "event.hpp"
#include "rule.hpp"
#include "types.hpp"
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden
{

    struct TimelineEntry
    {
        Timestamp timestamp{};
        std::string action;
        std::string actor;
        std::string note;

        nlohmann::json to_json() const;
    };

    struct Resolution
    {
        Timestamp timestamp{};
        std::string summary;
        std::vector<std::string> actions_taken;
        std::vector<std::string> lessons_learned;

        nlohmann::json to_json() const;
        static Result<Resolution> from_json(const nlohmann::json &j);
    };

    struct Incident
    {
        std::string id;
        std::string rule_id;
        std::string actor_hash;
        std::string title;
        std::string description;
        Severity severity{Severity::Medium};
        IncidentStatus status{IncidentStatus::Open};
        std::optional<std::string> assignee;
        std::vector<std::string> events;
        std::vector<TimelineEntry> timeline;
        std::optional<Resolution> resolution;
        Timestamp created{};
        Timestamp updated{};

        bool is_active() const { return !is_terminal(status); }

        nlohmann::json to_json() const;
    };

    /** open -> investigating -> resolved | false_positive, open -> terminal directly */
    bool is_valid_transition(IncidentStatus from, IncidentStatus to);

    /**
     * Maps rule triggers to incidents. At most one active (open or
     * investigating) incident exists per (rule id, actor hash); further
     * triggers for that key merge into it. All operations hold one lock, so
     * create-or-merge is atomic per key.
     */
    class IncidentCorrelator
    {
    public:
        explicit IncidentCorrelator(const Clock &clock);

        /** Create or merge; returns a copy of the incident after the change. */
        Incident correlate(const Rule &rule, const Event &event);

        /**
         * Move an incident along the state machine. Terminal targets require a
         * resolution. Terminal incidents reject every transition.
         */
        Result<Incident> set_status(const std::string &incident_id,
                                    IncidentStatus next,
                                    const std::string &operator_name,
                                    const std::string &note,
                                    std::optional<Resolution> resolution = std::nullopt);

        /** open -> investigating, recording the assignee */
        Result<Incident> acknowledge(const std::string &incident_id, const std::string &operator_name);

        std::optional<Incident> get(const std::string &incident_id) const;

        /** Newest first; optionally filtered by status */
        std::vector<Incident> list(std::optional<IncidentStatus> status = std::nullopt) const;

        std::size_t active_count() const;
        std::size_t size() const;

        /** Remove terminal incidents last updated before cutoff; returns count removed. */
        std::size_t prune_terminal(Timestamp cutoff);

    private:
        using Key = std::pair<std::string, std::string>;

        Result<Incident> transition_locked(Incident &incident,
                                           IncidentStatus next,
                                           const std::string &operator_name,
                                           const std::string &note,
                                           std::optional<Resolution> resolution);

        const Clock &clock_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Incident> incidents_;
        std::map<Key, std::string> active_by_key_;
    };

} // namespace warden
