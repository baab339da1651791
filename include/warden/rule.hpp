#pragma once

#include "types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <regex>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{

    struct RuleConditions
    {
        static constexpr Duration kMaxTimeWindow = std::chrono::hours(24 * 366);


        Duration time_window{std::chrono::minutes(5)};
        int threshold{1};
        std::optional<std::string> pattern; // case-insensitive ECMAScript regex
    };

    /**
     * Detection rule. Supplied by configuration, never mutated by the engine.
     */
    struct Rule
    {
        std::string id;
        std::string name;
        std::string description;
        std::set<EventType> event_types;
        RuleConditions conditions;
        Severity severity{Severity::Medium};
        bool enabled{true};
        std::vector<ActionKind> actions;

        /**
         * Check invariants (threshold >= 1, window > 0, id and event types
         * present) and compile the pattern. Must succeed before a rule is
         * evaluated.
         */
        Result<void> prepare();

        bool applies_to(EventType type) const { return enabled && event_types.contains(type); }

        /** True when no pattern is configured or the pattern matches subject. */
        bool pattern_matches(std::string_view subject) const;

        nlohmann::json to_json() const;

        /**
         * Parse {id, name, description, event_types, time_window_minutes |
         * time_window_seconds, threshold, pattern, severity, enabled, actions}.
         * The result is already prepared.
         */
        static Result<Rule> from_json(const nlohmann::json &j);

    private:
        std::shared_ptr<const std::regex> compiled_;
    };

    /**
     * Ordered, thread-safe rule collection. Order is evaluation order.
     */
    class RuleSet
    {
    public:
        RuleSet() = default;

        Result<void> add(Rule rule);
        Result<void> update(Rule rule);
        Result<void> remove(std::string_view rule_id);
        Result<void> set_enabled(std::string_view rule_id, bool enabled);

        std::optional<Rule> get(std::string_view rule_id) const;

        /** Copy of the current rules in evaluation order */
        std::vector<Rule> snapshot() const;

        std::size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::vector<Rule> rules_;
    };

    /** Built-in detection pack: brute force, SQL injection, admin access, geolocation anomaly. */
    std::vector<Rule> default_rules();

} // namespace warden
