#pragma once

#include "event.hpp"
#include "event_log.hpp"
#include "rule.hpp"
#include <vector>

namespace warden
{

    struct RuleOutcome
    {
        Rule rule;
        bool triggered{false};
        std::size_t window_count{0};
    };

    /**
     * Evaluates every enabled rule that lists the event's type against the
     * actor's recent history. Rules fire independently, in configured order.
     * The event itself must already be in the log.
     */
    class RuleMatcher
    {
    public:
        RuleMatcher(const RuleSet &rules, const EventLog &log);

        std::vector<RuleOutcome> evaluate(const Event &event) const;

        /** Window test for a single rule. */
        RuleOutcome evaluate_rule(const Rule &rule, const Event &event) const;

    private:
        const RuleSet &rules_;
        const EventLog &log_;
    };

} // namespace warden
