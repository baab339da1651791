#include "warden/rule_matcher.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    RuleMatcher::RuleMatcher(const RuleSet &rules, const EventLog &log)
        : rules_(rules), log_(log)
    {
    }

    std::vector<RuleOutcome> RuleMatcher::evaluate(const Event &event) const
    {
        std::vector<RuleOutcome> outcomes;
        for (const auto &rule : rules_.snapshot())
        {
            if (!rule.applies_to(event.type))
                continue;

            try
            {
                outcomes.push_back(evaluate_rule(rule, event));
            }
            catch (const std::exception &e)
            {
                spdlog::error("rule {} evaluation failed for event {}: {}", rule.id, event.id, e.what());
                outcomes.push_back(RuleOutcome{rule, false, 0});
            }
        }
        return outcomes;
    }

    RuleOutcome RuleMatcher::evaluate_rule(const Rule &rule, const Event &event) const
    {
        RuleOutcome outcome{rule, false, 0};
        const auto since = event.timestamp - rule.conditions.time_window;
        outcome.window_count = log_.count_in_window(event.actor.network_hash, rule.event_types, since);

        if (outcome.window_count < static_cast<std::size_t>(rule.conditions.threshold))
            return outcome;

        outcome.triggered = rule.pattern_matches(event.pattern_subject());
        return outcome;
    }

} // namespace warden
