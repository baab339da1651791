#include "warden/rule.hpp"
#include <algorithm>
#include <format>
#include <mutex>
#include <spdlog/spdlog.h>

namespace warden
{
    namespace
    {
        // Range-check before converting so large counts cannot overflow Duration.
        template <typename Unit>
        Result<Duration> window_from(Unit count)
        {
            if (count <= Unit::zero())
                return std::unexpected(WardenError::configuration("time window must be positive"));
            if (count > std::chrono::duration_cast<Unit>(RuleConditions::kMaxTimeWindow))
                return std::unexpected(WardenError::configuration("time window exceeds 366 days"));
            return std::chrono::duration_cast<Duration>(count);
        }
    }

    Result<void> Rule::prepare()
    {
        if (id.empty())
            return std::unexpected(WardenError::configuration("rule id must not be empty"));
        if (event_types.empty())
            return std::unexpected(WardenError::configuration(std::format("rule {}: event_types must not be empty", id)));
        if (conditions.threshold < 1)
            return std::unexpected(WardenError::configuration(std::format("rule {}: threshold must be >= 1", id)));
        if (conditions.time_window <= Duration::zero())
            return std::unexpected(WardenError::configuration(std::format("rule {}: time window must be positive", id)));
        if (conditions.time_window > RuleConditions::kMaxTimeWindow)
            return std::unexpected(WardenError::configuration(std::format("rule {}: time window exceeds 366 days", id)));

        compiled_.reset();
        if (conditions.pattern)
        {
            try
            {
                compiled_ = std::make_shared<const std::regex>(
                    *conditions.pattern, std::regex::ECMAScript | std::regex::icase);
            }
            catch (const std::regex_error &e)
            {
                return std::unexpected(WardenError::configuration(
                    std::format("rule {}: invalid pattern '{}': {}", id, *conditions.pattern, e.what())));
            }
        }
        if (name.empty())
            name = id;
        return {};
    }

    bool Rule::pattern_matches(std::string_view subject) const
    {
        if (!conditions.pattern)
            return true;
        if (!compiled_)
            return false;
        return std::regex_search(subject.begin(), subject.end(), *compiled_);
    }

    nlohmann::json Rule::to_json() const
    {
        nlohmann::json types = nlohmann::json::array();
        for (auto t : event_types)
            types.push_back(event_type_to_string(t));
        nlohmann::json acts = nlohmann::json::array();
        for (auto a : actions)
            acts.push_back(action_kind_to_string(a));

        nlohmann::json j{
            {"id", id},
            {"name", name},
            {"description", description},
            {"event_types", types},
            {"time_window_seconds", std::chrono::duration_cast<std::chrono::seconds>(conditions.time_window).count()},
            {"threshold", conditions.threshold},
            {"severity", severity_to_string(severity)},
            {"enabled", enabled},
            {"actions", acts}};
        if (conditions.pattern)
            j["pattern"] = *conditions.pattern;
        return j;
    }

    Result<Rule> Rule::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::configuration("rule must be an object"));

        Rule rule;
        try
        {
            rule.id = j.value("id", "");
            rule.name = j.value("name", "");
            rule.description = j.value("description", "");
            for (const auto &t : j.value("event_types", nlohmann::json::array()))
            {
                auto name = t.get<std::string>();
                auto type = event_type_from_string(name);
                if (!type)
                    return std::unexpected(WardenError::configuration(std::format("rule {}: unknown event type '{}'", rule.id, name)));
                rule.event_types.insert(*type);
            }
            if (j.contains("time_window_seconds"))
            {
                auto window = window_from(std::chrono::seconds(j.at("time_window_seconds").get<std::int64_t>()));
                if (!window)
                    return std::unexpected(WardenError::configuration(std::format("rule {}: {}", rule.id, window.error().what())));
                rule.conditions.time_window = *window;
            }
            else if (j.contains("time_window_minutes"))
            {
                auto window = window_from(std::chrono::minutes(j.at("time_window_minutes").get<std::int64_t>()));
                if (!window)
                    return std::unexpected(WardenError::configuration(std::format("rule {}: {}", rule.id, window.error().what())));
                rule.conditions.time_window = *window;
            }
            rule.conditions.threshold = j.value("threshold", 1);
            if (auto p = j.find("pattern"); p != j.end() && p->is_string())
                rule.conditions.pattern = p->get<std::string>();
            rule.severity = severity_from_string(j.value("severity", "medium"));
            rule.enabled = j.value("enabled", true);
            for (const auto &a : j.value("actions", nlohmann::json::array()))
            {
                auto name = a.get<std::string>();
                auto kind = action_kind_from_string(name);
                if (kind == ActionKind::Log && name != "log")
                    spdlog::warn("rule {}: unknown action '{}' treated as log", rule.id, name);
                rule.actions.push_back(kind);
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardenError::configuration(std::format("rule {}: {}", rule.id, e.what())));
        }

        if (auto ok = rule.prepare(); !ok)
            return std::unexpected(ok.error());
        return rule;
    }

    Result<void> RuleSet::add(Rule rule)
    {
        if (auto ok = rule.prepare(); !ok)
            return ok;

        std::unique_lock lock(mutex_);
        auto exists = std::any_of(rules_.begin(), rules_.end(), [&](const Rule &r)
                                  { return r.id == rule.id; });
        if (exists)
            return std::unexpected(WardenError::already_exists(std::format("rule {} already exists", rule.id)));
        rules_.push_back(std::move(rule));
        return {};
    }

    Result<void> RuleSet::update(Rule rule)
    {
        if (auto ok = rule.prepare(); !ok)
            return ok;

        std::unique_lock lock(mutex_);
        auto it = std::find_if(rules_.begin(), rules_.end(), [&](const Rule &r)
                               { return r.id == rule.id; });
        if (it == rules_.end())
            return std::unexpected(WardenError::not_found(std::format("rule {} not found", rule.id)));
        *it = std::move(rule);
        return {};
    }

    Result<void> RuleSet::remove(std::string_view rule_id)
    {
        std::unique_lock lock(mutex_);
        auto it = std::find_if(rules_.begin(), rules_.end(), [&](const Rule &r)
                               { return r.id == rule_id; });
        if (it == rules_.end())
            return std::unexpected(WardenError::not_found(std::format("rule {} not found", rule_id)));
        rules_.erase(it);
        return {};
    }

    Result<void> RuleSet::set_enabled(std::string_view rule_id, bool enabled)
    {
        std::unique_lock lock(mutex_);
        auto it = std::find_if(rules_.begin(), rules_.end(), [&](const Rule &r)
                               { return r.id == rule_id; });
        if (it == rules_.end())
            return std::unexpected(WardenError::not_found(std::format("rule {} not found", rule_id)));
        it->enabled = enabled;
        return {};
    }

    std::optional<Rule> RuleSet::get(std::string_view rule_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = std::find_if(rules_.begin(), rules_.end(), [&](const Rule &r)
                               { return r.id == rule_id; });
        if (it == rules_.end())
            return std::nullopt;
        return *it;
    }

    std::vector<Rule> RuleSet::snapshot() const
    {
        std::shared_lock lock(mutex_);
        return rules_;
    }

    std::size_t RuleSet::size() const
    {
        std::shared_lock lock(mutex_);
        return rules_.size();
    }

    std::vector<Rule> default_rules()
    {
        Rule brute_force;
        brute_force.id = "brute_force_detection";
        brute_force.name = "Brute Force Attack Detection";
        brute_force.description = "Detects multiple failed login attempts from same IP";
        brute_force.event_types = {EventType::LoginFailure};
        brute_force.conditions.time_window = std::chrono::minutes(5);
        brute_force.conditions.threshold = 5;
        brute_force.severity = Severity::High;
        brute_force.actions = {ActionKind::Alert, ActionKind::BlockActor};

        Rule sql_injection;
        sql_injection.id = "sql_injection_detection";
        sql_injection.name = "SQL Injection Detection";
        sql_injection.description = "Detects potential SQL injection patterns";
        sql_injection.event_types = {EventType::SqlInjection};
        sql_injection.conditions.time_window = std::chrono::minutes(1);
        sql_injection.conditions.threshold = 1;
        sql_injection.conditions.pattern = "(union|select|insert|update|delete|drop|create|alter|exec|execute)";
        sql_injection.severity = Severity::Critical;
        sql_injection.actions = {ActionKind::Alert, ActionKind::BlockActor, ActionKind::Escalate};

        Rule admin_access;
        admin_access.id = "admin_access_monitoring";
        admin_access.name = "Admin Access Monitoring";
        admin_access.description = "Monitors administrative access events";
        admin_access.event_types = {EventType::AdminAccess};
        admin_access.conditions.time_window = std::chrono::minutes(60);
        admin_access.conditions.threshold = 1;
        admin_access.severity = Severity::Medium;
        admin_access.actions = {ActionKind::Log, ActionKind::Alert};

        Rule geo;
        geo.id = "geolocation_anomaly";
        geo.name = "Geolocation Anomaly Detection";
        geo.description = "Detects access from unusual locations";
        geo.event_types = {EventType::GeolocationAnomaly};
        geo.conditions.time_window = std::chrono::minutes(15);
        geo.conditions.threshold = 1;
        geo.severity = Severity::Medium;
        geo.actions = {ActionKind::Alert, ActionKind::RequireSecondFactor};

        std::vector<Rule> rules{brute_force, sql_injection, admin_access, geo};
        for (auto &r : rules)
        {
            if (auto ok = r.prepare(); !ok)
                spdlog::error("default rule {} rejected: {}", r.id, ok.error().what());
        }
        return rules;
    }

} // namespace warden
