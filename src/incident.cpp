#include "warden/incident.hpp"
#include "warden/crypto.hpp"
#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace warden
{

    nlohmann::json TimelineEntry::to_json() const
    {
        return nlohmann::json{
            {"timestamp", to_epoch_ms(timestamp)},
            {"action", action},
            {"actor", actor},
            {"note", note}};
    }

    nlohmann::json Resolution::to_json() const
    {
        return nlohmann::json{
            {"timestamp", to_epoch_ms(timestamp)},
            {"summary", summary},
            {"actions_taken", actions_taken},
            {"lessons_learned", lessons_learned}};
    }

    Result<Resolution> Resolution::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::validation("resolution must be an object"));
        try
        {
            Resolution r;
            r.summary = j.value("summary", "");
            r.actions_taken = j.value("actions_taken", std::vector<std::string>{});
            r.lessons_learned = j.value("lessons_learned", std::vector<std::string>{});
            if (auto ts = j.find("timestamp"); ts != j.end() && ts->is_number_integer())
                r.timestamp = from_epoch_ms(ts->get<std::int64_t>());
            if (r.summary.empty())
                return std::unexpected(WardenError::validation("resolution summary is required"));
            return r;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardenError::validation(std::string("malformed resolution: ") + e.what()));
        }
    }

    nlohmann::json Incident::to_json() const
    {
        nlohmann::json timeline_j = nlohmann::json::array();
        for (const auto &entry : timeline)
            timeline_j.push_back(entry.to_json());

        nlohmann::json j{
            {"id", id},
            {"rule_id", rule_id},
            {"actor_hash", actor_hash},
            {"title", title},
            {"description", description},
            {"severity", severity_to_string(severity)},
            {"status", incident_status_to_string(status)},
            {"events", events},
            {"timeline", timeline_j},
            {"created", to_epoch_ms(created)},
            {"updated", to_epoch_ms(updated)}};
        j["assignee"] = assignee ? nlohmann::json(*assignee) : nlohmann::json(nullptr);
        j["resolution"] = resolution ? resolution->to_json() : nlohmann::json(nullptr);
        return j;
    }

    bool is_valid_transition(IncidentStatus from, IncidentStatus to)
    {
        switch (from)
        {
        case IncidentStatus::Open:
            return to == IncidentStatus::Investigating || is_terminal(to);
        case IncidentStatus::Investigating:
            return is_terminal(to);
        case IncidentStatus::Resolved:
        case IncidentStatus::FalsePositive:
            return false;
        }
        return false;
    }

    IncidentCorrelator::IncidentCorrelator(const Clock &clock) : clock_(clock) {}

    Incident IncidentCorrelator::correlate(const Rule &rule, const Event &event)
    {
        const auto now = clock_.now();
        Key key{rule.id, event.actor.network_hash};

        std::lock_guard lock(mutex_);
        if (auto active = active_by_key_.find(key); active != active_by_key_.end())
        {
            auto &incident = incidents_.at(active->second);
            incident.events.push_back(event.id);
            incident.updated = now;
            incident.timeline.push_back(TimelineEntry{
                now, "event_added", "system",
                std::format("New {} event added", event_type_to_string(event.type))});
            spdlog::debug("incident {} merged event {} ({} events)", incident.id, event.id, incident.events.size());
            return incident;
        }

        Incident incident;
        incident.id = crypto::SecureRandom::generate_id("inc");
        incident.rule_id = rule.id;
        incident.actor_hash = event.actor.network_hash;
        incident.title = std::format("{} - {}", rule.name, event.actor.network_hash);
        incident.description = std::format("Security incident detected: {}", rule.description);
        incident.severity = rule.severity;
        incident.status = IncidentStatus::Open;
        incident.events.push_back(event.id);
        incident.timeline.push_back(TimelineEntry{
            now, "incident_created", "system",
            "Incident automatically created by security monitoring"});
        incident.created = now;
        incident.updated = now;

        spdlog::warn("incident {} opened: rule={} actor={} severity={}",
                     incident.id, rule.id, incident.actor_hash, severity_to_string(incident.severity));

        active_by_key_.emplace(key, incident.id);
        auto [it, _] = incidents_.emplace(incident.id, std::move(incident));
        return it->second;
    }

    Result<Incident> IncidentCorrelator::set_status(const std::string &incident_id,
                                                    IncidentStatus next,
                                                    const std::string &operator_name,
                                                    const std::string &note,
                                                    std::optional<Resolution> resolution)
    {
        std::lock_guard lock(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end())
            return std::unexpected(WardenError::not_found(std::format("incident {} not found", incident_id)));
        return transition_locked(it->second, next, operator_name, note, std::move(resolution));
    }

    Result<Incident> IncidentCorrelator::acknowledge(const std::string &incident_id, const std::string &operator_name)
    {
        std::lock_guard lock(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end())
            return std::unexpected(WardenError::not_found(std::format("incident {} not found", incident_id)));

        auto res = transition_locked(it->second, IncidentStatus::Investigating, operator_name, "acknowledged", std::nullopt);
        if (!res)
            return res;
        it->second.assignee = operator_name;
        return it->second;
    }

    Result<Incident> IncidentCorrelator::transition_locked(Incident &incident,
                                                           IncidentStatus next,
                                                           const std::string &operator_name,
                                                           const std::string &note,
                                                           std::optional<Resolution> resolution)
    {
        if (!is_valid_transition(incident.status, next))
        {
            return std::unexpected(WardenError::transition(std::format(
                "incident {}: {} -> {} is not allowed",
                incident.id,
                incident_status_to_string(incident.status),
                incident_status_to_string(next))));
        }

        const auto now = clock_.now();
        if (is_terminal(next))
        {
            if (!resolution || resolution->summary.empty())
            {
                return std::unexpected(WardenError::validation(std::format(
                    "incident {}: a resolution summary is required to close", incident.id)));
            }
            if (resolution->timestamp == Timestamp{})
                resolution->timestamp = now;
            incident.resolution = std::move(resolution);
            active_by_key_.erase(Key{incident.rule_id, incident.actor_hash});
        }

        const auto from = incident.status;
        incident.status = next;
        incident.updated = now;
        incident.timeline.push_back(TimelineEntry{
            now, "status_changed", operator_name,
            note.empty()
                ? std::format("{} -> {}", incident_status_to_string(from), incident_status_to_string(next))
                : std::format("{} -> {}: {}", incident_status_to_string(from), incident_status_to_string(next), note)});

        spdlog::info("incident {} {} -> {} by {}", incident.id,
                     incident_status_to_string(from), incident_status_to_string(next), operator_name);
        return incident;
    }

    std::optional<Incident> IncidentCorrelator::get(const std::string &incident_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = incidents_.find(incident_id);
        if (it == incidents_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<Incident> IncidentCorrelator::list(std::optional<IncidentStatus> status) const
    {
        std::vector<Incident> out;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[_, incident] : incidents_)
            {
                if (!status || incident.status == *status)
                    out.push_back(incident);
            }
        }
        std::sort(out.begin(), out.end(), [](const Incident &a, const Incident &b)
                  { return a.created > b.created; });
        return out;
    }

    std::size_t IncidentCorrelator::active_count() const
    {
        std::lock_guard lock(mutex_);
        return active_by_key_.size();
    }

    std::size_t IncidentCorrelator::size() const
    {
        std::lock_guard lock(mutex_);
        return incidents_.size();
    }

    std::size_t IncidentCorrelator::prune_terminal(Timestamp cutoff)
    {
        std::lock_guard lock(mutex_);
        return std::erase_if(incidents_, [&](const auto &entry)
                             {
            const auto &incident = entry.second;
            return is_terminal(incident.status) && incident.updated < cutoff; });
    }

} // namespace warden
