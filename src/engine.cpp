#include "warden/engine.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    Result<std::unique_ptr<Engine>> Engine::create(const WardenConfig &config, EngineDependencies deps)
    {
        if (auto ok = ConfigLoader::validate(config); !ok)
            return std::unexpected(ok.error());

        auto hasher = crypto::IdentityHasher::create(config.hash_salt);
        if (!hasher)
            return std::unexpected(hasher.error());

        if (!deps.dispatch_executor)
            return std::unexpected(WardenError::configuration("engine requires a dispatch executor"));
        if (!deps.clock)
            deps.clock = std::make_shared<SystemClock>();
        if (!deps.notifier)
            deps.notifier = std::make_shared<LoggingNotificationSink>();
        if (!deps.escalation)
            deps.escalation = std::make_shared<LoggingEscalationSink>();
        if (!deps.quarantine)
            deps.quarantine = std::make_shared<LoggingQuarantineSink>();
        if (!deps.observability)
            deps.observability = std::make_shared<LoggingObservabilitySink>();

        auto engine = std::make_unique<Engine>(ConstructionKey{}, config, std::move(deps), std::move(*hasher));

        if (config.use_default_rules)
        {
            for (auto &rule : default_rules())
            {
                if (auto ok = engine->rules_.add(std::move(rule)); !ok)
                    return std::unexpected(ok.error());
            }
        }
        for (const auto &rule : config.rules)
        {
            // A configured rule with a built-in id replaces the built-in.
            auto ok = engine->rules_.get(rule.id) ? engine->rules_.update(rule) : engine->rules_.add(rule);
            if (!ok)
                return std::unexpected(ok.error());
        }

        spdlog::info("security engine ready: {} rule(s), {} high-risk countr(ies)",
                     engine->rules_.size(), config.high_risk_countries.size());
        return engine;
    }

    Engine::Engine(ConstructionKey, WardenConfig config, EngineDependencies deps, crypto::IdentityHasher hasher)
        : config_(std::move(config)),
          clock_(deps.clock),
          observability_(deps.observability),
          intel_(config_.high_risk_countries),
          ledger_(config_.risk),
          incidents_(*clock_),
          blocks_(std::make_shared<BlockList>()),
          enricher_(std::move(hasher), intel_, ledger_, *clock_),
          matcher_(rules_, events_),
          dispatcher_(std::make_shared<ActionDispatcher>(
              config_.alerting,
              ActionDispatcher::Sinks{deps.notifier, deps.escalation, deps.quarantine},
              blocks_,
              clock_,
              deps.dispatch_executor)),
          audit_(clock_),
          housekeeper_(config_.housekeeping,
                       Housekeeper::Stores{events_, incidents_, ledger_, *blocks_},
                       observability_,
                       clock_)
    {
    }

    Result<std::string> Engine::record_event(const RawOccurrence &raw)
    {
        Event event;
        {
            std::lock_guard lock(ingest_mutex_);

            auto enriched = enricher_.enrich(raw);
            if (!enriched)
            {
                spdlog::warn("rejected security event: {}", enriched.error().what());
                return std::unexpected(enriched.error());
            }
            event = std::move(*enriched);

            events_.append(event);
            ledger_.bump(event.actor.network_hash, event.detection.risk_score, event.timestamp);

            if (event.severity >= Severity::High)
            {
                spdlog::warn("security event {} type={} severity={} actor={} risk={:.1f}",
                             event.id, event_type_to_string(event.type), severity_to_string(event.severity),
                             event.actor.network_hash, event.detection.risk_score);
            }

            for (const auto &outcome : matcher_.evaluate(event))
            {
                if (!outcome.triggered)
                    continue;
                auto incident = incidents_.correlate(outcome.rule, event);
                spdlog::info("rule {} triggered by {} ({} in window), incident {}",
                             outcome.rule.id, event.id, outcome.window_count, incident.id);
                dispatcher_->dispatch(outcome.rule, event);
            }
        }

        emit_ingest_metrics(event);
        return event.id;
    }

    void Engine::emit_ingest_metrics(const Event &event)
    {
        try
        {
            observability_->emit_metric("security.event.recorded", 1.0,
                                        {{"type", event_type_to_string(event.type)},
                                         {"severity", severity_to_string(event.severity)}});
            observability_->emit_metric("security.risk_score", event.detection.risk_score,
                                        {{"type", event_type_to_string(event.type)}});
        }
        catch (const std::exception &e)
        {
            spdlog::warn("metrics for event {} not emitted: {}", event.id, e.what());
        }
    }

    Result<void> Engine::add_rule(Rule rule, const std::string &operator_name)
    {
        auto id = rule.id;
        auto res = rules_.add(std::move(rule));
        audit_.log(operator_name, "rule_added", id, res ? "ok" : res.error().what());
        return res;
    }

    Result<void> Engine::update_rule(Rule rule, const std::string &operator_name)
    {
        auto id = rule.id;
        auto res = rules_.update(std::move(rule));
        audit_.log(operator_name, "rule_updated", id, res ? "ok" : res.error().what());
        return res;
    }

    Result<void> Engine::remove_rule(const std::string &rule_id, const std::string &operator_name)
    {
        auto res = rules_.remove(rule_id);
        audit_.log(operator_name, "rule_removed", rule_id, res ? "ok" : res.error().what());
        return res;
    }

    Result<void> Engine::set_rule_enabled(const std::string &rule_id, bool enabled, const std::string &operator_name)
    {
        auto res = rules_.set_enabled(rule_id, enabled);
        audit_.log(operator_name, enabled ? "rule_enabled" : "rule_disabled", rule_id,
                   res ? "ok" : res.error().what());
        return res;
    }

    ThreatIndicator Engine::add_threat_indicator(const std::string &raw_address,
                                                 const std::string &source,
                                                 Severity severity,
                                                 std::set<std::string> tags)
    {
        const auto now = clock_->now();
        ThreatIndicator indicator;
        indicator.network_hash = enricher_.hash_network(raw_address);
        indicator.source = source;
        indicator.severity = severity;
        indicator.tags = std::move(tags);
        indicator.first_seen = now;
        indicator.last_seen = now;
        intel_.upsert(indicator);

        audit_.log(source, "threat_indicator_added", indicator.network_hash, "ok",
                   {{"severity", severity_to_string(severity)}});
        return indicator;
    }

    std::optional<Incident> Engine::get_incident(const std::string &incident_id) const
    {
        return incidents_.get(incident_id);
    }

    std::vector<Incident> Engine::list_incidents(std::optional<IncidentStatus> status) const
    {
        return incidents_.list(status);
    }

    Result<Incident> Engine::set_status(const std::string &incident_id,
                                        IncidentStatus next,
                                        const std::string &operator_name,
                                        const std::string &note,
                                        std::optional<Resolution> resolution)
    {
        auto res = incidents_.set_status(incident_id, next, operator_name, note, std::move(resolution));
        audit_.log(operator_name, "incident_status_changed", incident_id,
                   res ? "ok" : res.error().what(),
                   {{"status", incident_status_to_string(next)}, {"note", note}});
        return res;
    }

    Result<Incident> Engine::acknowledge(const std::string &incident_id, const std::string &operator_name)
    {
        auto res = incidents_.acknowledge(incident_id, operator_name);
        audit_.log(operator_name, "incident_acknowledged", incident_id, res ? "ok" : res.error().what());
        return res;
    }

    std::vector<Event> Engine::list_recent_events(std::size_t limit) const
    {
        return events_.recent(limit);
    }

    std::optional<Event> Engine::find_event(const std::string &event_id) const
    {
        return events_.find(event_id);
    }

    bool Engine::is_blocked_address(std::string_view raw_address) const
    {
        return blocks_->is_network_blocked(enricher_.hash_network(raw_address));
    }

    nlohmann::json Engine::metrics_summary() const
    {
        const auto now = clock_->now();
        const auto recent = events_.since(now - std::chrono::hours(24));

        std::map<std::string, std::size_t> by_severity;
        double risk_total = 0.0;
        for (const auto &e : recent)
        {
            ++by_severity[severity_to_string(e.severity)];
            risk_total += e.detection.risk_score;
        }

        return nlohmann::json{
            {"total_events", recent.size()},
            {"events_by_severity", by_severity},
            {"active_incidents", incidents_.active_count()},
            {"blocked_networks", blocks_->blocked_network_count()},
            {"blocked_accounts", blocks_->blocked_account_count()},
            {"average_risk_score", recent.empty() ? 0.0 : risk_total / static_cast<double>(recent.size())},
            {"tracked_actors", ledger_.size()},
            {"stored_events", events_.size()},
            {"pending_dispatches", dispatcher_->pending()}};
    }

} // namespace warden
