#include "warden/housekeeping.hpp"
#include <algorithm>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace warden
{
    namespace
    {
        constexpr double kHighRiskThreshold = 70.0;
    }

    Housekeeper::Housekeeper(HousekeepingConfig cfg,
                             Stores stores,
                             std::shared_ptr<ObservabilitySink> observability,
                             std::shared_ptr<const Clock> clock)
        : cfg_(std::move(cfg)),
          stores_(stores),
          observability_(std::move(observability)),
          clock_(std::move(clock))
    {
    }

    void Housekeeper::start(Scheduler &scheduler)
    {
        scheduler.schedule_every("decay", cfg_.decay_period, [this]
                                 { run_guarded("decay", [this]
                                               { decay_tick(); }); });
        scheduler.schedule_every("metrics", cfg_.metrics_period, [this]
                                 { run_guarded("metrics", [this]
                                               { emit_metrics(); }); });
        scheduler.schedule_every("retention", cfg_.retention_period, [this]
                                 { run_guarded("retention", [this]
                                               { retention_sweep(); }); });
        scheduler.schedule_every("report", cfg_.report_period, [this]
                                 { run_guarded("report", [this]
                                               { summary_report(); }); });
        spdlog::info("security housekeeping started");
    }

    bool Housekeeper::run_guarded(const std::string &name, const std::function<void()> &fn)
    {
        try
        {
            fn();
            return true;
        }
        catch (const std::exception &e)
        {
            spdlog::error("housekeeping job '{}' failed: {}", name, e.what());
            std::lock_guard lock(failures_mutex_);
            ++failures_[name];
            return false;
        }
    }

    std::map<std::string, std::size_t> Housekeeper::job_failures() const
    {
        std::lock_guard lock(failures_mutex_);
        return failures_;
    }

    void Housekeeper::decay_tick()
    {
        auto evicted = stores_.ledger.decay_tick(clock_->now());
        if (evicted > 0)
            spdlog::debug("risk decay evicted {} actor(s)", evicted);
    }

    void Housekeeper::emit_metrics()
    {
        const auto recent = stores_.events.since(clock_->now() - cfg_.metrics_window);

        std::map<std::string, std::size_t> by_type;
        std::map<std::string, std::size_t> by_severity;
        for (const auto &e : recent)
        {
            ++by_type[event_type_to_string(e.type)];
            ++by_severity[severity_to_string(e.severity)];
        }

        for (const auto &[type, count] : by_type)
            observability_->emit_metric("security.events." + type, static_cast<double>(count), {});
        for (const auto &[severity, count] : by_severity)
            observability_->emit_metric("security.events_by_severity." + severity, static_cast<double>(count), {});

        observability_->emit_metric("security.blocked_networks", static_cast<double>(stores_.blocks.blocked_network_count()), {});
        observability_->emit_metric("security.blocked_accounts", static_cast<double>(stores_.blocks.blocked_account_count()), {});
        observability_->emit_metric("security.active_incidents", static_cast<double>(stores_.incidents.active_count()), {});
    }

    Housekeeper::SweepResult Housekeeper::retention_sweep()
    {
        const auto now = clock_->now();
        SweepResult result;
        result.events_removed = stores_.events.prune_before(now - cfg_.event_retention);
        result.incidents_removed = stores_.incidents.prune_terminal(now - cfg_.incident_retention);
        spdlog::info("security data cleanup completed: {} event(s), {} incident(s) removed",
                     result.events_removed, result.incidents_removed);
        return result;
    }

    nlohmann::json Housekeeper::build_summary() const
    {
        const auto now = clock_->now();
        const auto recent = stores_.events.since(now - cfg_.report_window);

        std::map<std::string, std::size_t> by_type;
        std::map<std::string, std::size_t> by_severity;
        struct ActorStats
        {
            double max_risk{0.0};
            std::size_t events{0};
        };
        std::unordered_map<std::string, ActorStats> by_actor;
        std::size_t critical = 0;
        std::size_t high_risk = 0;

        for (const auto &e : recent)
        {
            ++by_type[event_type_to_string(e.type)];
            ++by_severity[severity_to_string(e.severity)];
            if (e.severity == Severity::Critical)
                ++critical;
            if (e.detection.risk_score > kHighRiskThreshold)
                ++high_risk;
            auto &stats = by_actor[e.actor.network_hash];
            stats.max_risk = std::max(stats.max_risk, e.detection.risk_score);
            ++stats.events;
        }

        std::vector<std::pair<std::string, std::size_t>> types(by_type.begin(), by_type.end());
        std::stable_sort(types.begin(), types.end(), [](const auto &a, const auto &b)
                         { return a.second > b.second; });
        if (types.size() > cfg_.report_top_n)
            types.resize(cfg_.report_top_n);

        std::vector<std::pair<std::string, ActorStats>> actors(by_actor.begin(), by_actor.end());
        std::sort(actors.begin(), actors.end(), [](const auto &a, const auto &b)
                  { return a.second.max_risk > b.second.max_risk; });
        if (actors.size() > cfg_.report_top_n)
            actors.resize(cfg_.report_top_n);

        nlohmann::json top_types = nlohmann::json::array();
        for (const auto &[type, count] : types)
            top_types.push_back({{"type", type}, {"count", count}});

        nlohmann::json top_actors = nlohmann::json::array();
        for (const auto &[actor, stats] : actors)
            top_actors.push_back({{"actor", actor}, {"risk_score", stats.max_risk}, {"event_count", stats.events}});

        return nlohmann::json{
            {"timestamp", to_epoch_ms(now)},
            {"period_hours", std::chrono::duration_cast<std::chrono::hours>(cfg_.report_window).count()},
            {"summary",
             {{"total_events", recent.size()},
              {"critical_events", critical},
              {"high_risk_events", high_risk},
              {"events_by_type", by_type},
              {"events_by_severity", by_severity},
              {"active_incidents", stores_.incidents.active_count()},
              {"blocked_networks", stores_.blocks.blocked_network_count()},
              {"blocked_accounts", stores_.blocks.blocked_account_count()},
              {"top_event_types", top_types},
              {"top_risk_actors", top_actors}}}};
    }

    nlohmann::json Housekeeper::summary_report()
    {
        auto report = build_summary();
        observability_->emit_report(report);
        return report;
    }

} // namespace warden
