#pragma once

#include "block_list.hpp"
#include "boundaries.hpp"
#include "clock.hpp"
#include "event_log.hpp"
#include "incident.hpp"
#include "risk_ledger.hpp"
#include "scheduler.hpp"
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace warden
{

    struct HousekeepingConfig
    {
        Duration decay_period{std::chrono::seconds(30)};
        Duration metrics_period{std::chrono::seconds(30)};
        Duration retention_period{std::chrono::hours(6)};
        Duration report_period{std::chrono::hours(24)};

        Duration event_retention{std::chrono::hours(24 * 90)};
        Duration incident_retention{std::chrono::hours(24 * 365)};
        Duration metrics_window{std::chrono::minutes(5)};
        Duration report_window{std::chrono::hours(24)};
        std::size_t report_top_n{10};
    };

    /**
     * Periodic maintenance over the engine's stores. Each job is independent:
     * an exception inside one is logged and counted, and the job runs again
     * on its next tick.
     */
    class Housekeeper
    {
    public:
        struct Stores
        {
            EventLog &events;
            IncidentCorrelator &incidents;
            RiskLedger &ledger;
            const BlockList &blocks;
        };

        Housekeeper(HousekeepingConfig cfg,
                    Stores stores,
                    std::shared_ptr<ObservabilitySink> observability,
                    std::shared_ptr<const Clock> clock);

        /** Register decay, metrics, retention and report jobs. */
        void start(Scheduler &scheduler);

        void decay_tick();
        void emit_metrics();

        struct SweepResult
        {
            std::size_t events_removed{0};
            std::size_t incidents_removed{0};
        };
        SweepResult retention_sweep();

        /** Builds and emits the periodic report; returns what was emitted. */
        nlohmann::json summary_report();

        /** Report body over the configured window ending now */
        nlohmann::json build_summary() const;

        /** Run fn, logging and counting any exception under name. */
        bool run_guarded(const std::string &name, const std::function<void()> &fn);

        std::map<std::string, std::size_t> job_failures() const;

        const HousekeepingConfig &config() const { return cfg_; }

    private:
        HousekeepingConfig cfg_;
        Stores stores_;
        std::shared_ptr<ObservabilitySink> observability_;
        std::shared_ptr<const Clock> clock_;

        mutable std::mutex failures_mutex_;
        std::map<std::string, std::size_t> failures_;
    };

} // namespace warden
