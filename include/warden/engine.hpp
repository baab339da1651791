#pragma once

#include "action_dispatcher.hpp"
#include "audit.hpp"
#include "block_list.hpp"
#include "boundaries.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "enrichment.hpp"
#include "event_log.hpp"
#include "housekeeping.hpp"
#include "incident.hpp"
#include "risk_ledger.hpp"
#include "rule.hpp"
#include "rule_matcher.hpp"
#include "threat_intel.hpp"
#include "types.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden
{

    /**
     * Collaborators injected by the host. Null sinks are replaced by the
     * spdlog-backed defaults; a null clock becomes a SystemClock.
     */
    struct EngineDependencies
    {
        std::shared_ptr<const Clock> clock;
        std::shared_ptr<NotificationSink> notifier;
        std::shared_ptr<EscalationSink> escalation;
        std::shared_ptr<QuarantineSink> quarantine;
        std::shared_ptr<ObservabilitySink> observability;
        boost::asio::any_io_executor dispatch_executor; // required
    };

    /**
     * The correlation engine. Owns every store; there is no global state.
     * record_event() is serialized on an ingest mutex so the event log,
     * risk ledger, incidents and dispatch queue see events in one order.
     * Queries may run concurrently with ingestion.
     */
    class Engine
    {
        struct ConstructionKey
        {
            explicit ConstructionKey() = default;
        };

    public:
        static Result<std::unique_ptr<Engine>> create(const WardenConfig &config, EngineDependencies deps);

        /** Use create(); the key keeps construction inside the class. */
        Engine(ConstructionKey, WardenConfig config, EngineDependencies deps, crypto::IdentityHasher hasher);

        Engine(const Engine &) = delete;
        Engine &operator=(const Engine &) = delete;

        /** Ingest one occurrence. Returns the new event id. */
        Result<std::string> record_event(const RawOccurrence &raw);

        // Rules
        Result<void> add_rule(Rule rule, const std::string &operator_name = "system");
        Result<void> update_rule(Rule rule, const std::string &operator_name = "system");
        Result<void> remove_rule(const std::string &rule_id, const std::string &operator_name = "system");
        Result<void> set_rule_enabled(const std::string &rule_id, bool enabled, const std::string &operator_name = "system");
        std::vector<Rule> rules() const { return rules_.snapshot(); }

        /** Register a known-bad raw address; it is hashed before storage. */
        ThreatIndicator add_threat_indicator(const std::string &raw_address,
                                             const std::string &source,
                                             Severity severity,
                                             std::set<std::string> tags = {});
        std::vector<ThreatIndicator> threat_indicators() const { return intel_.list(); }

        // Incidents
        std::optional<Incident> get_incident(const std::string &incident_id) const;
        std::vector<Incident> list_incidents(std::optional<IncidentStatus> status = std::nullopt) const;
        Result<Incident> set_status(const std::string &incident_id,
                                    IncidentStatus next,
                                    const std::string &operator_name,
                                    const std::string &note,
                                    std::optional<Resolution> resolution = std::nullopt);
        Result<Incident> acknowledge(const std::string &incident_id, const std::string &operator_name);

        // Events
        /** Most recent last */
        std::vector<Event> list_recent_events(std::size_t limit = 100) const;
        std::optional<Event> find_event(const std::string &event_id) const;

        /** Counts over the last 24 hours plus current block and incident totals */
        nlohmann::json metrics_summary() const;

        // Enforcement queries for the request layer
        bool is_network_blocked(std::string_view network_hash) const { return blocks_->is_network_blocked(network_hash); }
        bool is_account_blocked(std::string_view account_hash) const { return blocks_->is_account_blocked(account_hash); }
        bool requires_second_factor(std::string_view account_hash) const { return blocks_->requires_second_factor(account_hash); }
        bool is_blocked_address(std::string_view raw_address) const;
        std::string hash_network(std::string_view raw_address) const { return enricher_.hash_network(raw_address); }
        std::string hash_account(std::string_view email) const { return enricher_.hash_account(email); }

        std::vector<ActionOutcome> action_outcomes() const { return dispatcher_->outcomes(); }
        std::size_t pending_dispatches() const { return dispatcher_->pending(); }
        std::optional<std::string> audit_head() const { return audit_.chain().head(); }
        const AuditChain &audit_chain() const { return audit_.chain(); }

        double risk_of(std::string_view network_hash) const { return ledger_.get(network_hash); }

        Housekeeper &housekeeper() { return housekeeper_; }
        const WardenConfig &config() const { return config_; }

    private:
        void emit_ingest_metrics(const Event &event);

        WardenConfig config_;
        std::shared_ptr<const Clock> clock_;
        std::shared_ptr<ObservabilitySink> observability_;

        ThreatIntel intel_;
        RiskLedger ledger_;
        EventLog events_;
        RuleSet rules_;
        IncidentCorrelator incidents_;
        std::shared_ptr<BlockList> blocks_;

        Enricher enricher_;
        RuleMatcher matcher_;
        std::shared_ptr<ActionDispatcher> dispatcher_;
        AuditLogger audit_;
        Housekeeper housekeeper_;

        std::mutex ingest_mutex_;
    };

} // namespace warden
