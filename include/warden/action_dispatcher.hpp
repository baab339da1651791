#pragma once

#include "block_list.hpp"
#include "boundaries.hpp"
#include "clock.hpp"
#include "event.hpp"
#include "rule.hpp"
#include "types.hpp"
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace warden
{

    struct AlertChannel
    {
        std::string kind; // chat, email, webhook, paging, sms, ...
        std::vector<std::string> recipients;
    };

    struct AlertingConfig
    {
        std::vector<AlertChannel> channels{{"chat", {}}, {"email", {}}};
        std::set<Severity> alert_severities{Severity::Medium, Severity::High, Severity::Critical};
        bool escalation_enabled{true};
    };

    enum class ActionStatus
    {
        Succeeded,
        Failed,
        Skipped
    };

    std::string action_status_to_string(ActionStatus status);

    struct ActionOutcome
    {
        std::string rule_id;
        std::string event_id;
        ActionKind action{ActionKind::Log};
        ActionStatus status{ActionStatus::Succeeded};
        std::string detail;
        Timestamp at{};

        nlohmann::json to_json() const;
    };

    /**
     * Runs a triggered rule's actions in declared order. Work is posted to a
     * strand over the injected executor, so the caller never waits on a
     * boundary call and triggers are processed one at a time. Each action is
     * isolated: a failure is logged and journaled and the next action runs.
     */
    class ActionDispatcher : public std::enable_shared_from_this<ActionDispatcher>
    {
    public:
        static constexpr std::size_t kJournalCapacity = 1000;

        struct Sinks
        {
            std::shared_ptr<NotificationSink> notifier;
            std::shared_ptr<EscalationSink> escalation;
            std::shared_ptr<QuarantineSink> quarantine;
        };

        ActionDispatcher(AlertingConfig cfg,
                         Sinks sinks,
                         std::shared_ptr<BlockList> blocks,
                         std::shared_ptr<const Clock> clock,
                         boost::asio::any_io_executor executor);

        /** Queue the rule's actions for event. Returns immediately. */
        void dispatch(const Rule &rule, const Event &event);

        /** Execute the rule's actions on the calling thread. */
        std::vector<ActionOutcome> run_actions(const Rule &rule, const Event &event);

        /** Journal of recent outcomes, oldest first */
        std::vector<ActionOutcome> outcomes() const;

        /** Triggers queued but not yet finished */
        std::size_t pending() const { return pending_.load(); }

        std::string render_alert(const Rule &rule, const Event &event) const;

    private:
        ActionOutcome execute(ActionKind action, const Rule &rule, const Event &event);
        ActionOutcome alert(ActionOutcome outcome, const Rule &rule, const Event &event);
        void record(const ActionOutcome &outcome);

        AlertingConfig cfg_;
        Sinks sinks_;
        std::shared_ptr<BlockList> blocks_;
        std::shared_ptr<const Clock> clock_;
        boost::asio::strand<boost::asio::any_io_executor> strand_;
        std::atomic<std::size_t> pending_{0};

        mutable std::mutex journal_mutex_;
        std::deque<ActionOutcome> journal_;
    };

} // namespace warden
