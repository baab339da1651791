#include "warden/action_dispatcher.hpp"
#include <boost/asio/post.hpp>
#include <format>
#include <spdlog/spdlog.h>

namespace warden
{

    std::string action_status_to_string(ActionStatus status)
    {
        switch (status)
        {
        case ActionStatus::Succeeded:
            return "succeeded";
        case ActionStatus::Failed:
            return "failed";
        case ActionStatus::Skipped:
            return "skipped";
        }
        return "failed";
    }

    nlohmann::json ActionOutcome::to_json() const
    {
        return nlohmann::json{
            {"rule_id", rule_id},
            {"event_id", event_id},
            {"action", action_kind_to_string(action)},
            {"status", action_status_to_string(status)},
            {"detail", detail},
            {"at", to_epoch_ms(at)}};
    }

    ActionDispatcher::ActionDispatcher(AlertingConfig cfg,
                                       Sinks sinks,
                                       std::shared_ptr<BlockList> blocks,
                                       std::shared_ptr<const Clock> clock,
                                       boost::asio::any_io_executor executor)
        : cfg_(std::move(cfg)),
          sinks_(std::move(sinks)),
          blocks_(std::move(blocks)),
          clock_(std::move(clock)),
          strand_(boost::asio::make_strand(std::move(executor)))
    {
    }

    void ActionDispatcher::dispatch(const Rule &rule, const Event &event)
    {
        ++pending_;
        boost::asio::post(strand_, [self = shared_from_this(), rule, event]
                          {
            self->run_actions(rule, event);
            --self->pending_; });
    }

    std::vector<ActionOutcome> ActionDispatcher::run_actions(const Rule &rule, const Event &event)
    {
        std::vector<ActionOutcome> results;
        results.reserve(rule.actions.size());

        for (auto action : rule.actions)
        {
            ActionOutcome outcome;
            try
            {
                outcome = execute(action, rule, event);
            }
            catch (const std::exception &e)
            {
                outcome = ActionOutcome{rule.id, event.id, action, ActionStatus::Failed, e.what(), clock_->now()};
            }

            if (outcome.status == ActionStatus::Failed)
            {
                spdlog::error("action {} failed for rule {} event {}: {}",
                              action_kind_to_string(action), rule.id, event.id, outcome.detail);
            }
            record(outcome);
            results.push_back(std::move(outcome));
        }
        return results;
    }

    ActionOutcome ActionDispatcher::execute(ActionKind action, const Rule &rule, const Event &event)
    {
        ActionOutcome outcome{rule.id, event.id, action, ActionStatus::Succeeded, {}, clock_->now()};

        switch (action)
        {
        case ActionKind::Log:
            spdlog::warn("security action: log event={} rule={} type={} actor={} risk={:.1f}",
                         event.id, rule.id, event_type_to_string(event.type),
                         event.actor.network_hash, event.detection.risk_score);
            return outcome;

        case ActionKind::Alert:
            return alert(std::move(outcome), rule, event);

        case ActionKind::BlockActor:
            outcome.detail = blocks_->block_network(event.actor.network_hash) ? "blocked" : "already blocked";
            spdlog::warn("network identity {} {}", event.actor.network_hash, outcome.detail);
            return outcome;

        case ActionKind::BlockAccount:
            if (!event.actor.account_hash)
            {
                outcome.status = ActionStatus::Skipped;
                outcome.detail = "event has no account identity";
                return outcome;
            }
            outcome.detail = blocks_->block_account(*event.actor.account_hash) ? "blocked" : "already blocked";
            spdlog::warn("account {} {}", *event.actor.account_hash, outcome.detail);
            return outcome;

        case ActionKind::RequireSecondFactor:
            if (!event.actor.account_hash)
            {
                outcome.status = ActionStatus::Skipped;
                outcome.detail = "event has no account identity";
                return outcome;
            }
            blocks_->require_second_factor(*event.actor.account_hash);
            outcome.detail = "second factor required";
            spdlog::info("second factor required for account {}", *event.actor.account_hash);
            return outcome;

        case ActionKind::Escalate:
            if (!cfg_.escalation_enabled)
            {
                outcome.status = ActionStatus::Skipped;
                outcome.detail = "escalation disabled";
                return outcome;
            }
            if (auto res = sinks_.escalation->escalate(event, rule); !res)
            {
                outcome.status = ActionStatus::Failed;
                outcome.detail = res.error().what();
            }
            return outcome;

        case ActionKind::Quarantine:
            outcome.detail = event.resource_ref();
            if (auto res = sinks_.quarantine->quarantine(outcome.detail); !res)
            {
                outcome.status = ActionStatus::Failed;
                outcome.detail = res.error().what();
            }
            return outcome;
        }

        outcome.status = ActionStatus::Skipped;
        outcome.detail = "unsupported action";
        return outcome;
    }

    ActionOutcome ActionDispatcher::alert(ActionOutcome outcome, const Rule &rule, const Event &event)
    {
        if (!cfg_.alert_severities.contains(rule.severity))
        {
            outcome.status = ActionStatus::Skipped;
            outcome.detail = std::format("alerting disabled for severity {}", severity_to_string(rule.severity));
            return outcome;
        }
        if (cfg_.channels.empty())
        {
            outcome.status = ActionStatus::Skipped;
            outcome.detail = "no alert channels configured";
            return outcome;
        }

        const auto message = render_alert(rule, event);
        std::vector<std::string> failures;
        for (const auto &channel : cfg_.channels)
        {
            Result<void> res = std::unexpected(WardenError::dispatch("not sent"));
            try
            {
                res = sinks_.notifier->send(channel.kind, channel.recipients, message, rule.severity);
            }
            catch (const std::exception &e)
            {
                res = std::unexpected(WardenError::dispatch(e.what()));
            }
            if (!res)
                failures.push_back(std::format("{}: {}", channel.kind, res.error().what()));
        }

        if (!failures.empty())
        {
            outcome.status = ActionStatus::Failed;
            for (const auto &f : failures)
                outcome.detail += outcome.detail.empty() ? f : "; " + f;
            return outcome;
        }
        outcome.detail = std::format("sent to {} channel(s)", cfg_.channels.size());
        return outcome;
    }

    std::string ActionDispatcher::render_alert(const Rule &rule, const Event &event) const
    {
        return std::format("[{}] {}: {} from {} (event {}, risk {:.0f})",
                           severity_to_string(rule.severity),
                           rule.name,
                           event_type_to_string(event.type),
                           event.actor.network_hash,
                           event.id,
                           event.detection.risk_score);
    }

    void ActionDispatcher::record(const ActionOutcome &outcome)
    {
        std::lock_guard lock(journal_mutex_);
        journal_.push_back(outcome);
        while (journal_.size() > kJournalCapacity)
            journal_.pop_front();
    }

    std::vector<ActionOutcome> ActionDispatcher::outcomes() const
    {
        std::lock_guard lock(journal_mutex_);
        return {journal_.begin(), journal_.end()};
    }

} // namespace warden
