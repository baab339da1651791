#pragma once

#include "warden/boundaries.hpp"
#include "warden/config.hpp"
#include "warden/event.hpp"
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden::testing
{
    struct SentAlert
    {
        std::string channel;
        std::string message;
        Severity severity;
    };

    class RecordingNotifier : public NotificationSink
    {
    public:
        Result<void> send(const std::string &channel,
                          const std::vector<std::string> &,
                          const std::string &message,
                          Severity severity) override
        {
            std::lock_guard lock(mutex_);
            sent_.push_back({channel, message, severity});
            return {};
        }

        std::vector<SentAlert> sent() const
        {
            std::lock_guard lock(mutex_);
            return sent_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<SentAlert> sent_;
    };

    class FailingNotifier : public NotificationSink
    {
    public:
        Result<void> send(const std::string &channel,
                          const std::vector<std::string> &,
                          const std::string &,
                          Severity) override
        {
            return std::unexpected(WardenError::dispatch(channel + " transport down"));
        }
    };

    class ThrowingQuarantine : public QuarantineSink
    {
    public:
        Result<void> quarantine(const std::string &) override
        {
            throw std::runtime_error("quarantine service unreachable");
        }
    };

    class RecordingEscalation : public EscalationSink
    {
    public:
        Result<void> escalate(const Event &event, const Rule &) override
        {
            escalated.push_back(event.id);
            return {};
        }

        std::vector<std::string> escalated;
    };

    class RecordingObservability : public ObservabilitySink
    {
    public:
        void emit_metric(const std::string &name, double value, const Tags &) override
        {
            std::lock_guard lock(mutex_);
            metrics.emplace_back(name, value);
        }

        void emit_report(const nlohmann::json &summary) override
        {
            std::lock_guard lock(mutex_);
            reports.push_back(summary);
        }

        bool has_metric(const std::string &name) const
        {
            std::lock_guard lock(mutex_);
            for (const auto &[n, _] : metrics)
            {
                if (n == name)
                    return true;
            }
            return false;
        }

        mutable std::mutex mutex_;
        std::vector<std::pair<std::string, double>> metrics;
        std::vector<nlohmann::json> reports;
    };

    /** Observability sink whose metric path always throws */
    class BrokenMetrics : public RecordingObservability
    {
    public:
        void emit_metric(const std::string &, double, const Tags &) override
        {
            throw std::runtime_error("metrics backend down");
        }
    };

    inline RawOccurrence occurrence(const std::string &type, const std::string &address = "203.0.113.7")
    {
        RawOccurrence raw;
        raw.type = type;
        raw.source.address = address;
        raw.source.user_agent = "Mozilla/5.0";
        raw.request.method = "POST";
        raw.request.path = "/login";
        return raw;
    }

    inline Event make_event(const std::string &actor, EventType type, Timestamp ts, std::string path = "/login")
    {
        static int counter = 0;
        Event e;
        e.id = "evt_test" + std::to_string(++counter);
        e.type = type;
        e.timestamp = ts;
        e.actor.network_hash = actor;
        e.target.path = std::move(path);
        return e;
    }

    inline WardenConfig test_config()
    {
        WardenConfig cfg;
        cfg.hash_salt = "test-salt";
        cfg.use_default_rules = false;
        cfg.alerting.channels = {{"chat", {"#security"}}};
        return cfg;
    }

} // namespace warden::testing
