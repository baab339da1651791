#pragma once

#include "event.hpp"
#include "rule.hpp"
#include "types.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace warden
{
    /**
     * Outbound collaborators. Implementations own their own transport,
     * timeout and retry policy; the engine only reports their result.
     */

    class NotificationSink
    {
    public:
        virtual ~NotificationSink() = default;

        /** channel is open-ended: "chat", "email", "webhook", "paging", "sms", ... */
        virtual Result<void> send(const std::string &channel,
                                  const std::vector<std::string> &recipients,
                                  const std::string &message,
                                  Severity severity) = 0;
    };

    class EscalationSink
    {
    public:
        virtual ~EscalationSink() = default;
        virtual Result<void> escalate(const Event &event, const Rule &rule) = 0;
    };

    class QuarantineSink
    {
    public:
        virtual ~QuarantineSink() = default;
        virtual Result<void> quarantine(const std::string &resource_ref) = 0;
    };

    class ObservabilitySink
    {
    public:
        using Tags = std::map<std::string, std::string>;

        virtual ~ObservabilitySink() = default;
        virtual void emit_metric(const std::string &name, double value, const Tags &tags) = 0;
        virtual void emit_report(const nlohmann::json &summary) = 0;
    };

    // Defaults used when the host injects nothing: write to the spdlog logger.

    class LoggingNotificationSink : public NotificationSink
    {
    public:
        Result<void> send(const std::string &channel,
                          const std::vector<std::string> &recipients,
                          const std::string &message,
                          Severity severity) override;
    };

    class LoggingEscalationSink : public EscalationSink
    {
    public:
        Result<void> escalate(const Event &event, const Rule &rule) override;
    };

    class LoggingQuarantineSink : public QuarantineSink
    {
    public:
        Result<void> quarantine(const std::string &resource_ref) override;
    };

    class LoggingObservabilitySink : public ObservabilitySink
    {
    public:
        void emit_metric(const std::string &name, double value, const Tags &tags) override;
        void emit_report(const nlohmann::json &summary) override;
    };

} // namespace warden
