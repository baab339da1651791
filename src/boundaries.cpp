#include "warden/boundaries.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    Result<void> LoggingNotificationSink::send(const std::string &channel,
                                               const std::vector<std::string> &recipients,
                                               const std::string &message,
                                               Severity severity)
    {
        spdlog::error("[alert:{}] severity={} recipients={} {}",
                      channel, severity_to_string(severity), recipients.size(), message);
        return {};
    }

    Result<void> LoggingEscalationSink::escalate(const Event &event, const Rule &rule)
    {
        spdlog::error("security incident escalated: event={} rule={} severity={}",
                      event.id, rule.id, severity_to_string(rule.severity));
        return {};
    }

    Result<void> LoggingQuarantineSink::quarantine(const std::string &resource_ref)
    {
        spdlog::warn("resource quarantined: {}", resource_ref);
        return {};
    }

    void LoggingObservabilitySink::emit_metric(const std::string &name, double value, const Tags &tags)
    {
        nlohmann::json j{{"metric", name}, {"value", value}, {"tags", tags}};
        spdlog::debug("metric {}", j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void LoggingObservabilitySink::emit_report(const nlohmann::json &summary)
    {
        spdlog::info("security report {}", summary.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

} // namespace warden
