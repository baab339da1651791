#include "warden/types.hpp"
#include <array>
#include <format>
#include <ctime>
#include <utility>

namespace warden
{

    namespace
    {
        constexpr std::array<std::pair<EventType, std::string_view>, 34> kEventTypeNames = {{
            {EventType::LoginSuccess, "login_success"},
            {EventType::LoginFailure, "login_failure"},
            {EventType::Logout, "logout"},
            {EventType::PasswordChange, "password_change"},
            {EventType::PasswordReset, "password_reset"},
            {EventType::AccountLockout, "account_lockout"},
            {EventType::MfaEnabled, "mfa_enabled"},
            {EventType::MfaDisabled, "mfa_disabled"},
            {EventType::UnauthorizedAccess, "unauthorized_access"},
            {EventType::PrivilegeEscalation, "privilege_escalation"},
            {EventType::PermissionDenied, "permission_denied"},
            {EventType::AdminAccess, "admin_access"},
            {EventType::ApiKeyCreated, "api_key_created"},
            {EventType::ApiKeyDeleted, "api_key_deleted"},
            {EventType::ApiRateLimitExceeded, "api_rate_limit_exceeded"},
            {EventType::InvalidApiKey, "invalid_api_key"},
            {EventType::DataExport, "data_export"},
            {EventType::DataDeletion, "data_deletion"},
            {EventType::SensitiveDataAccess, "sensitive_data_access"},
            {EventType::PiiAccess, "pii_access"},
            {EventType::SqlInjection, "sql_injection"},
            {EventType::XssAttempt, "xss_attempt"},
            {EventType::CsrfAttempt, "csrf_attempt"},
            {EventType::BruteForce, "brute_force"},
            {EventType::BotDetection, "bot_detection"},
            {EventType::SuspiciousPattern, "suspicious_pattern"},
            {EventType::ConfigurationChange, "configuration_change"},
            {EventType::SecurityPolicyViolation, "security_policy_violation"},
            {EventType::FileIntegrityViolation, "file_integrity_violation"},
            {EventType::MalwareDetected, "malware_detected"},
            {EventType::SuspiciousIp, "suspicious_ip"},
            {EventType::GeolocationAnomaly, "geolocation_anomaly"},
            {EventType::TrafficAnomaly, "traffic_anomaly"},
            {EventType::DdosAttempt, "ddos_attempt"},
        }};
    } // namespace

    std::string severity_to_string(Severity severity)
    {
        switch (severity)
        {
        case Severity::Info:
            return "info";
        case Severity::Low:
            return "low";
        case Severity::Medium:
            return "medium";
        case Severity::High:
            return "high";
        case Severity::Critical:
            return "critical";
        }
        return "medium";
    }

    Severity severity_from_string(std::string_view s)
    {
        if (s == "info")
            return Severity::Info;
        if (s == "low")
            return Severity::Low;
        if (s == "high")
            return Severity::High;
        if (s == "critical")
            return Severity::Critical;
        return Severity::Medium;
    }

    std::string event_type_to_string(EventType type)
    {
        for (const auto &[t, name] : kEventTypeNames)
        {
            if (t == type)
                return std::string{name};
        }
        return "unknown";
    }

    std::optional<EventType> event_type_from_string(std::string_view s)
    {
        for (const auto &[t, name] : kEventTypeNames)
        {
            if (name == s)
                return t;
        }
        return std::nullopt;
    }

    std::string action_kind_to_string(ActionKind kind)
    {
        switch (kind)
        {
        case ActionKind::Log:
            return "log";
        case ActionKind::Alert:
            return "alert";
        case ActionKind::BlockActor:
            return "block-actor";
        case ActionKind::BlockAccount:
            return "block-account";
        case ActionKind::RequireSecondFactor:
            return "require-second-factor";
        case ActionKind::Escalate:
            return "escalate";
        case ActionKind::Quarantine:
            return "quarantine";
        }
        return "log";
    }

    ActionKind action_kind_from_string(std::string_view s)
    {
        if (s == "alert")
            return ActionKind::Alert;
        if (s == "block-actor" || s == "block_ip")
            return ActionKind::BlockActor;
        if (s == "block-account" || s == "block_user")
            return ActionKind::BlockAccount;
        if (s == "require-second-factor" || s == "require_mfa")
            return ActionKind::RequireSecondFactor;
        if (s == "escalate")
            return ActionKind::Escalate;
        if (s == "quarantine")
            return ActionKind::Quarantine;
        return ActionKind::Log;
    }

    std::string incident_status_to_string(IncidentStatus status)
    {
        switch (status)
        {
        case IncidentStatus::Open:
            return "open";
        case IncidentStatus::Investigating:
            return "investigating";
        case IncidentStatus::Resolved:
            return "resolved";
        case IncidentStatus::FalsePositive:
            return "false_positive";
        }
        return "open";
    }

    std::optional<IncidentStatus> incident_status_from_string(std::string_view s)
    {
        if (s == "open")
            return IncidentStatus::Open;
        if (s == "investigating")
            return IncidentStatus::Investigating;
        if (s == "resolved")
            return IncidentStatus::Resolved;
        if (s == "false_positive")
            return IncidentStatus::FalsePositive;
        return std::nullopt;
    }

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ValidationError:
            return "validation_error";
        case ErrorCode::ConfigurationError:
            return "configuration_error";
        case ErrorCode::DispatchError:
            return "dispatch_error";
        case ErrorCode::TransitionError:
            return "transition_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::AlreadyExists:
            return "already_exists";
        case ErrorCode::IOError:
            return "io_error";
        case ErrorCode::ParsingError:
            return "parsing_error";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "internal_error";
    }

    std::string to_iso8601(Timestamp ts)
    {
        auto t = std::chrono::system_clock::to_time_t(ts);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

} // namespace warden
