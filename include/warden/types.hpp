#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warden
{

    using Timestamp = std::chrono::system_clock::time_point;
    using Duration = std::chrono::milliseconds;

    /**
     * Ordered severity scale shared by events, rules and incidents.
     * info < low < medium < high < critical
     */
    enum class Severity
    {
        Info = 0,
        Low = 1,
        Medium = 2,
        High = 3,
        Critical = 4
    };

    std::string severity_to_string(Severity severity);

    /**
     * Parse a severity name. Unknown names map to Medium.
     */
    Severity severity_from_string(std::string_view s);

    inline bool operator>=(Severity a, Severity b)
    {
        return static_cast<int>(a) >= static_cast<int>(b);
    }

    inline bool operator<=(Severity a, Severity b)
    {
        return static_cast<int>(a) <= static_cast<int>(b);
    }

    inline bool operator>(Severity a, Severity b)
    {
        return static_cast<int>(a) > static_cast<int>(b);
    }

    inline bool operator<(Severity a, Severity b)
    {
        return static_cast<int>(a) < static_cast<int>(b);
    }

    /**
     * Closed set of event kinds accepted at ingestion.
     */
    enum class EventType
    {
        // Authentication
        LoginSuccess,
        LoginFailure,
        Logout,
        PasswordChange,
        PasswordReset,
        AccountLockout,
        MfaEnabled,
        MfaDisabled,
        // Authorization
        UnauthorizedAccess,
        PrivilegeEscalation,
        PermissionDenied,
        AdminAccess,
        // API
        ApiKeyCreated,
        ApiKeyDeleted,
        ApiRateLimitExceeded,
        InvalidApiKey,
        // Data
        DataExport,
        DataDeletion,
        SensitiveDataAccess,
        PiiAccess,
        // Attacks
        SqlInjection,
        XssAttempt,
        CsrfAttempt,
        BruteForce,
        BotDetection,
        SuspiciousPattern,
        // System
        ConfigurationChange,
        SecurityPolicyViolation,
        FileIntegrityViolation,
        MalwareDetected,
        // Network
        SuspiciousIp,
        GeolocationAnomaly,
        TrafficAnomaly,
        DdosAttempt
    };

    std::string event_type_to_string(EventType type);
    std::optional<EventType> event_type_from_string(std::string_view s);

    /**
     * Response vocabulary a rule may list. Unknown configured names map to Log.
     */
    enum class ActionKind
    {
        Log,
        Alert,
        BlockActor,
        BlockAccount,
        RequireSecondFactor,
        Escalate,
        Quarantine
    };

    std::string action_kind_to_string(ActionKind kind);
    ActionKind action_kind_from_string(std::string_view s);

    enum class IncidentStatus
    {
        Open,
        Investigating,
        Resolved,
        FalsePositive
    };

    std::string incident_status_to_string(IncidentStatus status);
    std::optional<IncidentStatus> incident_status_from_string(std::string_view s);

    inline bool is_terminal(IncidentStatus status)
    {
        return status == IncidentStatus::Resolved || status == IncidentStatus::FalsePositive;
    }

    /**
     * Error categories for Warden operations
     */
    enum class ErrorCode
    {
        ValidationError,
        ConfigurationError,
        DispatchError,
        TransitionError,
        CryptoError,
        NotFound,
        AlreadyExists,
        IOError,
        ParsingError,
        InternalError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * Warden error with code and message
     */
    class WardenError : public std::runtime_error
    {
    public:
        ErrorCode code;

        WardenError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static WardenError validation(const std::string &msg)
        {
            return WardenError(ErrorCode::ValidationError, msg);
        }

        static WardenError configuration(const std::string &msg)
        {
            return WardenError(ErrorCode::ConfigurationError, msg);
        }

        static WardenError dispatch(const std::string &msg)
        {
            return WardenError(ErrorCode::DispatchError, msg);
        }

        static WardenError transition(const std::string &msg)
        {
            return WardenError(ErrorCode::TransitionError, msg);
        }

        static WardenError crypto(const std::string &msg)
        {
            return WardenError(ErrorCode::CryptoError, msg);
        }

        static WardenError not_found(const std::string &msg)
        {
            return WardenError(ErrorCode::NotFound, msg);
        }

        static WardenError already_exists(const std::string &msg)
        {
            return WardenError(ErrorCode::AlreadyExists, msg);
        }

        static WardenError io(const std::string &msg)
        {
            return WardenError(ErrorCode::IOError, msg);
        }

        static WardenError parsing(const std::string &msg)
        {
            return WardenError(ErrorCode::ParsingError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, WardenError>;

    /** Milliseconds since the Unix epoch, the wire form of every timestamp. */
    inline std::int64_t to_epoch_ms(Timestamp ts)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    inline Timestamp from_epoch_ms(std::int64_t ms)
    {
        return Timestamp{std::chrono::milliseconds{ms}};
    }

    /** ISO 8601 UTC with millisecond precision */
    std::string to_iso8601(Timestamp ts);

} // namespace warden
