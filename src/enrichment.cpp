#include "warden/enrichment.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <regex>
#include <utility>

namespace warden
{
    namespace
    {
        constexpr std::array<std::pair<EventType, Severity>, 10> kSeverityTable = {{
            {EventType::SqlInjection, Severity::Critical},
            {EventType::PrivilegeEscalation, Severity::Critical},
            {EventType::MalwareDetected, Severity::Critical},
            {EventType::BruteForce, Severity::High},
            {EventType::DdosAttempt, Severity::High},
            {EventType::XssAttempt, Severity::High},
            {EventType::CsrfAttempt, Severity::High},
            {EventType::DataExport, Severity::Medium},
            {EventType::LoginFailure, Severity::Low},
            {EventType::LoginSuccess, Severity::Info},
        }};

        constexpr std::array<std::pair<EventType, double>, 6> kBaseRiskTable = {{
            {EventType::SqlInjection, 90.0},
            {EventType::BruteForce, 70.0},
            {EventType::XssAttempt, 60.0},
            {EventType::UnauthorizedAccess, 50.0},
            {EventType::LoginFailure, 10.0},
            {EventType::LoginSuccess, 5.0},
        }};

        constexpr double kDefaultBaseRisk = 30.0;

        std::vector<std::regex> compile(std::initializer_list<const char *> patterns)
        {
            std::vector<std::regex> out;
            out.reserve(patterns.size());
            for (const char *p : patterns)
            {
                out.emplace_back(p, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
            }
            return out;
        }

        bool any_match(const std::vector<std::regex> &patterns, std::string_view input)
        {
            return std::any_of(patterns.begin(), patterns.end(), [&](const std::regex &re)
                               { return std::regex_search(input.begin(), input.end(), re); });
        }
    } // namespace

    Enricher::Enricher(crypto::IdentityHasher hasher,
                       const ThreatIntel &intel,
                       const RiskLedger &ledger,
                       const Clock &clock)
        : hasher_(std::move(hasher)), intel_(intel), ledger_(ledger), clock_(clock)
    {
    }

    Result<Event> Enricher::enrich(const RawOccurrence &raw) const
    {
        if (raw.type.empty())
        {
            return std::unexpected(WardenError::validation("event type is required"));
        }
        auto type = event_type_from_string(raw.type);
        if (!type)
        {
            return std::unexpected(WardenError::validation(std::format("unknown event type: {}", raw.type)));
        }
        if (raw.confidence < 0.0 || raw.confidence > 1.0)
        {
            return std::unexpected(WardenError::validation("confidence must be within [0, 1]"));
        }

        Event event;
        event.id = crypto::SecureRandom::generate_id("evt");
        event.type = *type;
        event.severity = severity_for(*type);
        event.timestamp = clock_.now();

        event.actor.network_hash = hasher_.hash_network(raw.source.address);
        if (raw.actor.email && !raw.actor.email->empty())
            event.actor.account_hash = hasher_.hash_account(*raw.actor.email);
        if (raw.actor.id && !raw.actor.id->empty())
            event.actor.account_id_hash = hasher_.hash_account_id(*raw.actor.id);
        event.actor.role = raw.actor.role;
        event.actor.country = raw.source.country;

        event.target = raw.request;
        event.response = raw.response;
        event.context = raw.context;
        if (!event.context.request_id)
            event.context.request_id = crypto::SecureRandom::generate_id("req");
        if (!event.context.metadata.is_object())
            event.context.metadata = nlohmann::json::object();

        const bool known_threat = intel_.is_known_threat(event.actor.network_hash);
        const bool risky_country = raw.source.country && intel_.is_high_risk_country(*raw.source.country);

        double risk = base_risk_for(*type);
        if (known_threat)
            risk += kKnownThreatBonus;
        if (risky_country)
            risk += kHighRiskCountryBonus;
        if (raw.actor.role && *raw.actor.role == "admin")
            risk += kAdminRoleBonus;
        risk += ledger_.get(event.actor.network_hash);

        event.detection.rule_hint = raw.rule_hint.empty() ? "manual" : raw.rule_hint;
        event.detection.confidence = raw.confidence;
        event.detection.risk_score = std::clamp(risk, 0.0, 100.0);

        auto &tags = event.detection.indicators;
        if (known_threat)
            tags.emplace(indicators::kKnownThreatActor);
        if (!raw.source.address.empty() && is_private_address(raw.source.address))
            tags.emplace(indicators::kPrivateNetwork);
        if (contains_sql_patterns(raw.request.path))
            tags.emplace(indicators::kSqlInjection);
        if (contains_script_patterns(raw.request.path))
            tags.emplace(indicators::kScriptInjection);
        if (!raw.source.user_agent.empty() && is_suspicious_agent(raw.source.user_agent))
            tags.emplace(indicators::kSuspiciousAgent);
        if (risky_country)
            tags.emplace(indicators::kHighRiskCountry);

        return event;
    }

    Severity Enricher::severity_for(EventType type)
    {
        for (const auto &[t, severity] : kSeverityTable)
        {
            if (t == type)
                return severity;
        }
        return Severity::Medium;
    }

    double Enricher::base_risk_for(EventType type)
    {
        for (const auto &[t, risk] : kBaseRiskTable)
        {
            if (t == type)
                return risk;
        }
        return kDefaultBaseRisk;
    }

    bool Enricher::is_private_address(std::string_view address)
    {
        static const auto patterns = compile({
            R"(^10\.)",
            R"(^172\.(1[6-9]|2[0-9]|3[0-1])\.)",
            R"(^192\.168\.)",
            R"(^127\.)",
        });
        return any_match(patterns, address);
    }

    bool Enricher::contains_sql_patterns(std::string_view input)
    {
        static const auto patterns = compile({
            R"((\bunion\b.*\bselect\b)|(\bselect\b.*\bunion\b))",
            R"((\bdrop\b.*\btable\b)|(\btable\b.*\bdrop\b))",
            R"((\binsert\b.*\binto\b)|(\binto\b.*\binsert\b))",
            R"((\bupdate\b.*\bset\b)|(\bset\b.*\bupdate\b))",
            R"((\bdelete\b.*\bfrom\b)|(\bfrom\b.*\bdelete\b))",
        });
        return any_match(patterns, input);
    }

    bool Enricher::contains_script_patterns(std::string_view input)
    {
        static const auto patterns = compile({
            R"(<script[^>]*>.*?</script>)",
            R"(javascript:)",
            R"(on\w+\s*=)",
            R"(<iframe[^>]*>)",
            R"(<object[^>]*>)",
        });
        return any_match(patterns, input);
    }

    bool Enricher::is_suspicious_agent(std::string_view user_agent)
    {
        static const auto patterns = compile({"bot", "crawler", "scanner", "curl", "wget"});
        return any_match(patterns, user_agent);
    }

} // namespace warden
