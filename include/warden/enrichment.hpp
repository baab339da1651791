#pragma once

#include "clock.hpp"
#include "crypto.hpp"
#include "event.hpp"
#include "risk_ledger.hpp"
#include "threat_intel.hpp"
#include "types.hpp"
#include <string_view>

namespace warden
{
    /**
     * Indicator tags attached to Event::detection.indicators
     */
    namespace indicators
    {
        inline constexpr std::string_view kKnownThreatActor = "known-threat-actor";
        inline constexpr std::string_view kPrivateNetwork = "private-network";
        inline constexpr std::string_view kSqlInjection = "sql-injection-pattern";
        inline constexpr std::string_view kScriptInjection = "script-injection-pattern";
        inline constexpr std::string_view kSuspiciousAgent = "suspicious-agent";
        inline constexpr std::string_view kHighRiskCountry = "high-risk-country";
    }

    /**
     * Turns a RawOccurrence into an Event: validates the type, hashes raw
     * identifiers, assigns severity, computes the risk score and indicators.
     * Does not mutate any store.
     */
    class Enricher
    {
    public:
        static constexpr double kKnownThreatBonus = 30.0;
        static constexpr double kHighRiskCountryBonus = 20.0;
        static constexpr double kAdminRoleBonus = 15.0;

        Enricher(crypto::IdentityHasher hasher,
                 const ThreatIntel &intel,
                 const RiskLedger &ledger,
                 const Clock &clock);

        Result<Event> enrich(const RawOccurrence &raw) const;

        std::string hash_network(std::string_view address) const { return hasher_.hash_network(address); }
        std::string hash_account(std::string_view email) const { return hasher_.hash_account(email); }

        static Severity severity_for(EventType type);
        static double base_risk_for(EventType type);

        static bool is_private_address(std::string_view address);
        static bool contains_sql_patterns(std::string_view input);
        static bool contains_script_patterns(std::string_view input);
        static bool is_suspicious_agent(std::string_view user_agent);

    private:
        crypto::IdentityHasher hasher_;
        const ThreatIntel &intel_;
        const RiskLedger &ledger_;
        const Clock &clock_;
    };

} // namespace warden
