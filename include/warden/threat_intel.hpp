#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace warden
{

    struct ThreatIndicator
    {
        std::string network_hash;
        std::string source;
        Severity severity{Severity::High};
        double confidence{1.0};
        std::set<std::string> tags;
        Timestamp first_seen{};
        Timestamp last_seen{};

        nlohmann::json to_json() const;
    };

    /**
     * Reputation data consulted during enrichment: known-bad hashed network
     * identities and the high-risk country list.
     */
    class ThreatIntel
    {
    public:
        explicit ThreatIntel(std::vector<std::string> high_risk_countries = {});

        /** Insert or refresh an indicator; first_seen is kept on refresh. */
        void upsert(ThreatIndicator indicator);

        bool is_known_threat(std::string_view network_hash) const;
        bool is_high_risk_country(std::string_view country) const;

        std::vector<ThreatIndicator> list() const;
        std::size_t size() const;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, ThreatIndicator> indicators_;
        std::unordered_set<std::string> high_risk_countries_;
    };

} // namespace warden
