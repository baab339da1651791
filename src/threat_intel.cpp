#include "warden/threat_intel.hpp"
#include <mutex>

namespace warden
{

    nlohmann::json ThreatIndicator::to_json() const
    {
        return nlohmann::json{
            {"network_hash", network_hash},
            {"source", source},
            {"severity", severity_to_string(severity)},
            {"confidence", confidence},
            {"tags", tags},
            {"first_seen", to_epoch_ms(first_seen)},
            {"last_seen", to_epoch_ms(last_seen)}};
    }

    ThreatIntel::ThreatIntel(std::vector<std::string> high_risk_countries)
        : high_risk_countries_(high_risk_countries.begin(), high_risk_countries.end())
    {
    }

    void ThreatIntel::upsert(ThreatIndicator indicator)
    {
        std::unique_lock lock(mutex_);
        auto it = indicators_.find(indicator.network_hash);
        if (it != indicators_.end())
        {
            indicator.first_seen = it->second.first_seen;
            indicator.tags.insert(it->second.tags.begin(), it->second.tags.end());
            it->second = std::move(indicator);
            return;
        }
        auto key = indicator.network_hash;
        indicators_.emplace(std::move(key), std::move(indicator));
    }

    bool ThreatIntel::is_known_threat(std::string_view network_hash) const
    {
        std::shared_lock lock(mutex_);
        return indicators_.contains(std::string(network_hash));
    }

    bool ThreatIntel::is_high_risk_country(std::string_view country) const
    {
        std::shared_lock lock(mutex_);
        return high_risk_countries_.contains(std::string(country));
    }

    std::vector<ThreatIndicator> ThreatIntel::list() const
    {
        std::shared_lock lock(mutex_);
        std::vector<ThreatIndicator> out;
        out.reserve(indicators_.size());
        for (const auto &[_, indicator] : indicators_)
        {
            out.push_back(indicator);
        }
        return out;
    }

    std::size_t ThreatIntel::size() const
    {
        std::shared_lock lock(mutex_);
        return indicators_.size();
    }

} // namespace warden
