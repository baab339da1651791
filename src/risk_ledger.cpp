#include "warden/risk_ledger.hpp"
#include <algorithm>

namespace warden
{
    RiskLedger::RiskLedger() : cfg_{} {}

    RiskLedger::RiskLedger(const Config &cfg) : cfg_(cfg) {}

    double RiskLedger::bump(const std::string &actor, double delta, Timestamp now)
    {
        std::lock_guard lock(mutex_);
        auto &record = records_[actor];
        record.score = std::clamp(record.score + delta * cfg_.contribution, 0.0, 100.0);
        record.last_updated = now;
        return record.score;
    }

    std::size_t RiskLedger::decay_tick(Timestamp /*now*/)
    {
        std::lock_guard lock(mutex_);
        std::size_t evicted = 0;
        for (auto it = records_.begin(); it != records_.end();)
        {
            it->second.score *= cfg_.decay_factor;
            if (it->second.score < cfg_.eviction_floor)
            {
                it = records_.erase(it);
                ++evicted;
                continue;
            }
            ++it;
        }
        return evicted;
    }

    double RiskLedger::get(std::string_view actor) const
    {
        std::lock_guard lock(mutex_);
        auto it = records_.find(std::string(actor));
        return it == records_.end() ? 0.0 : it->second.score;
    }

    std::size_t RiskLedger::size() const
    {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    std::vector<std::pair<std::string, double>> RiskLedger::top(std::size_t n) const
    {
        std::vector<std::pair<std::string, double>> out;
        {
            std::lock_guard lock(mutex_);
            out.reserve(records_.size());
            for (const auto &[actor, record] : records_)
            {
                out.emplace_back(actor, record.score);
            }
        }
        std::sort(out.begin(), out.end(), [](const auto &a, const auto &b)
                  { return a.second > b.second; });
        if (out.size() > n)
            out.resize(n);
        return out;
    }

} // namespace warden
