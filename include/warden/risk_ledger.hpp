#pragma once

#include "types.hpp"
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden
{
    /**
     * Thread-safe per-actor risk score keyed by hashed network identity.
     * Scores grow by a tenth of each event's risk and decay multiplicatively
     * on every housekeeping tick. Always within [0, 100].
     */
    class RiskLedger
    {
    public:
        struct Config
        {
            double contribution{0.1};    // share of an event's risk added per bump
            double decay_factor{0.999};  // per decay tick, strictly in (0, 1)
            double eviction_floor{0.01}; // scores below this are forgotten
        };

        struct Record
        {
            double score{0.0};
            Timestamp last_updated{};
        };

        RiskLedger();
        explicit RiskLedger(const Config &cfg);

        /** Add delta * contribution, clamped to [0, 100]. Returns the new score. */
        double bump(const std::string &actor, double delta, Timestamp now);

        /** Decay every tracked actor once; returns the number evicted. */
        std::size_t decay_tick(Timestamp now);

        /** Current score, 0 for unknown actors. */
        double get(std::string_view actor) const;

        std::size_t size() const;

        /** Highest scores first */
        std::vector<std::pair<std::string, double>> top(std::size_t n) const;

        const Config &config() const { return cfg_; }

    private:
        Config cfg_;
        std::unordered_map<std::string, Record> records_;
        mutable std::mutex mutex_;
    };
}
