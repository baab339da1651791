#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace warden
{
    /**
     * Per-client token buckets guarding the HTTP surface. A refused request
     * reports how long until the next token, which the server returns as
     * Retry-After. Idle clients are dropped by prune_idle().
     */
    class RateLimiter
    {
    public:
        struct Config
        {
            double tokens_per_second{1.0};
            double burst_capacity{60.0};
        };

        struct Decision
        {
            bool allowed{false};
            double remaining{0.0};
            Duration retry_after{};
        };

        explicit RateLimiter(std::shared_ptr<const Clock> clock);
        RateLimiter(const Config &cfg, std::shared_ptr<const Clock> clock);

        /** Take one token for client if available. */
        Decision check(const std::string &client);

        bool allow(const std::string &client) { return check(client).allowed; }

        double available(const std::string &client);

        /** Forget clients not seen for idle; returns how many were dropped. */
        std::size_t prune_idle(Duration idle);

        std::size_t tracked() const;

        const Config &config() const { return cfg_; }

    private:
        struct Bucket
        {
            double tokens{0.0};
            Timestamp last_seen{};
        };

        Bucket &bucket_for(const std::string &client, Timestamp now);

        Config cfg_;
        std::shared_ptr<const Clock> clock_;
        std::unordered_map<std::string, Bucket> buckets_;
        mutable std::mutex mutex_;
    };
}
