#include "warden/rate_limiter.hpp"
#include <algorithm>
#include <cmath>

namespace warden
{
    RateLimiter::RateLimiter(std::shared_ptr<const Clock> clock)
        : RateLimiter(Config{}, std::move(clock)) {}

    RateLimiter::RateLimiter(const Config &cfg, std::shared_ptr<const Clock> clock)
        : cfg_(cfg), clock_(std::move(clock)) {}

    RateLimiter::Bucket &RateLimiter::bucket_for(const std::string &client, Timestamp now)
    {
        auto [it, fresh] = buckets_.try_emplace(client, Bucket{cfg_.burst_capacity, now});
        auto &bucket = it->second;
        if (fresh || now <= bucket.last_seen)
            return bucket;

        const double elapsed = std::chrono::duration<double>(now - bucket.last_seen).count();
        bucket.tokens = std::min(cfg_.burst_capacity, bucket.tokens + elapsed * cfg_.tokens_per_second);
        bucket.last_seen = now;
        return bucket;
    }

    RateLimiter::Decision RateLimiter::check(const std::string &client)
    {
        const auto now = clock_->now();
        std::lock_guard lock(mutex_);
        auto &bucket = bucket_for(client, now);

        if (bucket.tokens >= 1.0)
        {
            bucket.tokens -= 1.0;
            return Decision{true, bucket.tokens, Duration::zero()};
        }

        Decision refused{false, bucket.tokens, Duration::zero()};
        if (cfg_.tokens_per_second > 0.0)
        {
            const double wait_ms = std::ceil((1.0 - bucket.tokens) / cfg_.tokens_per_second * 1000.0);
            refused.retry_after = Duration(static_cast<Duration::rep>(wait_ms));
        }
        return refused;
    }

    double RateLimiter::available(const std::string &client)
    {
        const auto now = clock_->now();
        std::lock_guard lock(mutex_);
        return bucket_for(client, now).tokens;
    }

    std::size_t RateLimiter::prune_idle(Duration idle)
    {
        const auto cutoff = clock_->now() - idle;
        std::lock_guard lock(mutex_);
        return std::erase_if(buckets_, [&](const auto &entry)
                             { return entry.second.last_seen < cutoff; });
    }

    std::size_t RateLimiter::tracked() const
    {
        std::lock_guard lock(mutex_);
        return buckets_.size();
    }

} // namespace warden
