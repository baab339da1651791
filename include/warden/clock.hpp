#pragma once

#include "types.hpp"
#include <mutex>

namespace warden
{
    /**
     * Source of wall-clock time for every timestamp the engine records.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual Timestamp now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        Timestamp now() const override
        {
            return std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now());
        }
    };

    /**
     * Clock that only moves when told to. Used by tests and by ManualScheduler.
     */
    class ManualClock : public Clock
    {
    public:
        explicit ManualClock(Timestamp start = from_epoch_ms(1'700'000'000'000))
            : now_(start) {}

        Timestamp now() const override
        {
            std::lock_guard lock(mutex_);
            return now_;
        }

        void advance(Duration d)
        {
            std::lock_guard lock(mutex_);
            now_ += d;
        }

        void set(Timestamp ts)
        {
            std::lock_guard lock(mutex_);
            now_ = ts;
        }

    private:
        mutable std::mutex mutex_;
        Timestamp now_;
    };

} // namespace warden
