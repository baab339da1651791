#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace warden
{
    /**
     * Periodic job registry. Jobs must not throw; Housekeeper wraps its jobs
     * before registering them.
     */
    class Scheduler
    {
    public:
        using Job = std::function<void()>;

        virtual ~Scheduler() = default;

        /** Run job every period, first run one period from now. */
        virtual void schedule_every(std::string name, Duration period, Job job) = 0;

        /** Cancel all jobs. No job starts after stop() returns. */
        virtual void stop() = 0;
    };

    /**
     * Scheduler backed by boost::asio::steady_timer on a caller-owned io_context.
     * Each job owns a strand; its timer is only touched from that strand, so
     * the io_context may be run from several threads.
     */
    class AsioScheduler : public Scheduler
    {
    public:
        explicit AsioScheduler(boost::asio::io_context &ioc);
        ~AsioScheduler() override;

        void schedule_every(std::string name, Duration period, Job job) override;
        void stop() override;

    private:
        using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

        struct Entry
        {
            Entry(std::string name, Duration period, Job job, Strand strand,
                  std::shared_ptr<std::atomic<bool>> stopped)
                : name(std::move(name)),
                  period(period),
                  job(std::move(job)),
                  strand(strand),
                  timer(strand),
                  stopped(std::move(stopped))
            {
            }

            std::string name;
            Duration period;
            Job job;
            Strand strand;
            boost::asio::steady_timer timer;
            std::shared_ptr<std::atomic<bool>> stopped;
        };

        /** Must run on entry->strand. */
        static void arm(const std::shared_ptr<Entry> &entry);

        boost::asio::io_context &ioc_;
        std::mutex mutex_;
        std::vector<std::shared_ptr<Entry>> entries_;
        std::shared_ptr<std::atomic<bool>> stopped_;
    };

    /**
     * Deterministic scheduler driven by a ManualClock. advance() moves the
     * clock forward and fires every job that came due, oldest deadline first.
     */
    class ManualScheduler : public Scheduler
    {
    public:
        explicit ManualScheduler(std::shared_ptr<ManualClock> clock);

        void schedule_every(std::string name, Duration period, Job job) override;
        void stop() override;

        /** Advance virtual time, returning the number of job runs. */
        std::size_t advance(Duration d);

        std::size_t job_count() const { return jobs_.size(); }

    private:
        struct Entry
        {
            std::string name;
            Duration period;
            Job job;
            Timestamp next_due;
        };

        std::shared_ptr<ManualClock> clock_;
        std::vector<Entry> jobs_;
    };

} // namespace warden
