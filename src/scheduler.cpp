#include "warden/scheduler.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace warden
{

    AsioScheduler::AsioScheduler(boost::asio::io_context &ioc)
        : ioc_(ioc), stopped_(std::make_shared<std::atomic<bool>>(false))
    {
    }

    AsioScheduler::~AsioScheduler()
    {
        stop();
    }

    void AsioScheduler::schedule_every(std::string name, Duration period, Job job)
    {
        auto entry = std::make_shared<Entry>(std::move(name), period, std::move(job),
                                             boost::asio::make_strand(ioc_), stopped_);
        {
            std::lock_guard lock(mutex_);
            if (stopped_->load())
                return;
            entries_.push_back(entry);
        }
        spdlog::debug("scheduler: '{}' every {} ms", entry->name, entry->period.count());
        boost::asio::post(entry->strand, [entry]
                          { arm(entry); });
    }

    void AsioScheduler::arm(const std::shared_ptr<Entry> &entry)
    {
        if (entry->stopped->load())
            return;
        entry->timer.expires_after(entry->period);
        entry->timer.async_wait([entry](const boost::system::error_code &ec)
                                {
            if (ec == boost::asio::error::operation_aborted || entry->stopped->load())
                return;
            entry->job();
            arm(entry); });
    }

    void AsioScheduler::stop()
    {
        std::vector<std::shared_ptr<Entry>> entries;
        {
            std::lock_guard lock(mutex_);
            stopped_->store(true);
            entries.swap(entries_);
        }
        for (auto &entry : entries)
        {
            boost::asio::post(entry->strand, [entry]
                              { entry->timer.cancel(); });
        }
    }

    ManualScheduler::ManualScheduler(std::shared_ptr<ManualClock> clock)
        : clock_(std::move(clock))
    {
    }

    void ManualScheduler::schedule_every(std::string name, Duration period, Job job)
    {
        jobs_.push_back(Entry{std::move(name), period, std::move(job), clock_->now() + period});
    }

    void ManualScheduler::stop()
    {
        jobs_.clear();
    }

    std::size_t ManualScheduler::advance(Duration d)
    {
        const auto target = clock_->now() + d;
        std::size_t runs = 0;

        while (!jobs_.empty())
        {
            auto next = std::min_element(jobs_.begin(), jobs_.end(),
                                         [](const Entry &a, const Entry &b)
                                         { return a.next_due < b.next_due; });
            if (next->next_due > target)
                break;

            clock_->set(next->next_due);
            next->next_due += next->period;
            auto job = next->job;
            job();
            ++runs;
        }

        clock_->set(target);
        return runs;
    }

} // namespace warden
