#include "warden/event_log.hpp"
#include <algorithm>
#include <mutex>

namespace warden
{

    void EventLog::append(const Event &event)
    {
        std::unique_lock lock(mutex_);
        events_.push_back(event);

        auto &stamps = index_[event.actor.network_hash][event.type];
        // Keep sorted even if a clock steps backwards
        auto pos = std::upper_bound(stamps.begin(), stamps.end(), event.timestamp);
        stamps.insert(pos, event.timestamp);
    }

    std::size_t EventLog::count_in_window(const std::string &actor,
                                          const std::set<EventType> &types,
                                          Timestamp since) const
    {
        std::shared_lock lock(mutex_);
        auto actor_it = index_.find(actor);
        if (actor_it == index_.end())
            return 0;

        std::size_t count = 0;
        for (auto type : types)
        {
            auto it = actor_it->second.find(type);
            if (it == actor_it->second.end())
                continue;
            const auto &stamps = it->second;
            auto first = std::lower_bound(stamps.begin(), stamps.end(), since);
            count += static_cast<std::size_t>(std::distance(first, stamps.end()));
        }
        return count;
    }

    std::vector<Event> EventLog::recent(std::size_t limit) const
    {
        std::shared_lock lock(mutex_);
        auto n = std::min(limit, events_.size());
        return std::vector<Event>(events_.end() - static_cast<std::ptrdiff_t>(n), events_.end());
    }

    std::vector<Event> EventLog::since(Timestamp since) const
    {
        std::shared_lock lock(mutex_);
        std::vector<Event> out;
        for (const auto &e : events_)
        {
            if (e.timestamp >= since)
                out.push_back(e);
        }
        return out;
    }

    std::optional<Event> EventLog::find(const std::string &event_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = std::find_if(events_.begin(), events_.end(), [&](const Event &e)
                               { return e.id == event_id; });
        if (it == events_.end())
            return std::nullopt;
        return *it;
    }

    std::size_t EventLog::prune_before(Timestamp cutoff)
    {
        std::unique_lock lock(mutex_);
        auto before = events_.size();
        events_.erase(std::remove_if(events_.begin(), events_.end(), [&](const Event &e)
                                     { return e.timestamp < cutoff; }),
                      events_.end());

        for (auto actor_it = index_.begin(); actor_it != index_.end();)
        {
            auto &by_type = actor_it->second;
            for (auto type_it = by_type.begin(); type_it != by_type.end();)
            {
                auto &stamps = type_it->second;
                stamps.erase(stamps.begin(), std::lower_bound(stamps.begin(), stamps.end(), cutoff));
                type_it = stamps.empty() ? by_type.erase(type_it) : std::next(type_it);
            }
            actor_it = by_type.empty() ? index_.erase(actor_it) : std::next(actor_it);
        }

        return before - events_.size();
    }

    std::size_t EventLog::size() const
    {
        std::shared_lock lock(mutex_);
        return events_.size();
    }

} // namespace warden
