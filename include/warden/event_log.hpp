#pragma once

#include "event.hpp"
#include "types.hpp"
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden
{
    /**
     * In-memory event store. Events are kept in ingestion order; a secondary
     * index maps (actor, type) to a sorted timestamp list so rule windows are
     * counted with a binary search instead of a scan of the whole log.
     */
    class EventLog
    {
    public:
        void append(const Event &event);

        /**
         * Number of events by actor whose type is in types and whose
         * timestamp is >= since.
         */
        std::size_t count_in_window(const std::string &actor,
                                    const std::set<EventType> &types,
                                    Timestamp since) const;

        /** Last `limit` events, oldest first */
        std::vector<Event> recent(std::size_t limit) const;

        /** All events with timestamp >= since, oldest first */
        std::vector<Event> since(Timestamp since) const;

        std::optional<Event> find(const std::string &event_id) const;

        /** Drop events strictly older than cutoff; returns the number removed. */
        std::size_t prune_before(Timestamp cutoff);

        std::size_t size() const;

    private:
        using TypeIndex = std::map<EventType, std::deque<Timestamp>>;

        mutable std::shared_mutex mutex_;
        std::deque<Event> events_;
        std::unordered_map<std::string, TypeIndex> index_;
    };

} // namespace warden
