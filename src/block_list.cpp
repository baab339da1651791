#include "warden/block_list.hpp"
#include <mutex>

namespace warden
{

    bool BlockList::block_network(const std::string &network_hash)
    {
        std::unique_lock lock(mutex_);
        return networks_.insert(network_hash).second;
    }

    bool BlockList::block_account(const std::string &account_hash)
    {
        std::unique_lock lock(mutex_);
        return accounts_.insert(account_hash).second;
    }

    bool BlockList::require_second_factor(const std::string &account_hash)
    {
        std::unique_lock lock(mutex_);
        return second_factor_.insert(account_hash).second;
    }

    bool BlockList::is_network_blocked(std::string_view network_hash) const
    {
        std::shared_lock lock(mutex_);
        return networks_.contains(std::string(network_hash));
    }

    bool BlockList::is_account_blocked(std::string_view account_hash) const
    {
        std::shared_lock lock(mutex_);
        return accounts_.contains(std::string(account_hash));
    }

    bool BlockList::requires_second_factor(std::string_view account_hash) const
    {
        std::shared_lock lock(mutex_);
        return second_factor_.contains(std::string(account_hash));
    }

    std::size_t BlockList::blocked_network_count() const
    {
        std::shared_lock lock(mutex_);
        return networks_.size();
    }

    std::size_t BlockList::blocked_account_count() const
    {
        std::shared_lock lock(mutex_);
        return accounts_.size();
    }

} // namespace warden
