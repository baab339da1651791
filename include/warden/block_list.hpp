#pragma once

#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace warden
{
    /**
     * Hashed identities the upstream request layer must refuse, plus accounts
     * that must pass a second factor. All inserts are idempotent.
     */
    class BlockList
    {
    public:
        /** Returns false if the identity was already blocked */
        bool block_network(const std::string &network_hash);
        bool block_account(const std::string &account_hash);
        bool require_second_factor(const std::string &account_hash);

        bool is_network_blocked(std::string_view network_hash) const;
        bool is_account_blocked(std::string_view account_hash) const;
        bool requires_second_factor(std::string_view account_hash) const;

        std::size_t blocked_network_count() const;
        std::size_t blocked_account_count() const;

    private:
        mutable std::shared_mutex mutex_;
        std::unordered_set<std::string> networks_;
        std::unordered_set<std::string> accounts_;
        std::unordered_set<std::string> second_factor_;
    };

} // namespace warden
