#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace warden
{
    /** One operator-initiated mutation: status change, rule edit, block, ... */
    struct AuditRecord
    {
        Timestamp ts{};
        std::string actor;
        std::string action;
        std::string resource;
        std::string result;
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;
    };

    /**
     * AuditChain links records with hashes for tamper detection. Each link is
     * SHA-256 over the previous hash and the record's JSON dump.
     */
    class AuditChain
    {
    public:
        /** Append a record, returning its chain hash */
        std::string append(const AuditRecord &record);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        /** Recompute every link; false if any record or hash was altered */
        bool verify() const;

        std::size_t size() const;
        std::vector<AuditRecord> records() const;
        std::vector<std::string> hashes() const;

        static std::string link(const std::string &prev, const AuditRecord &record);

    private:
        mutable std::mutex mutex_;
        std::vector<AuditRecord> records_;
        std::vector<std::string> hashes_;
    };

    /** Writes chained records as single-line JSON through spdlog. */
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::shared_ptr<const Clock> clock);

        /** Stamp, chain and log. Returns the chain hash. */
        std::string log(std::string actor,
                        std::string action,
                        std::string resource,
                        std::string result,
                        nlohmann::json details = nlohmann::json::object());

        const AuditChain &chain() const { return chain_; }

    private:
        std::shared_ptr<const Clock> clock_;
        AuditChain chain_;
    };

} // namespace warden
