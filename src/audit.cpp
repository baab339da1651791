#include "warden/audit.hpp"
#include "warden/crypto.hpp"
#include <spdlog/spdlog.h>

namespace warden
{

    nlohmann::json AuditRecord::to_json() const
    {
        return nlohmann::json{{"ts", to_iso8601(ts)},
                              {"actor", actor},
                              {"action", action},
                              {"resource", resource},
                              {"result", result},
                              {"details", details}};
    }

    std::string AuditChain::link(const std::string &prev, const AuditRecord &record)
    {
        auto material = prev + "|" + record.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        return crypto::SHA256::to_hex(crypto::SHA256::hash(material));
    }

    std::string AuditChain::append(const AuditRecord &record)
    {
        std::lock_guard lock(mutex_);
        auto hash = link(hashes_.empty() ? std::string{} : hashes_.back(), record);
        records_.push_back(record);
        hashes_.push_back(hash);
        return hash;
    }

    std::optional<std::string> AuditChain::head() const
    {
        std::lock_guard lock(mutex_);
        if (hashes_.empty())
            return std::nullopt;
        return hashes_.back();
    }

    bool AuditChain::verify() const
    {
        std::lock_guard lock(mutex_);
        std::string prev;
        for (std::size_t i = 0; i < records_.size(); ++i)
        {
            auto expected = link(prev, records_[i]);
            if (expected != hashes_[i])
                return false;
            prev = expected;
        }
        return true;
    }

    std::size_t AuditChain::size() const
    {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    std::vector<AuditRecord> AuditChain::records() const
    {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::vector<std::string> AuditChain::hashes() const
    {
        std::lock_guard lock(mutex_);
        return hashes_;
    }

    AuditLogger::AuditLogger(std::shared_ptr<const Clock> clock) : clock_(std::move(clock)) {}

    std::string AuditLogger::log(std::string actor,
                                 std::string action,
                                 std::string resource,
                                 std::string result,
                                 nlohmann::json details)
    {
        AuditRecord record{clock_->now(), std::move(actor), std::move(action),
                           std::move(resource), std::move(result), std::move(details)};
        auto hash = chain_.append(record);

        nlohmann::json j = record.to_json();
        j["chain_hash"] = hash;
        spdlog::info("audit {}", j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        return hash;
    }

} // namespace warden
