#pragma once

#include "action_dispatcher.hpp"
#include "housekeeping.hpp"
#include "rate_limiter.hpp"
#include "risk_ledger.hpp"
#include "rule.hpp"
#include "types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace warden
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        RateLimiter::Config rate_limit{};
    };

    struct WardenConfig
    {
        std::string hash_salt; // secret; WARDEN_HASH_SALT
        RiskLedger::Config risk{};
        HousekeepingConfig housekeeping{};
        AlertingConfig alerting{};
        std::vector<std::string> high_risk_countries{"CN", "RU", "KP", "IR"};
        bool use_default_rules{true};
        std::vector<Rule> rules;
        ServerConfig server{};
    };

    /**
     * ConfigLoader loads TOML configs with environment overrides. The hash
     * salt is never given a default: a config without one fails validation.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<WardenConfig> load(const std::string &path);

        /** Parse config from TOML string content. */
        static Result<WardenConfig> from_string(const std::string &toml_content);

        /** Defaults plus environment, no file */
        static Result<WardenConfig> from_env();

        /** Check salt presence, decay factor range and job periods. */
        static Result<void> validate(const WardenConfig &cfg);

        /** Serialize config to JSON for debugging/inspection (non-secret). */
        static nlohmann::json to_json(const WardenConfig &cfg);

        static Result<void> apply_env_overrides(WardenConfig &cfg);
    };

} // namespace warden
