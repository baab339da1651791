#include "warden/config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <toml++/toml.h>

namespace warden
{
    namespace
    {
        nlohmann::json node_to_json(const toml::node &node)
        {
            if (auto tbl = node.as_table())
            {
                nlohmann::json j = nlohmann::json::object();
                for (auto &&[key, value] : *tbl)
                    j[std::string(key.str())] = node_to_json(value);
                return j;
            }
            if (auto arr = node.as_array())
            {
                nlohmann::json j = nlohmann::json::array();
                for (auto &&value : *arr)
                    j.push_back(node_to_json(value));
                return j;
            }
            if (auto s = node.as_string())
                return s->get();
            if (auto i = node.as_integer())
                return i->get();
            if (auto f = node.as_floating_point())
                return f->get();
            if (auto b = node.as_boolean())
                return b->get();
            return nullptr;
        }

        std::vector<std::string> string_list(const toml::array &arr)
        {
            std::vector<std::string> out;
            for (auto &&v : arr)
            {
                if (auto s = v.value<std::string>())
                    out.push_back(*s);
            }
            return out;
        }

        template <typename Dur>
        void read_duration(const toml::table &tbl, std::string_view key, Duration &out)
        {
            if (auto v = tbl[key].value<int64_t>())
                out = std::chrono::duration_cast<Duration>(Dur(*v));
        }

        Result<WardenConfig> parse_toml(const toml::table &tbl, WardenConfig cfg)
        {
            if (auto security = tbl["security"].as_table())
            {
                if (auto salt = (*security)["hash_salt"].value<std::string>())
                    cfg.hash_salt = *salt;
            }

            if (auto risk = tbl["risk"].as_table())
            {
                if (auto v = (*risk)["decay_factor"].value<double>())
                    cfg.risk.decay_factor = *v;
                if (auto v = (*risk)["contribution"].value<double>())
                    cfg.risk.contribution = *v;
                if (auto v = (*risk)["eviction_floor"].value<double>())
                    cfg.risk.eviction_floor = *v;
            }

            if (auto hk = tbl["housekeeping"].as_table())
            {
                read_duration<std::chrono::seconds>(*hk, "decay_period_seconds", cfg.housekeeping.decay_period);
                read_duration<std::chrono::seconds>(*hk, "metrics_period_seconds", cfg.housekeeping.metrics_period);
                read_duration<std::chrono::hours>(*hk, "retention_period_hours", cfg.housekeeping.retention_period);
                read_duration<std::chrono::hours>(*hk, "report_period_hours", cfg.housekeeping.report_period);
                read_duration<std::chrono::days>(*hk, "event_retention_days", cfg.housekeeping.event_retention);
                read_duration<std::chrono::days>(*hk, "incident_retention_days", cfg.housekeeping.incident_retention);
                read_duration<std::chrono::hours>(*hk, "report_window_hours", cfg.housekeeping.report_window);
            }

            if (auto alerting = tbl["alerting"].as_table())
            {
                if (auto v = (*alerting)["escalation_enabled"].value<bool>())
                    cfg.alerting.escalation_enabled = *v;
                if (auto sevs = (*alerting)["severities"].as_array())
                {
                    cfg.alerting.alert_severities.clear();
                    for (const auto &name : string_list(*sevs))
                        cfg.alerting.alert_severities.insert(severity_from_string(name));
                }
                if (auto channels = (*alerting)["channels"].as_array())
                {
                    cfg.alerting.channels.clear();
                    for (auto &&node : *channels)
                    {
                        auto ch = node.as_table();
                        if (!ch)
                            return std::unexpected(WardenError::configuration("alerting.channels entries must be tables"));
                        AlertChannel channel;
                        channel.kind = (*ch)["kind"].value_or(std::string{});
                        if (channel.kind.empty())
                            return std::unexpected(WardenError::configuration("alert channel requires a kind"));
                        if (auto rcpt = (*ch)["recipients"].as_array())
                            channel.recipients = string_list(*rcpt);
                        cfg.alerting.channels.push_back(std::move(channel));
                    }
                }
            }

            if (auto intel = tbl["threat_intel"].as_table())
            {
                if (auto countries = (*intel)["high_risk_countries"].as_array())
                    cfg.high_risk_countries = string_list(*countries);
            }

            if (auto server = tbl["server"].as_table())
            {
                if (auto v = (*server)["address"].value<std::string>())
                    cfg.server.address = *v;
                if (auto v = (*server)["port"].value<int64_t>())
                {
                    if (*v <= 0 || *v > 65535)
                        return std::unexpected(WardenError::configuration(std::format("invalid server port {}", *v)));
                    cfg.server.port = static_cast<std::uint16_t>(*v);
                }
                if (auto v = (*server)["rate_limit_per_second"].value<double>())
                    cfg.server.rate_limit.tokens_per_second = *v;
                if (auto v = (*server)["rate_limit_burst"].value<double>())
                    cfg.server.rate_limit.burst_capacity = *v;
            }

            if (auto v = tbl["use_default_rules"].value<bool>())
                cfg.use_default_rules = *v;

            if (auto rules = tbl["rules"].as_array())
            {
                for (auto &&node : *rules)
                {
                    auto rule = Rule::from_json(node_to_json(node));
                    if (!rule)
                        return std::unexpected(rule.error());
                    cfg.rules.push_back(std::move(*rule));
                }
            }

            return cfg;
        }

        Result<double> parse_double(const char *name, const char *value)
        {
            std::string_view s(value);
            double out = 0.0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec != std::errc{} || ptr != s.data() + s.size())
                return std::unexpected(WardenError::configuration(std::format("{} is not a number: '{}'", name, s)));
            return out;
        }

        Result<int64_t> parse_int(const char *name, const char *value)
        {
            std::string_view s(value);
            int64_t out = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            if (ec != std::errc{} || ptr != s.data() + s.size())
                return std::unexpected(WardenError::configuration(std::format("{} is not an integer: '{}'", name, s)));
            return out;
        }

        Result<bool> parse_bool(const char *name, const char *value)
        {
            std::string s(value);
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (s == "1" || s == "true" || s == "yes" || s == "on")
                return true;
            if (s == "0" || s == "false" || s == "no" || s == "off")
                return false;
            return std::unexpected(WardenError::configuration(std::format("{} is not a boolean: '{}'", name, value)));
        }

    } // namespace

    Result<WardenConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(WardenError::configuration("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<WardenConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        WardenConfig cfg{};
        try
        {
            auto tbl = toml::parse(toml_content);
            auto parsed = parse_toml(tbl, cfg);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg = std::move(*parsed);
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(WardenError::configuration(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::from_env()
    {
        WardenConfig cfg{};
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(WardenConfig &cfg)
    {
        if (const char *salt = std::getenv("WARDEN_HASH_SALT"))
            cfg.hash_salt = salt;

        if (const char *decay = std::getenv("WARDEN_DECAY_FACTOR"))
        {
            auto v = parse_double("WARDEN_DECAY_FACTOR", decay);
            if (!v)
                return std::unexpected(v.error());
            cfg.risk.decay_factor = *v;
        }
        if (const char *days = std::getenv("WARDEN_EVENT_RETENTION_DAYS"))
        {
            auto v = parse_int("WARDEN_EVENT_RETENTION_DAYS", days);
            if (!v)
                return std::unexpected(v.error());
            cfg.housekeeping.event_retention = std::chrono::duration_cast<Duration>(std::chrono::days(*v));
        }
        if (const char *days = std::getenv("WARDEN_INCIDENT_RETENTION_DAYS"))
        {
            auto v = parse_int("WARDEN_INCIDENT_RETENTION_DAYS", days);
            if (!v)
                return std::unexpected(v.error());
            cfg.housekeeping.incident_retention = std::chrono::duration_cast<Duration>(std::chrono::days(*v));
        }
        if (const char *esc = std::getenv("WARDEN_ESCALATION_ENABLED"))
        {
            auto v = parse_bool("WARDEN_ESCALATION_ENABLED", esc);
            if (!v)
                return std::unexpected(v.error());
            cfg.alerting.escalation_enabled = *v;
        }
        if (const char *port = std::getenv("WARDEN_PORT"))
        {
            auto v = parse_int("WARDEN_PORT", port);
            if (!v)
                return std::unexpected(v.error());
            if (*v <= 0 || *v > 65535)
                return std::unexpected(WardenError::configuration(std::format("invalid WARDEN_PORT {}", *v)));
            cfg.server.port = static_cast<std::uint16_t>(*v);
        }
        return {};
    }

    Result<void> ConfigLoader::validate(const WardenConfig &cfg)
    {
        if (cfg.hash_salt.empty())
            return std::unexpected(WardenError::configuration("hash salt is required (set WARDEN_HASH_SALT)"));
        if (!(cfg.risk.decay_factor > 0.0 && cfg.risk.decay_factor < 1.0))
            return std::unexpected(WardenError::configuration(
                std::format("decay factor must be in (0, 1), got {}", cfg.risk.decay_factor)));
        if (cfg.risk.contribution < 0.0)
            return std::unexpected(WardenError::configuration("risk contribution must not be negative"));

        const auto &hk = cfg.housekeeping;
        for (auto period : {hk.decay_period, hk.metrics_period, hk.retention_period, hk.report_period})
        {
            if (period <= Duration::zero())
                return std::unexpected(WardenError::configuration("housekeeping periods must be positive"));
        }
        if (hk.event_retention <= Duration::zero() || hk.incident_retention <= Duration::zero())
            return std::unexpected(WardenError::configuration("retention horizons must be positive"));
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const WardenConfig &cfg)
    {
        using std::chrono::duration_cast;
        const auto &hk = cfg.housekeeping;

        nlohmann::json channels = nlohmann::json::array();
        for (const auto &ch : cfg.alerting.channels)
            channels.push_back({{"kind", ch.kind}, {"recipients", ch.recipients}});
        nlohmann::json severities = nlohmann::json::array();
        for (auto sev : cfg.alerting.alert_severities)
            severities.push_back(severity_to_string(sev));
        nlohmann::json rules = nlohmann::json::array();
        for (const auto &rule : cfg.rules)
            rules.push_back(rule.to_json());

        nlohmann::json j;
        j["has_hash_salt"] = !cfg.hash_salt.empty();
        j["risk"] = {{"decay_factor", cfg.risk.decay_factor},
                     {"contribution", cfg.risk.contribution},
                     {"eviction_floor", cfg.risk.eviction_floor}};
        j["housekeeping"] = {
            {"decay_period_seconds", duration_cast<std::chrono::seconds>(hk.decay_period).count()},
            {"metrics_period_seconds", duration_cast<std::chrono::seconds>(hk.metrics_period).count()},
            {"retention_period_hours", duration_cast<std::chrono::hours>(hk.retention_period).count()},
            {"report_period_hours", duration_cast<std::chrono::hours>(hk.report_period).count()},
            {"event_retention_days", duration_cast<std::chrono::days>(hk.event_retention).count()},
            {"incident_retention_days", duration_cast<std::chrono::days>(hk.incident_retention).count()}};
        j["alerting"] = {{"escalation_enabled", cfg.alerting.escalation_enabled},
                         {"severities", severities},
                         {"channels", channels}};
        j["threat_intel"] = {{"high_risk_countries", cfg.high_risk_countries}};
        j["server"] = {{"address", cfg.server.address},
                       {"port", cfg.server.port},
                       {"rate_limit_per_second", cfg.server.rate_limit.tokens_per_second},
                       {"rate_limit_burst", cfg.server.rate_limit.burst_capacity}};
        j["use_default_rules"] = cfg.use_default_rules;
        j["rules"] = rules;
        return j;
    }

} // namespace warden
