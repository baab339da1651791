#include "warden/event.hpp"
#include <format>

namespace warden
{
    namespace
    {
        template <typename T>
        void set_optional(nlohmann::json &j, const char *key, const std::optional<T> &value)
        {
            if (value)
                j[key] = *value;
        }

        std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
        {
            if (auto it = j.find(key); it != j.end() && it->is_string())
                return it->get<std::string>();
            return std::nullopt;
        }

        std::map<std::string, std::string> string_map(const nlohmann::json &j, const char *key)
        {
            std::map<std::string, std::string> out;
            auto it = j.find(key);
            if (it == j.end() || !it->is_object())
                return out;
            for (auto field = it->begin(); field != it->end(); ++field)
            {
                out[field.key()] = field->is_string() ? field->get<std::string>() : field->dump();
            }
            return out;
        }
    } // namespace

    Result<RawOccurrence> RawOccurrence::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(WardenError::validation("event must be a JSON object"));

        try
        {
            RawOccurrence raw;
            raw.type = j.value("type", "");
            raw.rule_hint = j.value("rule_hint", "manual");
            raw.confidence = j.value("confidence", 1.0);

            if (auto src = j.find("source"); src != j.end() && src->is_object())
            {
                raw.source.address = src->value("ip", "");
                raw.source.user_agent = src->value("user_agent", "");
                raw.source.country = optional_string(*src, "country");
            }

            if (auto user = j.find("user"); user != j.end() && user->is_object())
            {
                raw.actor.id = optional_string(*user, "id");
                raw.actor.email = optional_string(*user, "email");
                raw.actor.role = optional_string(*user, "role");
            }

            if (auto req = j.find("request"); req != j.end() && req->is_object())
            {
                raw.request.method = req->value("method", "GET");
                raw.request.path = req->value("path", "/");
                raw.request.headers = string_map(*req, "headers");
                raw.request.query = string_map(*req, "query");
                if (auto body = req->find("body"); body != req->end())
                    raw.request.body = *body;
            }

            if (auto res = j.find("response"); res != j.end() && res->is_object())
            {
                raw.response.status_code = res->value("status", 200);
                raw.response.content_type = optional_string(*res, "content_type");
                if (auto size = res->find("size"); size != res->end() && size->is_number_unsigned())
                    raw.response.size = size->get<std::size_t>();
            }

            if (auto ctx = j.find("context"); ctx != j.end() && ctx->is_object())
            {
                raw.context.session_id = optional_string(*ctx, "session_id");
                raw.context.request_id = optional_string(*ctx, "request_id");
                raw.context.correlation_id = optional_string(*ctx, "correlation_id");
                if (auto meta = ctx->find("metadata"); meta != ctx->end() && meta->is_object())
                    raw.context.metadata = *meta;
            }

            return raw;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(WardenError::validation(std::string("malformed event: ") + e.what()));
        }
    }

    std::string Event::pattern_subject() const
    {
        return std::format("{} {}", target.path, target.body.is_null() ? std::string{} : target.body.dump());
    }

    std::string Event::resource_ref() const
    {
        return std::format("{} {}", target.method, target.path);
    }

    nlohmann::json Event::to_json() const
    {
        nlohmann::json actor_j{{"network_hash", actor.network_hash}};
        set_optional(actor_j, "account_hash", actor.account_hash);
        set_optional(actor_j, "account_id_hash", actor.account_id_hash);
        set_optional(actor_j, "role", actor.role);
        set_optional(actor_j, "country", actor.country);

        nlohmann::json target_j{
            {"method", target.method},
            {"path", target.path},
            {"headers", target.headers},
            {"query", target.query},
            {"body", target.body}};

        nlohmann::json response_j{{"status", response.status_code}};
        set_optional(response_j, "content_type", response.content_type);
        set_optional(response_j, "size", response.size);

        nlohmann::json context_j{{"metadata", context.metadata}};
        set_optional(context_j, "session_id", context.session_id);
        set_optional(context_j, "request_id", context.request_id);
        set_optional(context_j, "correlation_id", context.correlation_id);

        return nlohmann::json{
            {"id", id},
            {"type", event_type_to_string(type)},
            {"severity", severity_to_string(severity)},
            {"timestamp", to_epoch_ms(timestamp)},
            {"actor", actor_j},
            {"target", target_j},
            {"response", response_j},
            {"detection", {{"rule", detection.rule_hint}, {"confidence", detection.confidence}, {"risk_score", detection.risk_score}, {"indicators", detection.indicators}}},
            {"context", context_j}};
    }

} // namespace warden
