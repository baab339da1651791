#include "warden/web_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <algorithm>
#include <charconv>
#include <format>
#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace warden
{
    namespace
    {
        constexpr std::size_t kDefaultEventLimit = 100;
        constexpr Duration kIdleClientTtl = std::chrono::minutes(10);

        HttpResponse json_response(http::status status, const nlohmann::json &j, unsigned version = 11)
        {
            HttpResponse res{status, version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            // Event fields can carry raw request bytes that are not UTF-8.
            res.body() = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            res.prepare_payload();
            return res;
        }

        HttpResponse ok_json(const nlohmann::json &j)
        {
            return json_response(http::status::ok, j);
        }

        HttpResponse error_json(http::status status, const std::string &why)
        {
            return json_response(status, {{"error", why}});
        }

        HttpResponse not_found()
        {
            return error_json(http::status::not_found, "not found");
        }

        http::status status_for(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::ValidationError:
            case ErrorCode::ParsingError:
            case ErrorCode::ConfigurationError:
                return http::status::bad_request;
            case ErrorCode::NotFound:
                return http::status::not_found;
            case ErrorCode::AlreadyExists:
            case ErrorCode::TransitionError:
                return http::status::conflict;
            default:
                return http::status::internal_server_error;
            }
        }

        HttpResponse from_error(const WardenError &e)
        {
            return json_response(status_for(e.code),
                                 {{"error", e.what()}, {"code", error_code_to_string(e.code)}});
        }

        std::string_view to_std(beast::string_view s)
        {
            return {s.data(), s.size()};
        }

        std::string client_id(const HttpRequest &req, const tcp::endpoint &remote)
        {
            if (auto cid = req.find("X-Client-Id"); cid != req.end())
            {
                return std::string(to_std(cid->value()));
            }
            return remote.address().to_string();
        }

        /** Split "/path?query" */
        std::pair<std::string, std::string> split_target(std::string_view target)
        {
            auto q = target.find('?');
            if (q == std::string_view::npos)
                return {std::string(target), {}};
            return {std::string(target.substr(0, q)), std::string(target.substr(q + 1))};
        }

        std::optional<std::string> query_param(std::string_view query, std::string_view name)
        {
            while (!query.empty())
            {
                auto amp = query.find('&');
                auto pair = query.substr(0, amp);
                auto eq = pair.find('=');
                if (pair.substr(0, eq) == name)
                    return eq == std::string_view::npos ? std::string{} : std::string(pair.substr(eq + 1));
                if (amp == std::string_view::npos)
                    break;
                query.remove_prefix(amp + 1);
            }
            return std::nullopt;
        }

        Result<nlohmann::json> parse_body(const HttpRequest &req)
        {
            if (req.body().empty())
                return nlohmann::json::object();
            try
            {
                return nlohmann::json::parse(req.body());
            }
            catch (const nlohmann::json::parse_error &e)
            {
                return std::unexpected(WardenError::parsing(std::string("invalid JSON body: ") + e.what()));
            }
        }
    } // namespace

    ApiHandler::ApiHandler(Engine &engine, RateLimiter &limiter)
        : engine_(engine), limiter_(limiter)
    {
    }

    HttpResponse ApiHandler::handle(const HttpRequest &req,
                                    const std::string &client_key,
                                    const std::string &remote_address)
    {
        if (auto decision = limiter_.check(client_key); !decision.allowed)
            return throttled(req, remote_address, decision.retry_after);

        if (req.method() != http::verb::get && req.method() != http::verb::post)
            return error_json(http::status::method_not_allowed, "method not allowed");

        try
        {
            auto res = route(req, remote_address);
            res.version(req.version());
            return res;
        }
        catch (const std::exception &e)
        {
            spdlog::error("request {} {} failed: {}", to_std(req.method_string()), to_std(req.target()), e.what());
            return error_json(http::status::internal_server_error, "internal error");
        }
    }

    HttpResponse ApiHandler::throttled(const HttpRequest &req, const std::string &remote_address, Duration retry_after)
    {
        RawOccurrence raw;
        raw.type = event_type_to_string(EventType::ApiRateLimitExceeded);
        raw.source.address = remote_address;
        if (auto ua = req.find(http::field::user_agent); ua != req.end())
            raw.source.user_agent = std::string(to_std(ua->value()));
        raw.request.method = std::string(to_std(req.method_string()));
        raw.request.path = split_target(to_std(req.target())).first;
        raw.response.status_code = 429;
        raw.rule_hint = "rate_limiter";

        if (auto recorded = engine_.record_event(raw); !recorded)
            spdlog::warn("could not record rate limit event: {}", recorded.error().what());

        auto res = error_json(http::status::too_many_requests, "rate limit exceeded");
        const auto seconds = std::chrono::ceil<std::chrono::seconds>(retry_after).count();
        res.set(http::field::retry_after, std::to_string(std::max<std::int64_t>(seconds, 1)));
        return res;
    }

    HttpResponse ApiHandler::route(const HttpRequest &req, const std::string &remote_address)
    {
        const auto [path, query] = split_target(to_std(req.target()));
        const bool get = req.method() == http::verb::get;

        if (path == "/health" && get)
        {
            return ok_json({{"status", "ok"},
                            {"rules", engine_.rules().size()},
                            {"active_incidents", engine_.metrics_summary()["active_incidents"]}});
        }
        if (path == "/api/events")
            return get ? list_events(query) : post_event(req, remote_address);
        if (path == "/api/incidents" && get)
            return list_incidents(query);

        constexpr std::string_view kIncidentPrefix = "/api/incidents/";
        if (path.starts_with(kIncidentPrefix) && path.size() > kIncidentPrefix.size())
            return incident_route(req, path.substr(kIncidentPrefix.size()));

        if (path == "/api/metrics" && get)
            return ok_json(engine_.metrics_summary());

        if (path == "/api/rules")
        {
            if (!get)
                return post_rule(req);
            nlohmann::json out = nlohmann::json::array();
            for (const auto &rule : engine_.rules())
                out.push_back(rule.to_json());
            return ok_json(out);
        }

        if (path == "/api/indicators" && get)
        {
            nlohmann::json out = nlohmann::json::array();
            for (const auto &indicator : engine_.threat_indicators())
                out.push_back(indicator.to_json());
            return ok_json(out);
        }

        if (path == "/api/blocked" && !get)
            return blocked_query(req);

        return not_found();
    }

    HttpResponse ApiHandler::post_event(const HttpRequest &req, const std::string &remote_address)
    {
        auto body = parse_body(req);
        if (!body)
            return from_error(body.error());
        auto raw = RawOccurrence::from_json(*body);
        if (!raw)
            return from_error(raw.error());
        if (raw->source.address.empty())
            raw->source.address = remote_address;

        auto id = engine_.record_event(*raw);
        if (!id)
            return from_error(id.error());
        return json_response(http::status::created, {{"id", *id}});
    }

    HttpResponse ApiHandler::list_events(const std::string &query)
    {
        std::size_t limit = kDefaultEventLimit;
        if (auto raw = query_param(query, "limit"))
        {
            std::size_t parsed = 0;
            auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), parsed);
            if (ec != std::errc{} || ptr != raw->data() + raw->size())
                return error_json(http::status::bad_request, "limit must be a non-negative integer");
            limit = parsed;
        }

        nlohmann::json out = nlohmann::json::array();
        for (const auto &event : engine_.list_recent_events(limit))
            out.push_back(event.to_json());
        return ok_json(out);
    }

    HttpResponse ApiHandler::list_incidents(const std::string &query)
    {
        std::optional<IncidentStatus> filter;
        if (auto raw = query_param(query, "status"))
        {
            filter = incident_status_from_string(*raw);
            if (!filter)
                return error_json(http::status::bad_request, "unknown incident status: " + *raw);
        }

        nlohmann::json out = nlohmann::json::array();
        for (const auto &incident : engine_.list_incidents(filter))
            out.push_back(incident.to_json());
        return ok_json(out);
    }

    HttpResponse ApiHandler::incident_route(const HttpRequest &req, const std::string &rest)
    {
        auto slash = rest.find('/');
        const auto id = rest.substr(0, slash);
        const auto action = slash == std::string::npos ? std::string{} : rest.substr(slash + 1);

        if (action.empty() && req.method() == http::verb::get)
        {
            auto incident = engine_.get_incident(id);
            if (!incident)
                return not_found();
            return ok_json(incident->to_json());
        }

        if (req.method() != http::verb::post)
            return not_found();

        auto body = parse_body(req);
        if (!body)
            return from_error(body.error());
        if (!body->is_object())
            return error_json(http::status::bad_request, "body must be a JSON object");
        const auto operator_name = body->value("operator", std::string("api"));

        if (action == "ack")
        {
            auto res = engine_.acknowledge(id, operator_name);
            return res ? ok_json(res->to_json()) : from_error(res.error());
        }

        if (action == "status")
        {
            auto next = incident_status_from_string(body->value("status", std::string{}));
            if (!next)
                return error_json(http::status::bad_request, "unknown or missing incident status");

            std::optional<Resolution> resolution;
            if (auto r = body->find("resolution"); r != body->end() && !r->is_null())
            {
                auto parsed = Resolution::from_json(*r);
                if (!parsed)
                    return from_error(parsed.error());
                resolution = std::move(*parsed);
            }

            auto res = engine_.set_status(id, *next, operator_name, body->value("note", std::string{}), std::move(resolution));
            return res ? ok_json(res->to_json()) : from_error(res.error());
        }

        return not_found();
    }

    HttpResponse ApiHandler::post_rule(const HttpRequest &req)
    {
        auto body = parse_body(req);
        if (!body)
            return from_error(body.error());
        auto rule = Rule::from_json(*body);
        if (!rule)
            return from_error(rule.error());

        const auto operator_name = body->value("operator", std::string("api"));
        auto json = rule->to_json();
        if (auto res = engine_.add_rule(std::move(*rule), operator_name); !res)
            return from_error(res.error());
        return json_response(http::status::created, json);
    }

    HttpResponse ApiHandler::blocked_query(const HttpRequest &req)
    {
        auto body = parse_body(req);
        if (!body)
            return from_error(body.error());
        if (!body->is_object())
            return error_json(http::status::bad_request, "body must be a JSON object");

        nlohmann::json out = nlohmann::json::object();
        if (auto address = body->find("address"); address != body->end() && address->is_string())
        {
            const auto hash = engine_.hash_network(address->get<std::string>());
            out["network_hash"] = hash;
            out["network_blocked"] = engine_.is_network_blocked(hash);
        }
        if (auto email = body->find("email"); email != body->end() && email->is_string())
        {
            const auto hash = engine_.hash_account(email->get<std::string>());
            out["account_hash"] = hash;
            out["account_blocked"] = engine_.is_account_blocked(hash);
            out["requires_second_factor"] = engine_.requires_second_factor(hash);
        }
        if (out.empty())
            return error_json(http::status::bad_request, "address or email is required");
        return ok_json(out);
    }

    class WebServer::Impl
    {
    public:
        Impl(net::io_context &ioc, Engine &engine, ServerConfig cfg, std::shared_ptr<const Clock> clock)
            : ioc_(ioc),
              acceptor_(ioc),
              cfg_(std::move(cfg)),
              limiter_(cfg_.rate_limit, std::move(clock)),
              api_(engine, limiter_)
        {
        }

        ~Impl()
        {
            stop();
        }

        Result<void> start()
        {
            beast::error_code ec;
            auto address = net::ip::make_address(cfg_.address, ec);
            if (ec)
                return std::unexpected(WardenError::configuration("invalid listen address " + cfg_.address));
            tcp::endpoint endpoint{address, cfg_.port};

            acceptor_.open(endpoint.protocol(), ec);
            if (!ec)
                acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (!ec)
                acceptor_.bind(endpoint, ec);
            if (!ec)
                acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                return std::unexpected(WardenError::io(
                    std::format("cannot listen on {}:{}: {}", cfg_.address, cfg_.port, ec.message())));

            spdlog::info("listening on {}:{}", cfg_.address, cfg_.port);
            do_accept();
            return {};
        }

        void start_maintenance(Scheduler &scheduler)
        {
            scheduler.schedule_every("rate_limit_prune", kIdleClientTtl, [this]
                                     {
                if (auto dropped = limiter_.prune_idle(kIdleClientTtl); dropped > 0)
                    spdlog::debug("rate limiter dropped {} idle client(s)", dropped); });
        }

        void stop()
        {
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (ec == net::error::operation_aborted)
                return;
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), api_)->run();
            }
            else
            {
                spdlog::warn("accept failed: {}", ec.message());
            }
            do_accept();
        }

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, ApiHandler &api)
                : stream_(std::move(socket)),
                  api_(api)
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    return;
                }

                beast::error_code ep_ec;
                auto remote = stream_.socket().remote_endpoint(ep_ec);
                if (ep_ec)
                    return do_close();

                res_ = api_.handle(req_, client_id(req_, remote), remote.address().to_string());
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t)
                                  { self->on_write(ec); });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            HttpRequest req_;
            HttpResponse res_;
            ApiHandler &api_;
        };

        net::io_context &ioc_;
        tcp::acceptor acceptor_;
        ServerConfig cfg_;
        RateLimiter limiter_;
        ApiHandler api_;
    };

    WebServer::WebServer(net::io_context &ioc, Engine &engine, ServerConfig cfg, std::shared_ptr<const Clock> clock)
        : impl_(std::make_unique<Impl>(ioc, engine, std::move(cfg), std::move(clock))) {}
    WebServer::~WebServer() = default;

    Result<void> WebServer::start() { return impl_->start(); }
    void WebServer::start_maintenance(Scheduler &scheduler) { impl_->start_maintenance(scheduler); }
    void WebServer::stop() { impl_->stop(); }

} // namespace warden
