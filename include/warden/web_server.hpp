#pragma once

#include "warden/config.hpp"
#include "warden/engine.hpp"
#include "warden/rate_limiter.hpp"
#include "warden/scheduler.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <string>

namespace warden
{
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    /**
     * Maps HTTP requests onto the engine's ingestion and query surface.
     * Independent of sockets so routes can be exercised directly.
     */
    class ApiHandler
    {
    public:
        ApiHandler(Engine &engine, RateLimiter &limiter);

        /**
         * Handle one request from client_key (X-Client-Id or peer address).
         * remote_address is used as the event source when a posted event
         * carries none, and for throttling events.
         */
        HttpResponse handle(const HttpRequest &req,
                            const std::string &client_key,
                            const std::string &remote_address);

    private:
        HttpResponse route(const HttpRequest &req, const std::string &remote_address);
        HttpResponse throttled(const HttpRequest &req, const std::string &remote_address, Duration retry_after);

        HttpResponse post_event(const HttpRequest &req, const std::string &remote_address);
        HttpResponse list_events(const std::string &query);
        HttpResponse list_incidents(const std::string &query);
        HttpResponse incident_route(const HttpRequest &req, const std::string &rest);
        HttpResponse post_rule(const HttpRequest &req);
        HttpResponse blocked_query(const HttpRequest &req);

        Engine &engine_;
        RateLimiter &limiter_;
    };

    /**
     * HTTP server using Boost.Beast on a caller-owned io_context. The caller
     * runs the io_context; the same context drives housekeeping timers and
     * action dispatch.
     */
    class WebServer
    {
    public:
        WebServer(boost::asio::io_context &ioc, Engine &engine, ServerConfig cfg,
                  std::shared_ptr<const Clock> clock);
        ~WebServer();

        /** Bind, listen and start accepting. Returns a configuration error if binding fails. */
        Result<void> start();

        /** Periodically forget rate-limit state for idle clients. */
        void start_maintenance(Scheduler &scheduler);

        /** Stop accepting; in-flight sessions complete. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
