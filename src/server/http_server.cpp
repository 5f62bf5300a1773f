#include "searxmcp/server/http_server.hpp"

#include "searxmcp/util/json.hpp"

#include <algorithm>
#include <ctime>
#include <httplib.h>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace searxmcp::server
{

namespace
{

std::string to_iso8601_now()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
#ifdef _WIN32
    std::tm tm;
    gmtime_s(&tm, &t);
#else
    std::tm tm;
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

SseOptions sse_options_from(const HttpServerOptions& options)
{
    SseOptions sse;
    sse.keepalive = options.keepalive;
    sse.max_sessions = options.max_sse_sessions;
    return sse;
}

} // namespace

HttpServerWrapper::HttpServerWrapper(mcp::McpHandler handler, HealthProbe probe,
                                     HttpServerOptions options)
    : handler_(handler), probe_(std::move(probe)), options_(std::move(options)),
      port_(options_.port), sse_(std::move(handler), sse_options_from(options_))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

void HttpServerWrapper::install_routes()
{
    // Security: Set payload and timeout limits
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);

    if (!options_.cors_origin.empty())
    {
        svr_->set_default_headers({
            {"Access-Control-Allow-Origin", options_.cors_origin},
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
            {"Access-Control-Allow-Headers", "*"},
            {"Access-Control-Expose-Headers", "*"},
        });
        svr_->Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res)
                      { res.status = 204; });
    }

    svr_->Get("/health",
              [this](const httplib::Request&, httplib::Response& res)
              {
                  bool healthy = probe_ && probe_();
                  Json body = {
                      {"status", healthy ? "ok" : "degraded"},
                      {"server", options_.server_info},
                      {"searxng_url", options_.backend_url},
                      {"searxng_reachable", healthy},
                      {"timestamp", to_iso8601_now()},
                  };
                  res.status = healthy ? 200 : 503;
                  res.set_content(util::json::dump(body), "application/json");
              });

    svr_->Post("/mcp",
               [this](const httplib::Request& req, httplib::Response& res)
               {
                   Json request;
                   try
                   {
                       request = util::json::parse(req.body);
                   }
                   catch (const Json::parse_error&)
                   {
                       res.status = 400;
                       res.set_content(util::json::dump(mcp::parse_error_response()),
                                       "application/json");
                       return;
                   }

                   try
                   {
                       auto response = handler_(request);
                       res.status = 200;
                       res.set_content(util::json::dump(response), "application/json");
                   }
                   catch (const std::exception& e)
                   {
                       spdlog::error("POST /mcp failed: {}", e.what());
                       res.status = 500;
                       res.set_content(util::json::dump(mcp::jsonrpc_error(
                                           request.is_object() ? request.value("id", Json())
                                                               : Json(),
                                           mcp::INTERNAL_ERROR, e.what())),
                                       "application/json");
                   }
               });

    sse_.mount(*svr_);
}

bool HttpServerWrapper::bind()
{
    svr_ = std::make_unique<httplib::Server>();
    // Each stream pins a worker, so the pool holds one per allowed stream
    // plus request_workers for everything else.
    std::size_t workers =
        options_.max_sse_sessions + std::max<std::size_t>(1, options_.request_workers);
    svr_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    install_routes();

    if (options_.port == 0)
    {
        port_ = svr_->bind_to_any_port(options_.host);
        if (port_ < 0)
        {
            spdlog::critical("Cannot bind {} on an ephemeral port", options_.host);
            return false;
        }
    }
    else if (!svr_->bind_to_port(options_.host, options_.port))
    {
        spdlog::critical("Cannot bind {}:{}", options_.host, options_.port);
        return false;
    }
    else
    {
        port_ = options_.port;
    }
    return true;
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    if (!bind())
        return false;

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    svr_->wait_until_ready();
    return true;
}

bool HttpServerWrapper::run()
{
    if (running_)
        return false;
    if (!bind())
        return false;

    running_ = true;
    bool ok = svr_->listen_after_bind();
    running_ = false;
    return ok;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    sse_.shutdown();
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
}

} // namespace searxmcp::server
