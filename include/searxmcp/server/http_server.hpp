#pragma once
#include "searxmcp/mcp/handler.hpp"
#include "searxmcp/server/sse_server.hpp"
#include "searxmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace searxmcp::server
{

/// Backend reachability check behind GET /health.
using HealthProbe = std::function<bool()>;

struct HttpServerOptions
{
    std::string host{"127.0.0.1"};
    /// 0 binds an ephemeral port; port() reports the one chosen.
    int port{8091};
    /// Access-Control-Allow-Origin value; empty disables CORS headers.
    std::string cors_origin{"*"};
    std::chrono::milliseconds keepalive{std::chrono::seconds(30)};
    /// Open /sse streams allowed at once.
    std::size_t max_sse_sessions{32};
    /// Threads left for short requests while every stream is open.
    std::size_t request_workers{8};
    ServerInfo server_info{"searxng-mcp-server", "1.0.0"};
    /// Reported by /health.
    std::string backend_url;
};

/**
 * HTTP surface of the server:
 *   GET  /health                   backend probe, 200 or 503
 *   POST /mcp                      one JSON-RPC call per request
 *   GET  /sse                      session stream (see SseTransport)
 *   POST /messages?sessionId=<id>  submission for an open session
 */
class HttpServerWrapper
{
  public:
    HttpServerWrapper(mcp::McpHandler handler, HealthProbe probe, HttpServerOptions options = {});
    ~HttpServerWrapper();

    /// Bind and serve on a background thread. false if already running or
    /// the address cannot be bound.
    bool start();

    /// Bind and serve on the calling thread until stop(). false if the
    /// address cannot be bound.
    bool run();

    void stop();

    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return options_.host;
    }
    SseTransport& sse()
    {
        return sse_;
    }

  private:
    bool bind();
    void install_routes();

    mcp::McpHandler handler_;
    HealthProbe probe_;
    HttpServerOptions options_;
    int port_;
    SseTransport sse_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace searxmcp::server
