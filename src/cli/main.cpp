#include "searxmcp/fetch/page_fetcher.hpp"
#include "searxmcp/logging.hpp"
#include "searxmcp/mcp/handler.hpp"
#include "searxmcp/search/backend.hpp"
#include "searxmcp/server/http_server.hpp"
#include "searxmcp/server/stdio_server.hpp"
#include "searxmcp/settings.hpp"
#include "searxmcp/tools/search_tools.hpp"
#include "searxmcp/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::ostream& os = exit_code == 0 ? std::cout : std::cerr;
    os << "searxmcp " << searxmcp::VERSION_MAJOR << "." << searxmcp::VERSION_MINOR << "."
       << searxmcp::VERSION_PATCH << "\n";
    os << "Usage:\n";
    os << "  searxmcp [http] [options]    Serve /health, /mcp, /sse and /messages\n";
    os << "  searxmcp stdio [options]     Serve Content-Length framed JSON-RPC on stdin/stdout\n";
    os << "  searxmcp --help\n";
    os << "\n";
    os << "Options:\n";
    os << "  --host <addr>          Address to bind (env HOST, default 0.0.0.0)\n";
    os << "  --port <n>             Port to bind (env PORT, default 8091)\n";
    os << "  --searxng-url <url>    SearXNG base URL (env SEARXNG_URL)\n";
    os << "  --log-level <level>    DEBUG, INFO, WARNING, ERROR (env LOG_LEVEL)\n";
    return exit_code;
}

static std::optional<int> parse_port(const std::string& s)
{
    try
    {
        size_t used = 0;
        int port = std::stoi(s, &used);
        if (used != s.size() || port < 0 || port > 65535)
            return std::nullopt;
        return port;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

static int serve_http(const searxmcp::Settings& settings, searxmcp::mcp::McpHandler handler,
                      std::shared_ptr<searxmcp::search::SearchBackend> backend,
                      const std::vector<std::string>& tool_names)
{
    searxmcp::server::HttpServerOptions options;
    options.host = settings.host;
    options.port = settings.port;
    options.cors_origin = settings.cors_origin;
    options.keepalive = std::chrono::seconds(settings.keepalive_s);
    options.max_sse_sessions = static_cast<std::size_t>(settings.max_sse_sessions);
    options.request_workers = static_cast<std::size_t>(settings.http_workers);
    options.server_info = settings.server_info();
    options.backend_url = settings.searxng_url;

    searxmcp::server::HttpServerWrapper server(
        std::move(handler), [backend] { return backend->probe(); }, options);

    std::string tools;
    for (const auto& name : tool_names)
        tools += (tools.empty() ? "" : ", ") + name;

    spdlog::info("Starting MCP SearXNG server on {}:{}", settings.host, settings.port);
    spdlog::info("SearXNG URL: {}", settings.searxng_url);
    spdlog::info("Endpoints: /health, /mcp, /sse, /messages");
    spdlog::info("Tools: {}", tools);

    if (!server.run())
    {
        spdlog::critical("Could not listen on {}:{}", settings.host, settings.port);
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto settings = searxmcp::Settings::from_env();
    std::string mode = "http";

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string>
        {
            if (i + 1 >= argc)
                return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h")
            return usage(0);
        if (arg == "http" || arg == "stdio")
        {
            mode = arg;
            continue;
        }
        if (arg == "--host")
        {
            auto v = next();
            if (!v)
                return usage(2);
            settings.host = *v;
            continue;
        }
        if (arg == "--port")
        {
            auto v = next();
            auto port = v ? parse_port(*v) : std::nullopt;
            if (!port)
            {
                std::cerr << "Invalid --port\n";
                return 2;
            }
            settings.port = *port;
            continue;
        }
        if (arg == "--searxng-url")
        {
            auto v = next();
            if (!v)
                return usage(2);
            settings.searxng_url = *v;
            continue;
        }
        if (arg == "--log-level")
        {
            auto v = next();
            if (!v)
                return usage(2);
            settings.log_level = *v;
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        return usage(2);
    }

    searxmcp::logging::init(settings.log_level);

    auto backend = std::make_shared<searxmcp::search::SearxngBackend>(settings.searxng_url,
                                                                      settings.request_timeout_s);
    auto fetcher = std::make_shared<searxmcp::fetch::CurlPageFetcher>(settings.request_timeout_s);

    searxmcp::tools::SearchToolOptions tool_options;
    tool_options.default_max_results = settings.default_max_results;
    auto search_tools =
        std::make_shared<const searxmcp::tools::SearchTools>(backend, fetcher, tool_options);

    searxmcp::tools::ToolManager tools;
    searxmcp::tools::register_search_tools(tools, search_tools);

    auto handler = searxmcp::mcp::make_mcp_handler(settings.server_info(), tools);

    if (mode == "stdio")
    {
        searxmcp::server::StdioServerWrapper server(handler);
        server.run();
        return 0;
    }
    return serve_http(settings, handler, backend, tools.list_names());
}
