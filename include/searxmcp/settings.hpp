#pragma once
#include "searxmcp/types.hpp"

#include <string>

namespace searxmcp
{

struct Settings
{
    std::string searxng_url{"http://searxng:8080"};
    std::string host{"0.0.0.0"};
    int port{8091};
    std::string server_name{"searxng-mcp-server"};
    std::string server_version{"1.0.0"};
    std::string log_level{"INFO"};
    int default_max_results{10};
    int request_timeout_s{30};
    int keepalive_s{30};
    int max_sse_sessions{32};
    int http_workers{8};
    std::string cors_origin{"*"};

    ServerInfo server_info() const
    {
        return ServerInfo{server_name, server_version};
    }

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace searxmcp
