#include "searxmcp/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace searxmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        return used == std::char_traits<char>::length(v) ? parsed : defv;
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

// Durations and pool sizes: anything below 1 keeps the default.
static int getenv_positive(const char* key, int defv)
{
    int v = getenv_int(key, defv);
    return v < 1 ? defv : v;
}

static int positive_or(const Json& j, const char* key, int defv)
{
    if (!j.contains(key))
        return defv;
    int v = j.at(key).get<int>();
    return v < 1 ? defv : v;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.searxng_url = getenv_str("SEARXNG_URL", s.searxng_url);
    s.host = getenv_str("HOST", s.host);
    s.port = getenv_int("PORT", s.port);
    s.server_name = getenv_str("MCP_SERVER_NAME", s.server_name);
    s.server_version = getenv_str("MCP_SERVER_VERSION", s.server_version);
    s.log_level = upper(getenv_str("LOG_LEVEL", s.log_level));
    s.default_max_results = getenv_int("DEFAULT_MAX_RESULTS", s.default_max_results);
    s.request_timeout_s = getenv_positive("REQUEST_TIMEOUT", s.request_timeout_s);
    s.keepalive_s = getenv_positive("SSE_KEEPALIVE", s.keepalive_s);
    s.max_sse_sessions = getenv_positive("SSE_MAX_SESSIONS", s.max_sse_sessions);
    s.http_workers = getenv_positive("HTTP_WORKERS", s.http_workers);
    s.cors_origin = getenv_str("CORS_ORIGIN", s.cors_origin);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("searxng_url"))
        s.searxng_url = j.at("searxng_url").get<std::string>();
    if (j.contains("host"))
        s.host = j.at("host").get<std::string>();
    if (j.contains("port"))
        s.port = j.at("port").get<int>();
    if (j.contains("server_name"))
        s.server_name = j.at("server_name").get<std::string>();
    if (j.contains("server_version"))
        s.server_version = j.at("server_version").get<std::string>();
    if (j.contains("log_level"))
        s.log_level = upper(j.at("log_level").get<std::string>());
    if (j.contains("default_max_results"))
        s.default_max_results = j.at("default_max_results").get<int>();
    s.request_timeout_s = positive_or(j, "request_timeout_s", s.request_timeout_s);
    s.keepalive_s = positive_or(j, "keepalive_s", s.keepalive_s);
    s.max_sse_sessions = positive_or(j, "max_sse_sessions", s.max_sse_sessions);
    s.http_workers = positive_or(j, "http_workers", s.http_workers);
    if (j.contains("cors_origin"))
        s.cors_origin = j.at("cors_origin").get<std::string>();
    return s;
}

} // namespace searxmcp
