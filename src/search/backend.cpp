#include "searxmcp/search/backend.hpp"

#include "searxmcp/exceptions.hpp"
#include "searxmcp/util/json.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace searxmcp::search
{

namespace
{

void split_base_url(const std::string& base_url, std::string& origin, std::string& prefix)
{
    std::string url = base_url;
    if (url.find("://") == std::string::npos)
        url = "http://" + url;
    while (!url.empty() && url.back() == '/')
        url.pop_back();

    auto scheme_end = url.find("://");
    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos)
    {
        origin = url;
        prefix.clear();
    }
    else
    {
        origin = url.substr(0, path_start);
        prefix = url.substr(path_start);
    }
}

bool is_timeout(httplib::Error err)
{
    return err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read;
}

} // namespace

SearxngBackend::SearxngBackend(std::string base_url, int timeout_s)
    : base_url_(std::move(base_url)), timeout_s_(timeout_s)
{
    split_base_url(base_url_, origin_, path_prefix_);
}

Json SearxngBackend::search(const QueryParams& params)
{
    httplib::Client cli(origin_);
    cli.set_connection_timeout(timeout_s_, 0);
    cli.set_read_timeout(timeout_s_, 0);
    cli.set_write_timeout(timeout_s_, 0);

    httplib::Params query;
    for (const auto& [key, value] : params)
        query.emplace(key, value);
    query.emplace("format", "json");

    spdlog::debug("SearXNG query {}/search ({} params)", base_url_, query.size());

    auto res = cli.Get(path_prefix_ + "/search", query, httplib::Headers{});
    if (!res)
    {
        auto err = res.error();
        if (is_timeout(err))
            throw TimeoutError("timeout connecting to search backend");
        throw TransportError(httplib::to_string(err));
    }
    if (res->status != 200)
        throw HttpStatusError(res->status, res->body);

    try
    {
        return util::json::parse(res->body);
    }
    catch (const Json::parse_error& e)
    {
        throw ValidationError(e.what());
    }
}

bool SearxngBackend::probe()
{
    try
    {
        httplib::Client cli(origin_);
        cli.set_connection_timeout(timeout_s_, 0);
        cli.set_read_timeout(timeout_s_, 0);
        auto res = cli.Get(path_prefix_ + "/");
        return res && res->status == 200;
    }
    catch (const std::exception& e)
    {
        spdlog::warn("SearXNG health probe failed: {}", e.what());
        return false;
    }
}

} // namespace searxmcp::search
