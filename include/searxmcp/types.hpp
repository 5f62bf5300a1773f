#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace searxmcp
{

using Json = nlohmann::json;

/// Name/version pair advertised in the initialize handshake and /health.
struct ServerInfo
{
    std::string name;
    std::string version;
};

inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    info.version = j.at("version").get<std::string>();
}

} // namespace searxmcp
