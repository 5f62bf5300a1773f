#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace searxmcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    // Invalid UTF-8 coming from upstream pages must not abort serialization.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace searxmcp::util::json
