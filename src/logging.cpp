#include "searxmcp/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>

namespace searxmcp::logging
{

spdlog::level::level_enum parse_level(const std::string& name)
{
    std::string lvl = name;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    if (lvl == "TRACE")
        return spdlog::level::trace;
    if (lvl == "DEBUG")
        return spdlog::level::debug;
    if (lvl == "WARNING" || lvl == "WARN")
        return spdlog::level::warn;
    if (lvl == "ERROR")
        return spdlog::level::err;
    if (lvl == "CRITICAL" || lvl == "FATAL")
        return spdlog::level::critical;
    if (lvl == "OFF")
        return spdlog::level::off;
    return spdlog::level::info;
}

void init(const std::string& level)
{
    if (auto existing = spdlog::get(LOGGER_NAME))
    {
        spdlog::set_default_logger(existing);
    }
    else
    {
        auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
        spdlog::set_default_logger(logger);
    }
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S,%e - %n - %l - %v");
    spdlog::set_level(parse_level(level));
}

} // namespace searxmcp::logging
