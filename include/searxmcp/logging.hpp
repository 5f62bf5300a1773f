#pragma once
#include <spdlog/spdlog.h>

#include <string>

namespace searxmcp::logging
{

constexpr const char* LOGGER_NAME = "searxmcp";

/// Map a level name (DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL) to spdlog.
/// Unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& name);

/// Install the process-wide default logger. Output always goes to stderr so
/// stdout stays free for the framed pipe transport. Safe to call repeatedly.
void init(const std::string& level);

} // namespace searxmcp::logging
