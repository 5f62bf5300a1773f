#include "searxmcp/tools/manager.hpp"

#include "searxmcp/exceptions.hpp"
#include "searxmcp/util/json.hpp"

#include <spdlog/spdlog.h>

namespace searxmcp::tools
{

const char* to_string(ToolErrorKind kind)
{
    switch (kind)
    {
    case ToolErrorKind::MissingArgument:
        return "missing_argument";
    case ToolErrorKind::UnknownTool:
        return "unknown_tool";
    case ToolErrorKind::BackendTimeout:
        return "backend_timeout";
    case ToolErrorKind::BackendStatus:
        return "backend_status";
    case ToolErrorKind::BackendTransport:
        return "backend_transport";
    case ToolErrorKind::BackendMalformed:
        return "backend_malformed";
    case ToolErrorKind::FetchFailed:
        return "fetch_failed";
    case ToolErrorKind::UnsupportedContentType:
        return "unsupported_content_type";
    case ToolErrorKind::HtmlProcessing:
        return "html_processing";
    case ToolErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

void ToolManager::register_tool(Tool t)
{
    if (t.name().empty())
        throw ValidationError("tool name must not be empty");
    if (index_.count(t.name()))
        throw ValidationError("duplicate tool name: " + t.name());
    index_.emplace(t.name(), tools_.size());
    tools_.push_back(std::move(t));
}

const Tool* ToolManager::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

const Tool& ToolManager::get(const std::string& name) const
{
    if (auto* tool = find(name))
        return *tool;
    throw NotFoundError("tool not found: " + name);
}

std::vector<std::string> ToolManager::list_names() const
{
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : tools_)
        names.push_back(t.name());
    return names;
}

Json ToolManager::list_schemas() const
{
    Json tools = Json::array();
    for (const auto& t : tools_)
        tools.push_back(t.to_schema());
    return tools;
}

ToolResult ToolManager::execute(const std::string& name, const Json& arguments) const
{
    spdlog::info("Executing tool: {} | args: {}", name, util::json::dump(arguments));

    const Tool* tool = find(name);
    if (!tool)
        return to_envelope(ToolError{ToolErrorKind::UnknownTool, "unknown tool: " + name});

    ToolOutcome outcome;
    try
    {
        outcome = tool->invoke(arguments.is_object() ? arguments : Json::object());
    }
    catch (const std::exception& e)
    {
        spdlog::error("Tool {} raised: {}", name, e.what());
        outcome = ToolError{ToolErrorKind::Internal, e.what()};
    }

    if (auto* err = std::get_if<ToolError>(&outcome))
        spdlog::warn("Tool {} failed ({}): {}", name, to_string(err->kind), err->message);
    return to_envelope(outcome);
}

} // namespace searxmcp::tools
