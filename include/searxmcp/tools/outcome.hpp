#pragma once
#include "searxmcp/content.hpp"

#include <string>
#include <variant>

namespace searxmcp::tools
{

/// Every way a tool invocation can fail. Each kind is reported to the caller
/// as an envelope with isError = true, never as a protocol fault.
enum class ToolErrorKind
{
    MissingArgument,
    UnknownTool,
    BackendTimeout,
    BackendStatus,
    BackendTransport,
    BackendMalformed,
    FetchFailed,
    UnsupportedContentType,
    HtmlProcessing,
    Internal
};

const char* to_string(ToolErrorKind kind);

struct ToolError
{
    ToolErrorKind kind{ToolErrorKind::Internal};
    std::string message;
};

/// Tagged result of a tool handler: success envelope or failure description.
using ToolOutcome = std::variant<ToolResult, ToolError>;

inline bool is_error(const ToolOutcome& outcome)
{
    return std::holds_alternative<ToolError>(outcome);
}

/// Collapse an outcome into the uniform envelope.
inline ToolResult to_envelope(const ToolOutcome& outcome)
{
    if (auto* err = std::get_if<ToolError>(&outcome))
        return ToolResult::error(err->message);
    return std::get<ToolResult>(outcome);
}

} // namespace searxmcp::tools
