#pragma once
#include "searxmcp/types.hpp"

#include <string>
#include <vector>

namespace searxmcp
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

/// Uniform envelope every tool produces: {content: [...], isError: bool}.
struct ToolResult
{
    std::vector<TextContent> content;
    bool is_error{false};

    static ToolResult text(std::string body)
    {
        ToolResult r;
        r.content.push_back(TextContent{"text", std::move(body)});
        return r;
    }

    static ToolResult error(const std::string& message)
    {
        ToolResult r;
        r.content.push_back(TextContent{"text", "Error: " + message});
        r.is_error = true;
        return r;
    }
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", std::string("text"));
    c.text = j.at("text").get<std::string>();
}

inline void to_json(Json& j, const ToolResult& r)
{
    j = Json{{"content", r.content}, {"isError", r.is_error}};
}

inline void from_json(const Json& j, ToolResult& r)
{
    r.content = j.at("content").get<std::vector<TextContent>>();
    r.is_error = j.value("isError", false);
}

} // namespace searxmcp
