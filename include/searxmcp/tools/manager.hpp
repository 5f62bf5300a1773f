#pragma once
#include "searxmcp/content.hpp"
#include "searxmcp/tools/tool.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace searxmcp::tools
{

/**
 * Catalog of callable tools.
 *
 * Populated once at startup and read-only afterwards, so concurrent readers
 * need no locking. list() preserves registration order.
 */
class ToolManager
{
  public:
    /// Throws ValidationError on a duplicate or empty name.
    void register_tool(Tool t);

    const std::vector<Tool>& list() const
    {
        return tools_;
    }

    /// nullptr when no tool has that name.
    const Tool* find(const std::string& name) const;

    /// Throws NotFoundError when no tool has that name.
    const Tool& get(const std::string& name) const;

    std::vector<std::string> list_names() const;

    /// MCP tools/list payload: array of {name, description, inputSchema}.
    Json list_schemas() const;

    /**
     * Run a tool and produce its envelope. Never throws: unknown names,
     * handler failures and escaped exceptions all become isError envelopes.
     */
    ToolResult execute(const std::string& name, const Json& arguments) const;

  private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace searxmcp::tools
