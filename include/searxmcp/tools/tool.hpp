#pragma once
#include "searxmcp/tools/outcome.hpp"
#include "searxmcp/types.hpp"

#include <functional>
#include <string>

namespace searxmcp::tools
{

class Tool
{
  public:
    using Fn = std::function<ToolOutcome(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }

    ToolOutcome invoke(const Json& arguments) const
    {
        return fn_(arguments);
    }

    /// MCP tools/list entry: {name, description, inputSchema}.
    Json to_schema() const
    {
        return Json{{"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
};

} // namespace searxmcp::tools
