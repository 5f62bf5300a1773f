#include "searxmcp/mcp/handler.hpp"

#include "searxmcp/util/uuid.hpp"

#include <spdlog/spdlog.h>

namespace searxmcp::mcp
{

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

Json parse_error_response()
{
    return jsonrpc_error(Json(), PARSE_ERROR, "Parse error");
}

McpHandler make_mcp_handler(const ServerInfo& info, const tools::ToolManager& tools)
{
    return [info, &tools](const Json& message) -> Json
    {
        if (!message.is_object())
            return jsonrpc_error(Json(), INVALID_REQUEST, "Invalid Request");

        const Json id = message.contains("id") ? message.at("id") : Json(util::generate_uuid4());
        try
        {
            std::string method;
            if (auto it = message.find("method"); it != message.end() && it->is_string())
                method = it->get<std::string>();
            Json params = Json::object();
            bool params_malformed = false;
            if (auto it = message.find("params"); it != message.end())
            {
                if (it->is_object())
                    params = *it;
                else if (!it->is_null())
                    params_malformed = true;
            }

            spdlog::debug("JSON-RPC {} (id={})", method, id.dump());

            if (method == "initialize")
            {
                return jsonrpc_result(id, Json{
                                              {"protocolVersion", PROTOCOL_VERSION},
                                              {"serverInfo", info},
                                              {"capabilities", Json{{"tools", Json::object()}}},
                                          });
            }

            if (method == "tools/list")
                return jsonrpc_result(id, Json{{"tools", tools.list_schemas()}});

            if (method == "tools/call")
            {
                if (params_malformed)
                    return jsonrpc_error(id, INVALID_PARAMS, "Invalid params: expected an object");
                std::string name;
                if (auto it = params.find("name"); it != params.end() && it->is_string())
                    name = it->get<std::string>();
                Json args = Json::object();
                if (auto it = params.find("arguments"); it != params.end() && it->is_object())
                    args = *it;
                return jsonrpc_result(id, tools.execute(name, args));
            }

            if (method == "notifications/initialized")
                return jsonrpc_result(id, Json::object());

            return jsonrpc_error(id, METHOD_NOT_FOUND, "Method not found: " + method);
        }
        catch (const std::exception& e)
        {
            spdlog::error("Dispatcher failure: {}", e.what());
            return jsonrpc_error(id, INTERNAL_ERROR, e.what());
        }
    };
}

} // namespace searxmcp::mcp
