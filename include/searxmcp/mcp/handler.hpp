#pragma once
#include "searxmcp/tools/manager.hpp"
#include "searxmcp/types.hpp"

#include <functional>
#include <string>

namespace searxmcp::mcp
{

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

/// Transport-facing handler: JSON-RPC request object in, response object out.
using McpHandler = std::function<Json(const Json&)>;

Json jsonrpc_result(const Json& id, Json result);
Json jsonrpc_error(const Json& id, int code, const std::string& message);

/// {"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}}
Json parse_error_response();

/**
 * Build the protocol dispatcher.
 *
 * Routes exactly four methods:
 * - "initialize"                -> protocol version, serverInfo, capabilities
 * - "tools/list"                -> the registry's schemas in declaration order
 * - "tools/call"                -> ToolManager::execute() envelope as result
 * - "notifications/initialized" -> empty result
 * Any other method yields METHOD_NOT_FOUND. A tools/call whose params is
 * present but not an object (or null) yields INVALID_PARAMS. Tool failures are never protocol
 * errors; they arrive as a result with isError = true.
 *
 * The response id echoes the request id. A request without an id gets a
 * freshly generated one, so every message is answered.
 *
 * The returned handler keeps a reference to `tools`, which must outlive it.
 * It performs no I/O beyond what the tools do.
 */
McpHandler make_mcp_handler(const ServerInfo& info, const tools::ToolManager& tools);

} // namespace searxmcp::mcp
