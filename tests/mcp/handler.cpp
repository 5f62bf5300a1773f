#include "searxmcp/mcp/handler.hpp"
#include "test_helpers.hpp"

#include <cassert>
#include <string>

int main()
{
    Harness h;
    h.backend->document = Json{{"results", Json::array({{{"title", "A"},
                                                          {"url", "http://a"},
                                                          {"engines", {"g"}}}})},
                               {"number_of_results", 1}};

    auto handler = mcp::make_mcp_handler(ServerInfo{"searxng-test", "9.9.9"}, h.manager);

    // initialize
    Json init = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", Json::object()}};
    auto init_resp = handler(init);
    assert(init_resp["jsonrpc"] == "2.0");
    assert(init_resp["id"] == 1);
    assert(init_resp["result"]["protocolVersion"] == "2024-11-05");
    assert(init_resp["result"]["serverInfo"]["name"] == "searxng-test");
    assert(init_resp["result"]["serverInfo"]["version"] == "9.9.9");
    assert(init_resp["result"]["capabilities"]["tools"].is_object());
    assert(!init_resp.contains("error"));

    // notifications/initialized still gets an answer with the same id
    Json notified = {{"jsonrpc", "2.0"}, {"id", "n-1"}, {"method", "notifications/initialized"}};
    auto notified_resp = handler(notified);
    assert(notified_resp["id"] == "n-1");
    assert(notified_resp["result"] == Json::object());

    // tools/list in declaration order
    Json list = {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}};
    auto list_resp = handler(list);
    assert(list_resp["id"] == 2);
    auto tools_json = list_resp["result"]["tools"];
    assert(tools_json.size() == 4);
    assert(tools_json[0]["name"] == "web_search");
    assert(tools_json[3]["name"] == "fetch_page_content");
    assert(tools_json[0].contains("inputSchema"));
    assert(tools_json[0].contains("description"));

    // tools/call
    Json call = {{"jsonrpc", "2.0"},
                 {"id", 3},
                 {"method", "tools/call"},
                 {"params", Json{{"name", "web_search"}, {"arguments", Json{{"query", "rust"}}}}}};
    auto call_resp = handler(call);
    assert(call_resp["id"] == 3);
    assert(call_resp["result"]["isError"] == false);
    assert(call_resp["result"]["content"].size() == 1);
    assert(call_resp["result"]["content"][0]["type"] == "text");
    auto text = envelope_text(call_resp["result"]);
    assert(text.find("### 1. [A](http://a)") != std::string::npos);
    assert(text.find("Sources: g") != std::string::npos);
    assert(h.backend->param("q") == "rust");
    assert(h.backend->param("categories") == "general");

    // Missing id: a generated one is echoed
    Json anonymous = {{"jsonrpc", "2.0"}, {"method", "tools/list"}};
    auto anon_resp = handler(anonymous);
    assert(anon_resp["id"].is_string());
    assert(anon_resp["id"].get<std::string>().size() == 36);
    assert(anon_resp["result"]["tools"].size() == 4);

    // Explicit null id is kept as null
    Json null_id = {{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "initialize"}};
    assert(handler(null_id)["id"].is_null());

    // tools/call params must be an object; null counts as absent
    Json odd_params = {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"}, {"params", "x"}};
    auto odd_resp = handler(odd_params);
    assert(!odd_resp.contains("result"));
    assert(odd_resp["id"] == 4);
    assert(odd_resp["error"]["code"] == mcp::INVALID_PARAMS);

    Json null_params = {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"}, {"params", nullptr}};
    assert(handler(null_params)["result"]["isError"] == true);

    // other methods ignore params entirely
    Json list_with_array = {{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/list"},
                            {"params", Json::array()}};
    assert(handler(list_with_array)["result"]["tools"].size() == 4);
    return 0;
}
