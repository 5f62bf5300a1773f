#include "searxmcp/mcp/handler.hpp"
#include "searxmcp/server/http_server.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <cassert>
#include <httplib.h>
#include <string>

int main()
{
    Harness h;
    h.backend->document = Json{{"results", Json::array({{{"title", "A"},
                                                          {"url", "http://a"},
                                                          {"engines", {"g"}}}})},
                               {"number_of_results", 1}};
    ServerInfo info{"http-test", "2.0.0"};
    auto handler = mcp::make_mcp_handler(info, h.manager);

    std::atomic<bool> reachable{true};
    server::HttpServerOptions options;
    options.port = 0;
    options.server_info = info;
    options.backend_url = "http://searx.test:8080";
    server::HttpServerWrapper http{handler, [&] { return reachable.load(); }, options};
    bool ok = http.start();
    assert(ok);
    assert(http.running());
    assert(http.port() > 0);
    assert(!http.start());

    httplib::Client cli("127.0.0.1", http.port());
    cli.set_read_timeout(10, 0);

    // POST /mcp
    {
        auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"initialize"})",
                            "application/json");
        assert(res);
        assert(res->status == 200);
        auto body = Json::parse(res->body);
        assert(body["id"] == 1);
        assert(body["result"]["serverInfo"]["name"] == "http-test");
        assert(res->get_header_value("Access-Control-Allow-Origin") == "*");
    }
    {
        auto res = cli.Post(
            "/mcp",
            R"({"jsonrpc":"2.0","id":"c","method":"tools/call","params":{"name":"web_search","arguments":{"query":"rust"}}})",
            "application/json");
        assert(res && res->status == 200);
        auto body = Json::parse(res->body);
        assert(body["id"] == "c");
        assert(body["result"]["isError"] == false);
        assert(envelope_text(body["result"]).find("### 1. [A](http://a)") != std::string::npos);
    }

    // Malformed body
    {
        auto res = cli.Post("/mcp", "{not json", "application/json");
        assert(res);
        assert(res->status == 400);
        auto body = Json::parse(res->body);
        assert(body["error"]["code"] == -32700);
        assert(body["id"].is_null());
    }

    // Health, backend reachable
    {
        auto res = cli.Get("/health");
        assert(res);
        assert(res->status == 200);
        auto body = Json::parse(res->body);
        assert(body["status"] == "ok");
        assert(body["searxng_reachable"] == true);
        assert(body["searxng_url"] == "http://searx.test:8080");
        assert(body["server"]["name"] == "http-test");
        assert(body["server"]["version"] == "2.0.0");
        assert(body["timestamp"].get<std::string>().back() == 'Z');
    }

    // Health, backend down
    {
        reachable = false;
        auto res = cli.Get("/health");
        assert(res);
        assert(res->status == 503);
        auto body = Json::parse(res->body);
        assert(body["status"] == "degraded");
        assert(body["searxng_reachable"] == false);
    }

    // CORS preflight
    {
        auto res = cli.Options("/messages");
        assert(res);
        assert(res->status == 204);
        assert(res->get_header_value("Access-Control-Allow-Origin") == "*");
        assert(res->get_header_value("Access-Control-Allow-Methods").find("POST") !=
               std::string::npos);
    }

    http.stop();
    assert(!http.running());
    return 0;
}
