/// @file test_tool_manager.cpp
/// @brief Tests for ToolManager
///
/// Tests cover:
/// - Registration order and lookup
/// - Duplicate and empty names
/// - Envelope production for success, failure, unknown tools and exceptions

#include "searxmcp/exceptions.hpp"
#include "searxmcp/tools/manager.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace searxmcp;
using namespace searxmcp::tools;

/// Tool echoing its "text" argument
Tool create_echo_tool(const std::string& name = "echo")
{
    return Tool(name, "Echo the text argument",
                Json{{"type", "object"},
                     {"properties", {{"text", {{"type", "string"}}}}},
                     {"required", Json::array({"text"})}},
                [](const Json& args) -> ToolOutcome
                { return ToolResult::text(args.value("text", std::string())); });
}

Tool create_failing_tool()
{
    return Tool("fails", "Always reports a failure", Json{{"type", "object"}},
                [](const Json&) -> ToolOutcome
                { return ToolError{ToolErrorKind::BackendTimeout, "took too long"}; });
}

Tool create_throwing_tool()
{
    return Tool("throws", "Escapes with an exception", Json{{"type", "object"}},
                [](const Json&) -> ToolOutcome { throw std::runtime_error("kaboom"); });
}

//------------------------------------------------------------------------------
// Registration
//------------------------------------------------------------------------------

void test_registration_order_preserved()
{
    std::cout << "  test_registration_order_preserved... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_echo_tool("zeta"));
    tm.register_tool(create_echo_tool("alpha"));
    tm.register_tool(create_echo_tool("mid"));

    auto names = tm.list_names();
    assert(names.size() == 3);
    assert(names[0] == "zeta");
    assert(names[1] == "alpha");
    assert(names[2] == "mid");

    auto schemas = tm.list_schemas();
    assert(schemas.is_array() && schemas.size() == 3);
    assert(schemas[1]["name"] == "alpha");
    assert(schemas[1]["description"] == "Echo the text argument");
    assert(schemas[1]["inputSchema"]["required"][0] == "text");

    std::cout << "PASSED\n";
}

void test_duplicate_name_rejected()
{
    std::cout << "  test_duplicate_name_rejected... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_echo_tool());
    bool threw = false;
    try
    {
        tm.register_tool(create_echo_tool());
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    assert(tm.list().size() == 1);

    std::cout << "PASSED\n";
}

void test_empty_name_rejected()
{
    std::cout << "  test_empty_name_rejected... " << std::flush;

    ToolManager tm;
    bool threw = false;
    try
    {
        tm.register_tool(create_echo_tool(""));
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    assert(tm.list().empty());

    std::cout << "PASSED\n";
}

//------------------------------------------------------------------------------
// Lookup
//------------------------------------------------------------------------------

void test_find_and_get()
{
    std::cout << "  test_find_and_get... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_echo_tool());
    assert(tm.find("echo") != nullptr);
    assert(tm.find("missing") == nullptr);
    assert(tm.get("echo").name() == "echo");

    bool threw = false;
    try
    {
        tm.get("missing");
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

//------------------------------------------------------------------------------
// Execution
//------------------------------------------------------------------------------

void test_execute_success()
{
    std::cout << "  test_execute_success... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_echo_tool());
    auto result = tm.execute("echo", Json{{"text", "hi"}});
    assert(!result.is_error);
    assert(result.content.size() == 1);
    assert(result.content[0].type == "text");
    assert(result.content[0].text == "hi");

    std::cout << "PASSED\n";
}

void test_execute_non_object_arguments()
{
    std::cout << "  test_execute_non_object_arguments... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_echo_tool());
    auto result = tm.execute("echo", Json::array({1, 2}));
    assert(!result.is_error);
    assert(result.content[0].text.empty());

    std::cout << "PASSED\n";
}

void test_execute_failure_envelope()
{
    std::cout << "  test_execute_failure_envelope... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_failing_tool());
    auto result = tm.execute("fails", Json::object());
    assert(result.is_error);
    assert(result.content[0].text == "Error: took too long");

    std::cout << "PASSED\n";
}

void test_execute_unknown_tool()
{
    std::cout << "  test_execute_unknown_tool... " << std::flush;

    ToolManager tm;
    auto result = tm.execute("nope", Json::object());
    assert(result.is_error);
    assert(result.content[0].text == "Error: unknown tool: nope");

    std::cout << "PASSED\n";
}

void test_execute_exception_contained()
{
    std::cout << "  test_execute_exception_contained... " << std::flush;

    ToolManager tm;
    tm.register_tool(create_throwing_tool());
    auto result = tm.execute("throws", Json::object());
    assert(result.is_error);
    assert(result.content[0].text == "Error: kaboom");

    std::cout << "PASSED\n";
}

void test_error_kind_names()
{
    std::cout << "  test_error_kind_names... " << std::flush;

    assert(std::string(to_string(ToolErrorKind::MissingArgument)) == "missing_argument");
    assert(std::string(to_string(ToolErrorKind::UnsupportedContentType)) ==
           "unsupported_content_type");
    assert(is_error(ToolOutcome{ToolError{}}));
    assert(!is_error(ToolOutcome{ToolResult::text("x")}));

    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "ToolManager Tests\n";
    std::cout << "=================\n";

    test_registration_order_preserved();
    test_duplicate_name_rejected();
    test_empty_name_rejected();
    test_find_and_get();
    test_execute_success();
    test_execute_non_object_arguments();
    test_execute_failure_envelope();
    test_execute_unknown_tool();
    test_execute_exception_contained();
    test_error_kind_names();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
