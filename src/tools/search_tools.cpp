#include "searxmcp/tools/search_tools.hpp"

#include "searxmcp/exceptions.hpp"
#include "searxmcp/search/format.hpp"
#include "searxmcp/search/results.hpp"
#include "searxmcp/util/html_text.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace searxmcp::tools
{

namespace
{

const char* const TIME_RANGES[] = {"day", "month", "year"};

Json string_prop(const std::string& description)
{
    return Json{{"type", "string"}, {"description", description}};
}

Json integer_prop(const std::string& description, int defv)
{
    return Json{{"type", "integer"}, {"description", description}, {"default", defv}};
}

Json time_range_prop()
{
    return Json{{"type", "string"},
                {"description", "Time filter: day, month, year. Optional."},
                {"enum", Json::array({TIME_RANGES[0], TIME_RANGES[1], TIME_RANGES[2]})}};
}

Json safesearch_prop(int defv)
{
    return Json{{"type", "integer"},
                {"description", "SafeSearch level: 0 (off), 1 (moderate), 2 (strict). Default: " +
                                    std::to_string(defv)},
                {"enum", Json::array({0, 1, 2})},
                {"default", defv}};
}

Json language_prop()
{
    return Json{{"type", "string"},
                {"description", "Language code (e.g. pt-BR, en, es). Default: pt-BR"},
                {"default", "pt-BR"}};
}

Json object_schema(Json properties, const std::string& required)
{
    return Json{{"type", "object"},
                {"properties", std::move(properties)},
                {"required", Json::array({required})}};
}

std::string scalar_text(const Json& v)
{
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number_integer())
        return std::to_string(v.get<long long>());
    if (v.is_boolean())
        return v.get<bool>() ? "1" : "0";
    return v.dump();
}

void put_if_truthy(search::QueryParams& params, const Json& args, const std::string& key)
{
    if (auto v = truthy_arg(args, key))
        params.emplace_back(key, *v);
}

// safesearch is forwarded whenever present, 0 included.
void put_if_present(search::QueryParams& params, const Json& args, const std::string& key)
{
    auto it = args.find(key);
    if (it != args.end() && !it->is_null())
        params.emplace_back(key, scalar_text(*it));
}

// Non-negative count argument. Negative values become 0, values beyond the
// range of size_t saturate, NaN keeps the default.
std::size_t count_arg(const Json& args, const char* key, std::size_t defv)
{
    constexpr auto max = std::numeric_limits<std::size_t>::max();
    auto it = args.find(key);
    if (it == args.end() || !it->is_number())
        return defv;
    if (it->is_number_unsigned())
        return static_cast<std::size_t>(std::min<std::uint64_t>(it->get<std::uint64_t>(), max));
    if (it->is_number_integer())
    {
        auto n = it->get<std::int64_t>();
        if (n <= 0)
            return 0;
        return static_cast<std::size_t>(
            std::min<std::uint64_t>(static_cast<std::uint64_t>(n), max));
    }
    double d = it->get<double>();
    if (std::isnan(d))
        return defv;
    if (d <= 0)
        return 0;
    if (d >= static_cast<double>(max))
        return max;
    return static_cast<std::size_t>(d);
}

std::size_t default_count(int configured)
{
    return configured < 0 ? 0 : static_cast<std::size_t>(configured);
}

bool is_text_content_type(const std::string& content_type)
{
    return content_type.find("text/html") != std::string::npos ||
           content_type.find("text/plain") != std::string::npos;
}

std::string trim(const std::string& s)
{
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::optional<std::string> truthy_arg(const Json& args, const std::string& key)
{
    if (!args.is_object())
        return std::nullopt;
    auto it = args.find(key);
    if (it == args.end())
        return std::nullopt;
    const Json& v = *it;
    if (v.is_string())
    {
        if (v.get_ref<const std::string&>().empty())
            return std::nullopt;
        return v.get<std::string>();
    }
    if (v.is_number_integer())
    {
        if (v.get<long long>() == 0)
            return std::nullopt;
        return std::to_string(v.get<long long>());
    }
    if (v.is_number_float())
    {
        if (v.get<double>() == 0.0)
            return std::nullopt;
        return v.dump();
    }
    if (v.is_boolean())
        return v.get<bool>() ? std::optional<std::string>("1") : std::nullopt;
    if ((v.is_array() || v.is_object()) && !v.empty())
        return v.dump();
    return std::nullopt;
}

std::string truncate_text(const std::string& text, std::size_t max_chars)
{
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        // count lead bytes only
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
        {
            if (chars == max_chars)
                return text.substr(0, i) + TRUNCATION_MARKER;
            ++chars;
        }
    }
    return text;
}

search::QueryParams build_web_search_params(const Json& args)
{
    search::QueryParams params;
    params.emplace_back("q", truthy_arg(args, "query").value_or(""));
    params.emplace_back("categories", truthy_arg(args, "categories").value_or("general"));
    put_if_truthy(params, args, "engines");
    put_if_truthy(params, args, "language");
    put_if_truthy(params, args, "time_range");
    put_if_truthy(params, args, "pageno");
    put_if_present(params, args, "safesearch");
    return params;
}

search::QueryParams build_news_search_params(const Json& args)
{
    search::QueryParams params;
    params.emplace_back("q", truthy_arg(args, "query").value_or(""));
    params.emplace_back("categories", "news");
    put_if_truthy(params, args, "language");
    put_if_truthy(params, args, "time_range");
    put_if_truthy(params, args, "pageno");
    return params;
}

search::QueryParams build_images_search_params(const Json& args)
{
    search::QueryParams params;
    params.emplace_back("q", truthy_arg(args, "query").value_or(""));
    params.emplace_back("categories", "images");
    put_if_truthy(params, args, "engines");
    put_if_truthy(params, args, "language");
    put_if_present(params, args, "safesearch");
    put_if_truthy(params, args, "pageno");
    return params;
}

SearchTools::SearchTools(std::shared_ptr<search::SearchBackend> backend,
                         std::shared_ptr<fetch::PageFetcher> fetcher, SearchToolOptions options)
    : backend_(std::move(backend)), fetcher_(std::move(fetcher)), options_(options)
{
}

ToolOutcome SearchTools::search_and_format(const search::QueryParams& params,
                                           const Formatter& format) const
{
    try
    {
        auto doc = backend_->search(params);
        return ToolResult::text(format(search::parse_search_response(doc)));
    }
    catch (const TimeoutError&)
    {
        return ToolError{ToolErrorKind::BackendTimeout, "timeout connecting to search backend"};
    }
    catch (const HttpStatusError& e)
    {
        return ToolError{ToolErrorKind::BackendStatus,
                         "search backend returned status " + std::to_string(e.status()) + ": " +
                             e.body()};
    }
    catch (const ValidationError& e)
    {
        return ToolError{ToolErrorKind::BackendMalformed,
                         std::string("search backend returned malformed JSON: ") + e.what()};
    }
    catch (const TransportError& e)
    {
        return ToolError{ToolErrorKind::BackendTransport,
                         std::string("could not connect to search backend: ") + e.what()};
    }
}

ToolOutcome SearchTools::web_search(const Json& args) const
{
    auto query = truthy_arg(args, "query");
    if (!query)
        return ToolError{ToolErrorKind::MissingArgument, "parameter 'query' is required"};

    auto max_results =
        count_arg(args, "max_results", default_count(options_.default_max_results));
    return search_and_format(build_web_search_params(args),
                             [&](const search::SearchResponse& response)
                             {
                                 return search::format_search_results(
                                     response, *query, max_results, search::SearchKind::Web);
                             });
}

ToolOutcome SearchTools::news_search(const Json& args) const
{
    auto query = truthy_arg(args, "query");
    if (!query)
        return ToolError{ToolErrorKind::MissingArgument, "parameter 'query' is required"};

    auto max_results =
        count_arg(args, "max_results", default_count(options_.default_max_results));
    return search_and_format(build_news_search_params(args),
                             [&](const search::SearchResponse& response)
                             {
                                 return search::format_search_results(
                                     response, *query, max_results, search::SearchKind::News);
                             });
}

ToolOutcome SearchTools::images_search(const Json& args) const
{
    auto query = truthy_arg(args, "query");
    if (!query)
        return ToolError{ToolErrorKind::MissingArgument, "parameter 'query' is required"};

    auto max_results =
        count_arg(args, "max_results", default_count(options_.default_max_results));
    return search_and_format(build_images_search_params(args),
                             [&](const search::SearchResponse& response)
                             { return search::format_image_results(response, *query, max_results); });
}

ToolOutcome SearchTools::fetch_page_content(const Json& args) const
{
    auto url = truthy_arg(args, "url");
    if (!url)
        return ToolError{ToolErrorKind::MissingArgument, "parameter 'url' is required"};

    auto max_length = count_arg(args, "max_length", default_count(options_.default_max_length));

    fetch::FetchedPage page;
    try
    {
        page = fetcher_->fetch(*url);
    }
    catch (const TimeoutError&)
    {
        return ToolError{ToolErrorKind::FetchFailed, "timeout accessing URL"};
    }
    catch (const TransportError& e)
    {
        return ToolError{ToolErrorKind::FetchFailed, std::string("error accessing URL: ") + e.what()};
    }

    if (page.status != 200)
        return ToolError{ToolErrorKind::FetchFailed,
                         "error accessing URL: status " + std::to_string(page.status)};
    if (!is_text_content_type(page.content_type))
        return ToolError{ToolErrorKind::UnsupportedContentType,
                         "unsupported content type: " + page.content_type};

    std::string text;
    try
    {
        if (page.content_type.find("text/html") != std::string::npos)
            text = util::html_to_text(page.body);
        else
            text = page.body;
    }
    catch (const std::exception& e)
    {
        return ToolError{ToolErrorKind::HtmlProcessing,
                         std::string("error processing HTML: ") + e.what()};
    }

    text = trim(truncate_text(text, max_length));
    return ToolResult::text("## Content of: " + *url + "\n\n" + text);
}

Json SearchTools::web_search_schema()
{
    return object_schema(
        Json{{"query", string_prop("Search terms")},
             {"categories",
              Json{{"type", "string"},
                   {"description", "Comma-separated categories (e.g. general, it, science, "
                                   "social media). Default: general"},
                   {"default", "general"}}},
             {"engines",
              string_prop("Comma-separated engines (e.g. google,bing,duckduckgo). Optional.")},
             {"language", language_prop()},
             {"time_range", time_range_prop()},
             {"pageno", integer_prop("Result page number. Default: 1", 1)},
             {"safesearch", safesearch_prop(0)},
             {"max_results", integer_prop("Maximum number of results to return. Default: 10", 10)}},
        "query");
}

Json SearchTools::news_search_schema()
{
    return object_schema(
        Json{{"query", string_prop("Search terms for news")},
             {"language", language_prop()},
             {"time_range", time_range_prop()},
             {"pageno", integer_prop("Result page number. Default: 1", 1)},
             {"max_results", integer_prop("Maximum number of results. Default: 10", 10)}},
        "query");
}

Json SearchTools::images_search_schema()
{
    return object_schema(
        Json{{"query", string_prop("Search terms for images")},
             {"engines", string_prop("Specific engines (e.g. google images, bing images). Optional.")},
             {"language", language_prop()},
             {"safesearch", safesearch_prop(1)},
             {"pageno", integer_prop("Result page number. Default: 1", 1)},
             {"max_results", integer_prop("Maximum number of results. Default: 10", 10)}},
        "query");
}

Json SearchTools::fetch_page_content_schema()
{
    return object_schema(
        Json{{"url", string_prop("URL of the page to read")},
             {"max_length",
              integer_prop("Maximum content length in characters. Default: 20000", 20000)}},
        "url");
}

void register_search_tools(ToolManager& manager, std::shared_ptr<const SearchTools> tools)
{
    manager.register_tool(Tool{
        "web_search",
        "General web search through SearXNG, a metasearch engine aggregating Google, Bing, "
        "DuckDuckGo, Brave and others. Returns titles, URLs, snippets and source engines.",
        SearchTools::web_search_schema(),
        [tools](const Json& args) { return tools->web_search(args); }});

    manager.register_tool(Tool{
        "news_search",
        "Search recent news through SearXNG (shortcut for the 'news' category). Returns titles, "
        "URLs, dates and sources.",
        SearchTools::news_search_schema(),
        [tools](const Json& args) { return tools->news_search(args); }});

    manager.register_tool(Tool{
        "images_search",
        "Search images through SearXNG. Returns image URLs, titles and sources.",
        SearchTools::images_search_schema(),
        [tools](const Json& args) { return tools->images_search(args); }});

    manager.register_tool(Tool{
        "fetch_page_content",
        "Fetch a URL and return its content as clean Markdown text. Useful for reading pages "
        "found through the search tools. Scripts, styles and page chrome are removed.",
        SearchTools::fetch_page_content_schema(),
        [tools](const Json& args) { return tools->fetch_page_content(args); }});
}

} // namespace searxmcp::tools
