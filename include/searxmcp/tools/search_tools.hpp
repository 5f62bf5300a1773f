#pragma once
#include "searxmcp/fetch/page_fetcher.hpp"
#include "searxmcp/search/backend.hpp"
#include "searxmcp/search/results.hpp"
#include "searxmcp/tools/manager.hpp"
#include "searxmcp/tools/outcome.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace searxmcp::tools
{

struct SearchToolOptions
{
    int default_max_results{10};
    int default_max_length{20000};
};

/// Appended to page text cut at max_length.
constexpr const char* TRUNCATION_MARKER = "\n\n... (content truncated)";

/**
 * The four SearXNG-backed tools: web_search, news_search, images_search and
 * fetch_page_content.
 *
 * Handlers validate their required argument, map recognised optional
 * arguments onto backend query parameters (anything else is ignored) and
 * report every failure as a ToolError instead of throwing.
 */
class SearchTools
{
  public:
    SearchTools(std::shared_ptr<search::SearchBackend> backend,
                std::shared_ptr<fetch::PageFetcher> fetcher, SearchToolOptions options = {});

    ToolOutcome web_search(const Json& args) const;
    ToolOutcome news_search(const Json& args) const;
    ToolOutcome images_search(const Json& args) const;
    ToolOutcome fetch_page_content(const Json& args) const;

    static Json web_search_schema();
    static Json news_search_schema();
    static Json images_search_schema();
    static Json fetch_page_content_schema();

  private:
    using Formatter = std::function<std::string(const search::SearchResponse&)>;

    /// Query the backend and render the parsed document; backend failures
    /// become the matching ToolError kind.
    ToolOutcome search_and_format(const search::QueryParams& params,
                                  const Formatter& format) const;

    std::shared_ptr<search::SearchBackend> backend_;
    std::shared_ptr<fetch::PageFetcher> fetcher_;
    SearchToolOptions options_;
};

/// Register the four tools, in declaration order, bound to a shared SearchTools.
void register_search_tools(ToolManager& manager, std::shared_ptr<const SearchTools> tools);

/// Backend query parameters for each search tool; exposed for testing.
search::QueryParams build_web_search_params(const Json& args);
search::QueryParams build_news_search_params(const Json& args);
search::QueryParams build_images_search_params(const Json& args);

/// Truthy argument rendered as a query value: non-empty strings, non-zero
/// numbers and true. nullopt for everything else, including absent keys.
std::optional<std::string> truthy_arg(const Json& args, const std::string& key);

/// Cut text to at most max_chars UTF-8 code points, appending TRUNCATION_MARKER
/// when anything was removed.
std::string truncate_text(const std::string& text, std::size_t max_chars);

} // namespace searxmcp::tools
