#pragma once
#include "searxmcp/search/results.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace searxmcp::search
{

enum class SearchKind
{
    Web,
    News
};

/// Render at most max_results hits as markdown. Optional sections (result
/// count, direct answers, snippet, metadata, suggestions) are omitted when
/// their data is absent.
std::string format_search_results(const SearchResponse& response, const std::string& query,
                                  std::size_t max_results, SearchKind kind = SearchKind::Web);

/// Image variant: embeds the image and names source and engine; snippet and
/// publish date are ignored.
std::string format_image_results(const SearchResponse& response, const std::string& query,
                                 std::size_t max_results);

/// 1234567 -> "1,234,567"
std::string group_thousands(std::int64_t value);

} // namespace searxmcp::search
