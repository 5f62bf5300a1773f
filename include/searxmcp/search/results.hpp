#pragma once
#include "searxmcp/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace searxmcp::search
{

/// One backend hit. Every field is optional upstream; absent ones stay empty.
struct SearchResult
{
    std::string title;
    std::string url;
    std::string content;
    std::vector<std::string> engines;
    std::string published_date;
    // image category extras
    std::string img_src;
    std::string thumbnail_src;
    std::string source;
    bool has_title{false};
};

struct SearchResponse
{
    std::vector<SearchResult> results;
    std::vector<std::string> answers;
    std::vector<std::string> suggestions;
    std::int64_t number_of_results{0};
};

/// Build the typed view of a SearXNG JSON document.
/// Throws ValidationError when the document is not a JSON object.
SearchResponse parse_search_response(const Json& doc);

} // namespace searxmcp::search
