#include "searxmcp/search/format.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <vector>

namespace searxmcp::search
{

namespace
{

std::string join(const std::vector<std::string>& parts, const std::string& sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i)
            out += sep;
        out += parts[i];
    }
    return out;
}

std::string title_or_default(const SearchResult& r)
{
    return r.has_title ? r.title : std::string("Untitled");
}

} // namespace

std::string group_thousands(std::int64_t value)
{
    bool negative = value < 0;
    // unsigned negation keeps INT64_MIN representable
    std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(value)
                                       : static_cast<std::uint64_t>(value);
    std::string digits = std::to_string(magnitude);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it)
    {
        if (count && count % 3 == 0)
            out.push_back(',');
        out.push_back(*it);
        ++count;
    }
    if (negative)
        out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string format_search_results(const SearchResponse& response, const std::string& query,
                                  std::size_t max_results, SearchKind kind)
{
    std::vector<std::string> lines;
    const char* label = kind == SearchKind::News ? "news" : "web";
    lines.push_back(std::string("## Search results (") + label + "): \"" + query + "\"\n");

    if (response.number_of_results)
        lines.push_back("*Approximately " + group_thousands(response.number_of_results) +
                        " results found*\n");

    if (!response.answers.empty())
    {
        lines.push_back("### Direct answers\n");
        for (const auto& answer : response.answers)
            lines.push_back("> " + answer + "\n");
    }

    size_t shown = std::min(max_results, response.results.size());
    if (shown == 0)
    {
        lines.push_back("No results found.\n");
    }
    else
    {
        for (size_t i = 0; i < shown; ++i)
        {
            const auto& r = response.results[i];
            lines.push_back("### " + std::to_string(i + 1) + ". [" + title_or_default(r) + "](" +
                            r.url + ")\n");
            if (!r.content.empty())
                lines.push_back(r.content + "\n");

            std::vector<std::string> meta;
            if (!r.engines.empty())
                meta.push_back("Sources: " + join(r.engines, ", "));
            if (!r.published_date.empty())
                meta.push_back("Date: " + r.published_date);
            if (!meta.empty())
                lines.push_back("*" + join(meta, " | ") + "*\n");
        }
    }

    if (!response.suggestions.empty())
    {
        lines.push_back("\n### Related suggestions\n");
        for (const auto& s : response.suggestions)
            lines.push_back("- " + s);
    }

    return join(lines, "\n");
}

std::string format_image_results(const SearchResponse& response, const std::string& query,
                                 std::size_t max_results)
{
    std::vector<std::string> lines;
    lines.push_back("## Image results: \"" + query + "\"\n");

    size_t shown = std::min(max_results, response.results.size());
    if (shown == 0)
    {
        lines.push_back("No images found.\n");
        return join(lines, "\n");
    }

    for (size_t i = 0; i < shown; ++i)
    {
        const auto& r = response.results[i];
        std::string title = title_or_default(r);
        const std::string& image = r.img_src.empty() ? r.url : r.img_src;
        const std::string& source = r.source.empty() ? r.url : r.source;

        lines.push_back("### " + std::to_string(i + 1) + ". " + title + "\n");
        if (!image.empty())
            lines.push_back("![" + title + "](" + image + ")\n");
        if (!source.empty())
            lines.push_back("Source: " + source + "\n");
        if (!r.engines.empty())
            lines.push_back("*Engine: " + join(r.engines, ", ") + "*\n");
    }
    return join(lines, "\n");
}

} // namespace searxmcp::search
