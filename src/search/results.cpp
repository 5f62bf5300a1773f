#include "searxmcp/search/results.hpp"

#include "searxmcp/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace searxmcp::search
{

namespace
{

std::string string_field(const Json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

std::vector<std::string> string_list(const Json& obj, const char* key)
{
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array())
        return out;
    for (const auto& item : *it)
        if (item.is_string())
            out.push_back(item.get<std::string>());
    return out;
}

// SearXNG answers are either plain strings or {answer, url, ...} objects.
std::string answer_text(const Json& answer)
{
    if (answer.is_string())
        return answer.get<std::string>();
    if (answer.is_object() && answer.contains("answer") && answer["answer"].is_string())
        return answer["answer"].get<std::string>();
    return answer.dump();
}

// Result counts are reported as integers or floats; negative and NaN values
// read as 0 and anything past int64 saturates.
std::int64_t count_field(const Json& v)
{
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    if (v.is_number_unsigned())
        return static_cast<std::int64_t>(
            std::min<std::uint64_t>(v.get<std::uint64_t>(), static_cast<std::uint64_t>(max)));
    if (v.is_number_integer())
        return std::max<std::int64_t>(v.get<std::int64_t>(), 0);
    double d = v.get<double>();
    if (std::isnan(d) || d <= 0)
        return 0;
    if (d >= static_cast<double>(max))
        return max;
    return static_cast<std::int64_t>(d);
}

SearchResult parse_result(const Json& r)
{
    SearchResult out;
    if (!r.is_object())
        return out;
    out.has_title = r.contains("title") && r["title"].is_string();
    out.title = string_field(r, "title");
    out.url = string_field(r, "url");
    out.content = string_field(r, "content");
    out.engines = string_list(r, "engines");
    out.published_date = string_field(r, "publishedDate");
    out.img_src = string_field(r, "img_src");
    out.thumbnail_src = string_field(r, "thumbnail_src");
    out.source = string_field(r, "source");
    return out;
}

} // namespace

SearchResponse parse_search_response(const Json& doc)
{
    if (!doc.is_object())
        throw ValidationError("search response is not a JSON object");

    SearchResponse out;
    if (auto it = doc.find("results"); it != doc.end() && it->is_array())
    {
        out.results.reserve(it->size());
        for (const auto& r : *it)
            out.results.push_back(parse_result(r));
    }
    if (auto it = doc.find("answers"); it != doc.end() && it->is_array())
    {
        for (const auto& a : *it)
            out.answers.push_back(answer_text(a));
    }
    out.suggestions = string_list(doc, "suggestions");
    if (auto it = doc.find("number_of_results"); it != doc.end() && it->is_number())
        out.number_of_results = count_field(*it);
    return out;
}

} // namespace searxmcp::search
