#include "searxmcp/util/html_text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace searxmcp::util
{

namespace
{

const std::unordered_set<std::string>& skipped_elements()
{
    static const std::unordered_set<std::string> names = {
        "script", "style", "nav", "footer", "header", "aside", "iframe", "noscript", "head",
        "template", "svg"};
    return names;
}

const std::unordered_set<std::string>& block_elements()
{
    static const std::unordered_set<std::string> names = {
        "p",       "div",   "section", "article", "main",  "table", "tr",   "ul",
        "ol",      "dl",    "dt",      "dd",      "form",  "fieldset", "figure",
        "figcaption", "blockquote", "pre", "address", "body", "html"};
    return names;
}

const std::unordered_map<std::string, std::string>& named_entities()
{
    static const std::unordered_map<std::string, std::string> names = {
        {"amp", "&"},      {"lt", "<"},       {"gt", ">"},      {"quot", "\""},
        {"apos", "'"},     {"nbsp", " "},     {"mdash", "\xE2\x80\x94"},
        {"ndash", "\xE2\x80\x93"}, {"hellip", "\xE2\x80\xA6"}, {"copy", "\xC2\xA9"},
        {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"}, {"laquo", "\xC2\xAB"},
        {"raquo", "\xC2\xBB"}, {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"}, {"middot", "\xC2\xB7"},
        {"bull", "\xE2\x80\xA2"}, {"euro", "\xE2\x82\xAC"}};
    return names;
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void append_utf8(std::string& out, uint32_t cp)
{
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        cp = 0xFFFD;
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

struct Tag
{
    std::string name;
    bool closing{false};
    bool self_closing{false};
    std::unordered_map<std::string, std::string> attrs;
};

// Parses the tag starting at html[pos] == '<'. Returns the index one past '>'.
size_t parse_tag(const std::string& html, size_t pos, Tag& tag)
{
    size_t i = pos + 1;
    const size_t n = html.size();
    if (i < n && html[i] == '/')
    {
        tag.closing = true;
        ++i;
    }
    size_t name_start = i;
    while (i < n && !std::isspace(static_cast<unsigned char>(html[i])) && html[i] != '>' &&
           html[i] != '/')
        ++i;
    tag.name = to_lower(html.substr(name_start, i - name_start));

    while (i < n && html[i] != '>')
    {
        if (std::isspace(static_cast<unsigned char>(html[i])))
        {
            ++i;
            continue;
        }
        if (html[i] == '/')
        {
            tag.self_closing = true;
            ++i;
            continue;
        }
        size_t key_start = i;
        while (i < n && html[i] != '=' && html[i] != '>' &&
               !std::isspace(static_cast<unsigned char>(html[i])) && html[i] != '/')
            ++i;
        std::string key = to_lower(html.substr(key_start, i - key_start));
        std::string value;
        while (i < n && std::isspace(static_cast<unsigned char>(html[i])))
            ++i;
        if (i < n && html[i] == '=')
        {
            ++i;
            while (i < n && std::isspace(static_cast<unsigned char>(html[i])))
                ++i;
            if (i < n && (html[i] == '"' || html[i] == '\''))
            {
                char quote = html[i++];
                size_t value_start = i;
                while (i < n && html[i] != quote)
                    ++i;
                value = html.substr(value_start, i - value_start);
                if (i < n)
                    ++i;
            }
            else
            {
                size_t value_start = i;
                while (i < n && html[i] != '>' && !std::isspace(static_cast<unsigned char>(html[i])))
                    ++i;
                value = html.substr(value_start, i - value_start);
            }
        }
        if (!key.empty())
            tag.attrs[key] = decode_entities(value);
    }
    return i < n ? i + 1 : n;
}

// Position just past the matching close tag of a skipped element.
// True when the tag name that ends at pos is complete, so "</head" does not
// match "</header".
bool name_ends(const std::string& html, size_t pos)
{
    return pos >= html.size() || html[pos] == '>' || html[pos] == '/' ||
           std::isspace(static_cast<unsigned char>(html[pos]));
}

size_t skip_element(const std::string& html, const std::string& lower_html, size_t pos,
                    const std::string& name)
{
    const std::string open = "<" + name;
    const std::string close = "</" + name;
    int depth = 1;
    bool raw = name == "script" || name == "style";
    size_t i = pos;
    while (depth > 0)
    {
        size_t next_close = lower_html.find(close, i);
        if (next_close == std::string::npos)
            return html.size();
        if (!raw)
        {
            size_t next_open = lower_html.find(open, i);
            if (next_open != std::string::npos && next_open < next_close)
            {
                size_t after = next_open + open.size();
                if (after < html.size() &&
                    (html[after] == '>' || std::isspace(static_cast<unsigned char>(html[after]))))
                    ++depth;
                i = after;
                continue;
            }
        }
        size_t after_close = next_close + close.size();
        if (!name_ends(html, after_close))
        {
            i = after_close;
            continue;
        }
        --depth;
        size_t end = html.find('>', next_close);
        i = end == std::string::npos ? html.size() : end + 1;
    }
    return i;
}

class TextBuilder
{
  public:
    void text(const std::string& raw, bool preformatted)
    {
        std::string decoded = decode_entities(raw);
        if (preformatted)
        {
            out_ += decoded;
            return;
        }
        for (char c : decoded)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                pending_space_ = true;
                continue;
            }
            if (pending_space_ && !out_.empty() && out_.back() != '\n' && out_.back() != ' ')
                out_.push_back(' ');
            pending_space_ = false;
            out_.push_back(c);
        }
    }

    void raw(const std::string& s)
    {
        if (pending_space_ && !out_.empty() && out_.back() != '\n' && out_.back() != ' ')
            out_.push_back(' ');
        pending_space_ = false;
        out_ += s;
    }

    void newline(int count)
    {
        pending_space_ = false;
        while (!out_.empty() && out_.back() == ' ')
            out_.pop_back();
        int have = 0;
        for (auto it = out_.rbegin(); it != out_.rend() && *it == '\n'; ++it)
            ++have;
        if (out_.empty())
            return;
        for (; have < count; ++have)
            out_.push_back('\n');
    }

    size_t mark() const
    {
        return out_.size();
    }

    void wrap_link(size_t start, const std::string& href)
    {
        if (start > out_.size())
            start = out_.size();
        std::string label = out_.substr(start);
        while (!label.empty() && label.back() == ' ')
            label.pop_back();
        size_t lead = label.find_first_not_of(' ');
        if (lead == std::string::npos)
            lead = label.size();
        out_.resize(start);
        out_.append(lead, ' ');
        label.erase(0, lead);
        if (label.empty() || href.empty() || href.rfind("javascript:", 0) == 0)
        {
            out_ += label;
            return;
        }
        out_ += "[" + label + "](" + href + ")";
    }

    std::string finish()
    {
        // Strip trailing spaces on each line and collapse blank-line runs.
        std::string cleaned;
        cleaned.reserve(out_.size());
        int newlines = 0;
        for (char c : out_)
        {
            if (c == '\n')
            {
                while (!cleaned.empty() && cleaned.back() == ' ')
                    cleaned.pop_back();
                if (++newlines > 2)
                    continue;
            }
            else
            {
                newlines = 0;
            }
            cleaned.push_back(c);
        }
        size_t first = cleaned.find_first_not_of(" \n");
        if (first == std::string::npos)
            return {};
        size_t last = cleaned.find_last_not_of(" \n");
        return cleaned.substr(first, last - first + 1);
    }

  private:
    std::string out_;
    bool pending_space_{false};
};

} // namespace

std::string decode_entities(const std::string& text)
{
    if (text.find('&') == std::string::npos)
        return text;

    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '&')
        {
            out.push_back(text[i++]);
            continue;
        }
        size_t semi = text.find(';', i);
        if (semi == std::string::npos || semi - i > 12)
        {
            out.push_back(text[i++]);
            continue;
        }
        std::string ref = text.substr(i + 1, semi - i - 1);
        if (!ref.empty() && ref[0] == '#')
        {
            uint32_t cp = 0;
            bool ok = ref.size() > 1;
            bool hex = ok && (ref[1] == 'x' || ref[1] == 'X');
            for (size_t k = hex ? 2 : 1; ok && k < ref.size(); ++k)
            {
                char c = ref[k];
                if (hex && std::isxdigit(static_cast<unsigned char>(c)))
                    cp = cp * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(c))
                                                              ? c - '0'
                                                              : std::tolower(c) - 'a' + 10);
                else if (!hex && std::isdigit(static_cast<unsigned char>(c)))
                    cp = cp * 10 + static_cast<uint32_t>(c - '0');
                else
                    ok = false;
                if (cp > 0x10FFFF)
                    ok = false;
            }
            if (ok && ref.size() > (hex ? 2u : 1u))
            {
                append_utf8(out, cp);
                i = semi + 1;
                continue;
            }
        }
        else
        {
            auto it = named_entities().find(ref);
            if (it != named_entities().end())
            {
                out += it->second;
                i = semi + 1;
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

std::string html_to_text(const std::string& html)
{
    const std::string lower_html = to_lower(html);
    TextBuilder out;

    struct OpenLink
    {
        size_t mark;
        std::string href;
    };
    std::vector<OpenLink> links;
    int pre_depth = 0;

    size_t i = 0;
    const size_t n = html.size();
    while (i < n)
    {
        if (html[i] != '<')
        {
            size_t next = html.find('<', i);
            if (next == std::string::npos)
                next = n;
            out.text(html.substr(i, next - i), pre_depth > 0);
            i = next;
            continue;
        }

        if (html.compare(i, 4, "<!--") == 0)
        {
            size_t end = html.find("-->", i + 4);
            i = end == std::string::npos ? n : end + 3;
            continue;
        }
        if (i + 1 < n && (html[i + 1] == '!' || html[i + 1] == '?'))
        {
            size_t end = html.find('>', i);
            i = end == std::string::npos ? n : end + 1;
            continue;
        }
        if (i + 1 >= n || !(std::isalpha(static_cast<unsigned char>(html[i + 1])) ||
                             html[i + 1] == '/'))
        {
            out.text("<", pre_depth > 0);
            ++i;
            continue;
        }

        Tag tag;
        size_t after = parse_tag(html, i, tag);
        i = after;
        const std::string& name = tag.name;

        if (!tag.closing && skipped_elements().count(name))
        {
            if (!tag.self_closing)
                i = skip_element(html, lower_html, i, name);
            continue;
        }

        if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6')
        {
            out.newline(2);
            if (!tag.closing)
                out.raw(std::string(static_cast<size_t>(name[1] - '0'), '#') + " ");
            continue;
        }
        if (name == "br")
        {
            out.newline(1);
            continue;
        }
        if (name == "hr")
        {
            out.newline(2);
            out.raw("* * *");
            out.newline(2);
            continue;
        }
        if (name == "li")
        {
            if (!tag.closing)
            {
                out.newline(1);
                out.raw("* ");
            }
            else
            {
                out.newline(1);
            }
            continue;
        }
        if (name == "a")
        {
            if (!tag.closing)
            {
                auto href = tag.attrs.find("href");
                links.push_back(
                    OpenLink{out.mark(), href == tag.attrs.end() ? std::string() : href->second});
            }
            else if (!links.empty())
            {
                out.wrap_link(links.back().mark, links.back().href);
                links.pop_back();
            }
            continue;
        }
        if (name == "img")
        {
            auto src = tag.attrs.find("src");
            if (src != tag.attrs.end() && !src->second.empty())
            {
                auto alt = tag.attrs.find("alt");
                out.raw("![" + (alt == tag.attrs.end() ? std::string() : alt->second) + "](" +
                        src->second + ")");
            }
            continue;
        }
        if (name == "strong" || name == "b")
        {
            out.raw("**");
            continue;
        }
        if (name == "em" || name == "i")
        {
            out.raw("_");
            continue;
        }
        if (name == "pre")
        {
            out.newline(2);
            pre_depth += tag.closing ? -1 : 1;
            if (pre_depth < 0)
                pre_depth = 0;
            continue;
        }
        if (name == "td" || name == "th")
        {
            if (tag.closing)
                out.raw(" | ");
            continue;
        }
        if (block_elements().count(name))
        {
            out.newline(2);
            continue;
        }
    }

    return out.finish();
}

} // namespace searxmcp::util
