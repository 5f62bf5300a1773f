#pragma once
#include <string>

namespace searxmcp::util
{

/**
 * Convert an HTML document to markdown-flavoured plain text.
 *
 * Drops script, style, nav, footer, header, aside, iframe and noscript
 * elements together with their content. Headings become "#" lines, links
 * "[text](href)", images "![alt](src)", list items "* ", strong/b "**" and
 * em/i "_". Character references are decoded and runs of whitespace are
 * collapsed outside <pre>. No line wrapping is applied.
 */
std::string html_to_text(const std::string& html);

/// Decode named and numeric character references ("&amp;", "&#233;", "&#xE9;").
std::string decode_entities(const std::string& text);

} // namespace searxmcp::util
