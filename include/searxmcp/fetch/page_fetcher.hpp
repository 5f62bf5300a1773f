#pragma once
#include <string>

namespace searxmcp::fetch
{

constexpr const char* DEFAULT_USER_AGENT = "Mozilla/5.0 (compatible; MCP-SearXNG/1.0)";

struct FetchedPage
{
    long status{0};
    std::string content_type;
    std::string body;
};

/// Raw page download. Throws TimeoutError or TransportError; any HTTP status
/// is returned, not thrown.
class PageFetcher
{
  public:
    virtual ~PageFetcher() = default;
    virtual FetchedPage fetch(const std::string& url) = 0;
};

/// libcurl implementation: follows redirects, sends a fixed user agent and
/// bounds the whole transfer by timeout_s.
class CurlPageFetcher : public PageFetcher
{
  public:
    explicit CurlPageFetcher(int timeout_s = 30, std::string user_agent = DEFAULT_USER_AGENT);

    FetchedPage fetch(const std::string& url) override;

  private:
    int timeout_s_;
    std::string user_agent_;
};

} // namespace searxmcp::fetch
