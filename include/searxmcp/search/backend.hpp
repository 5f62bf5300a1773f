#pragma once
#include "searxmcp/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace searxmcp::search
{

/// Ordered query string parameters sent to the search backend.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * Search backend seen by the tool layer.
 *
 * search() returns the backend's raw JSON document. Failures are reported by
 * throwing: TimeoutError, HttpStatusError, TransportError for connection
 * problems and ValidationError when the body is not JSON.
 */
class SearchBackend
{
  public:
    virtual ~SearchBackend() = default;

    virtual Json search(const QueryParams& params) = 0;

    /// Reachability probe used by /health. Never throws.
    virtual bool probe() = 0;
};

/**
 * SearXNG client over cpp-httplib.
 *
 * Issues GET <base_url>/search?...&format=json. The base URL may carry a path
 * prefix (e.g. http://host:8080/searx).
 */
class SearxngBackend : public SearchBackend
{
  public:
    explicit SearxngBackend(std::string base_url, int timeout_s = 30);

    Json search(const QueryParams& params) override;
    bool probe() override;

    const std::string& base_url() const
    {
        return base_url_;
    }

  private:
    std::string base_url_;
    std::string origin_;      // scheme://host[:port]
    std::string path_prefix_; // "" or "/prefix"
    int timeout_s_;
};

} // namespace searxmcp::search
