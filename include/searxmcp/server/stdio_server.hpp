#pragma once
#include "searxmcp/mcp/handler.hpp"
#include "searxmcp/types.hpp"

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace searxmcp::server
{

/**
 * Reads Content-Length framed messages:
 *
 *   Content-Length: <n>\r\n
 *   [other headers]\r\n
 *   \r\n
 *   <n bytes of body>
 *
 * Header names are case-insensitive; bare "\n" line endings are accepted.
 */
class FrameReader
{
  public:
    /// Frames announcing more than this are rejected as end of session.
    static constexpr std::size_t MAX_CONTENT_LENGTH = 64 * 1024 * 1024;

    explicit FrameReader(std::istream& in) : in_(in) {}

    /// Next body, or nullopt at end of session: EOF before the headers
    /// complete, a missing, zero or invalid Content-Length, or a short body.
    std::optional<std::string> read();

  private:
    std::istream& in_;
};

/// Writes Content-Length framed messages. Each frame (header block and body)
/// goes out as one write under a mutex and is flushed immediately.
class FrameWriter
{
  public:
    explicit FrameWriter(std::ostream& out) : out_(out) {}

    void write(const Json& message);
    void write_raw(const std::string& body);

    static std::string frame(const std::string& body);

  private:
    std::ostream& out_;
    std::mutex m_;
};

/**
 * Pipe transport: framed JSON-RPC over an input/output stream pair
 * (stdin/stdout by default).
 *
 * Each message is dispatched and its response written before the next one
 * is read, so output order equals input order. A body that is not JSON is
 * answered with a parse error and the loop continues.
 */
class StdioServerWrapper
{
  public:
    explicit StdioServerWrapper(mcp::McpHandler handler);
    StdioServerWrapper(mcp::McpHandler handler, std::istream& in, std::ostream& out);

    /// Serve until end of input. Returns the number of messages answered.
    std::size_t run();

    bool running() const
    {
        return running_.load();
    }

  private:
    mcp::McpHandler handler_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
};

} // namespace searxmcp::server
