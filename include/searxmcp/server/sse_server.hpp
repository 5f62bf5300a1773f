#pragma once
#include "searxmcp/mcp/handler.hpp"
#include "searxmcp/server/session.hpp"
#include "searxmcp/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace httplib
{
class Server;
}

namespace searxmcp::server
{

struct SseOptions
{
    std::string sse_path{"/sse"};
    std::string message_path{"/messages"};
    /// Idle time after which a comment-only keep-alive frame is written.
    /// Values <= 0 fall back to 30 s.
    std::chrono::milliseconds keepalive{std::chrono::seconds(30)};
    /// Concurrent streams; GET beyond this answers 503. 0 means unbounded.
    std::size_t max_sessions{32};
};

/**
 * SSE (Server-Sent Events) session multiplexer.
 *
 * - GET <sse_path>: registers a session, emits
 *     event: endpoint
 *     data: <message_path>?sessionId=<id>
 *   and then streams every queued response as "event: message" until the
 *   peer disconnects or the server shuts down. Idle periods produce
 *   ": keep-alive" comment frames, which carry no payload.
 * - POST <message_path>?sessionId=<id>: dispatches the JSON-RPC body,
 *   enqueues the response on that session and answers 202 right away. The
 *   real result arrives later on the stream. Unknown ids get 400.
 *
 * Every open stream occupies one HTTP worker thread for its lifetime, so
 * streams are capped at max_sessions and the server's pool must be sized
 * above that cap.
 *
 * The session is deregistered on every exit path of its delivery loop.
 */
class SseTransport
{
  public:
    /// Writes one complete SSE frame; false when the peer is gone.
    using EventWriter = std::function<bool(const std::string&)>;
    /// Polled between waits; false when the peer is gone.
    using AliveCheck = std::function<bool()>;

    enum class SubmitStatus
    {
        Accepted,
        UnknownSession
    };

    static constexpr const char* KEEPALIVE_FRAME = ": keep-alive\n\n";

    explicit SseTransport(mcp::McpHandler handler, SseOptions options = {});

    /// Install the GET and POST routes on an HTTP server.
    void mount(httplib::Server& svr);

    /// Register a new session. Its delivery loop must be started with stream().
    /// nullptr when max_sessions streams are already open.
    std::shared_ptr<Session> open_session();

    /**
     * Delivery loop for one session: endpoint event, then queued messages in
     * FIFO order with keep-alives when idle. Returns when write fails,
     * alive() turns false, or shutdown() is called; the session is removed
     * from the registry before returning.
     */
    void stream(const std::shared_ptr<Session>& session, const EventWriter& write,
                const AliveCheck& alive = nullptr);

    /// Dispatch synchronously and enqueue the response for the session.
    /// Completes independently of when the stream flushes it.
    SubmitStatus submit(const std::string& session_id, const Json& request);

    /// Stop all delivery loops. Idempotent.
    void shutdown();

    const SessionRegistry& sessions() const
    {
        return sessions_;
    }
    const SseOptions& options() const
    {
        return options_;
    }

    /// "<message_path>?sessionId=<id>"
    std::string endpoint_for(const std::string& session_id) const;

    static std::string format_event(const std::string& event, const std::string& data);

  private:
    mcp::McpHandler handler_;
    SseOptions options_;
    SessionRegistry sessions_;
    std::atomic<bool> running_{true};
};

} // namespace searxmcp::server
