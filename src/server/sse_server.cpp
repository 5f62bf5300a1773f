#include "searxmcp/server/sse_server.hpp"

#include "searxmcp/util/json.hpp"

#include <algorithm>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace searxmcp::server
{

namespace
{
// Upper bound on a single queue wait so shutdown and dead peers are noticed
// without waiting for a full keep-alive period.
constexpr std::chrono::milliseconds POLL_SLICE{100};

const char* const SESSION_NOT_FOUND =
    "{\"error\":\"SSE session not found. Connect to GET /sse first\"}";

const char* const TOO_MANY_SESSIONS = "{\"error\":\"Too many open SSE sessions\"}";

constexpr std::chrono::milliseconds DEFAULT_KEEPALIVE{std::chrono::seconds(30)};
} // namespace

SseTransport::SseTransport(mcp::McpHandler handler, SseOptions options)
    : handler_(std::move(handler)), options_(std::move(options))
{
    if (options_.keepalive <= std::chrono::milliseconds::zero())
        options_.keepalive = DEFAULT_KEEPALIVE;
}

std::string SseTransport::endpoint_for(const std::string& session_id) const
{
    return options_.message_path + "?sessionId=" + session_id;
}

std::string SseTransport::format_event(const std::string& event, const std::string& data)
{
    return "event: " + event + "\ndata: " + data + "\n\n";
}

std::shared_ptr<Session> SseTransport::open_session()
{
    auto session = sessions_.create(options_.max_sessions);
    if (!session)
    {
        spdlog::warn("SSE session refused: {} sessions already open", options_.max_sessions);
        return nullptr;
    }
    spdlog::info("New SSE session: {}", session->id);
    return session;
}

void SseTransport::stream(const std::shared_ptr<Session>& session, const EventWriter& write,
                          const AliveCheck& alive)
{
    SessionGuard guard(sessions_, session->id);

    try
    {
        if (!write(format_event("endpoint", endpoint_for(session->id))))
        {
            spdlog::info("SSE session closed before endpoint event: {}", session->id);
            return;
        }

        auto slice = std::min(POLL_SLICE, options_.keepalive);
        auto idle_deadline = std::chrono::steady_clock::now() + options_.keepalive;

        while (running_)
        {
            auto message = session->queue.pop(slice);
            if (message)
            {
                if (!write(format_event("message", util::json::dump(*message))))
                    break;
                idle_deadline = std::chrono::steady_clock::now() + options_.keepalive;
                continue;
            }

            if (session->queue.closed() || !running_)
                break;
            if (alive && !alive())
                break;

            if (std::chrono::steady_clock::now() >= idle_deadline)
            {
                if (!write(KEEPALIVE_FRAME))
                    break;
                idle_deadline = std::chrono::steady_clock::now() + options_.keepalive;
            }
        }
    }
    catch (const std::exception& e)
    {
        spdlog::error("SSE session {} aborted: {}", session->id, e.what());
    }

    spdlog::info("SSE session closed: {}", session->id);
}

SseTransport::SubmitStatus SseTransport::submit(const std::string& session_id,
                                                const Json& request)
{
    if (!sessions_.contains(session_id))
        return SubmitStatus::UnknownSession;

    auto response = handler_(request);
    if (!sessions_.enqueue(session_id, std::move(response)))
        return SubmitStatus::UnknownSession;
    return SubmitStatus::Accepted;
}

void SseTransport::shutdown()
{
    running_ = false;
    sessions_.close_all();
}

void SseTransport::mount(httplib::Server& svr)
{
    svr.Get(options_.sse_path,
            [this](const httplib::Request&, httplib::Response& res)
            {
                auto session = open_session();
                if (!session)
                {
                    res.status = 503;
                    res.set_content(TOO_MANY_SESSIONS, "application/json");
                    return;
                }

                res.status = 200;
                res.set_header("Cache-Control", "no-cache");
                res.set_header("Connection", "keep-alive");
                res.set_header("X-Accel-Buffering", "no");

                res.set_chunked_content_provider(
                    "text/event-stream",
                    [this, session](size_t /*offset*/, httplib::DataSink& sink)
                    {
                        stream(
                            session,
                            [&sink](const std::string& frame)
                            { return sink.write(frame.data(), frame.size()); },
                            [&sink]() { return sink.is_writable(); });
                        sink.done();
                        return true;
                    },
                    // covers a peer that leaves before the provider runs
                    [this, id = session->id](bool) { sessions_.remove(id); });
            });

    svr.Post(options_.message_path,
             [this](const httplib::Request& req, httplib::Response& res)
             {
                 std::string session_id;
                 if (req.has_param("sessionId"))
                     session_id = req.get_param_value("sessionId");
                 if (session_id.empty() || !sessions_.contains(session_id))
                 {
                     res.status = 400;
                     res.set_content(SESSION_NOT_FOUND, "application/json");
                     return;
                 }

                 Json request;
                 try
                 {
                     request = util::json::parse(req.body);
                 }
                 catch (const Json::parse_error&)
                 {
                     res.status = 400;
                     res.set_content(util::json::dump(mcp::parse_error_response()),
                                     "application/json");
                     return;
                 }

                 if (submit(session_id, request) == SubmitStatus::UnknownSession)
                 {
                     res.status = 400;
                     res.set_content(SESSION_NOT_FOUND, "application/json");
                     return;
                 }

                 res.status = 202;
                 res.set_content("{\"status\":\"accepted\"}", "application/json");
             });
}

} // namespace searxmcp::server
