/// @file sse_stream.cpp
/// @brief SseTransport delivery loop driven through an in-memory writer

#include "searxmcp/server/sse_server.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace searxmcp;
using namespace searxmcp::server;
using namespace std::chrono_literals;

namespace
{

Json echo_handler(const Json& request)
{
    return Json{{"jsonrpc", "2.0"}, {"id", request.value("id", Json())}, {"result", request}};
}

// Collects frames written by the delivery loop.
struct FrameLog
{
    std::mutex m;
    std::vector<std::string> frames;
    std::atomic<bool> fail_writes{false};

    SseTransport::EventWriter writer()
    {
        return [this](const std::string& frame)
        {
            if (fail_writes)
                return false;
            std::lock_guard<std::mutex> lock(m);
            frames.push_back(frame);
            return true;
        };
    }

    std::vector<std::string> snapshot()
    {
        std::lock_guard<std::mutex> lock(m);
        return frames;
    }

    bool wait_for(size_t count, std::chrono::milliseconds timeout = 3s)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (snapshot().size() >= count)
                return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }
};

bool wait_until_gone(const SseTransport& sse, const std::string& id)
{
    for (int i = 0; i < 300; ++i)
    {
        if (!sse.sessions().contains(id))
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

void test_endpoint_then_ordered_messages()
{
    SseTransport sse(echo_handler);
    FrameLog log;
    auto session = sse.open_session();
    std::thread loop([&] { sse.stream(session, log.writer()); });

    assert(log.wait_for(1));
    assert(log.snapshot()[0] ==
           "event: endpoint\ndata: /messages?sessionId=" + session->id + "\n\n");

    assert(sse.submit(session->id, Json{{"jsonrpc", "2.0"}, {"id", "R1"}, {"method", "x"}}) ==
           SseTransport::SubmitStatus::Accepted);
    assert(sse.submit(session->id, Json{{"jsonrpc", "2.0"}, {"id", "R2"}, {"method", "x"}}) ==
           SseTransport::SubmitStatus::Accepted);

    assert(log.wait_for(3));
    auto frames = log.snapshot();
    assert(frames[1].rfind("event: message\ndata: ", 0) == 0);
    assert(frames[1].find("\"R1\"") != std::string::npos);
    assert(frames[2].find("\"R2\"") != std::string::npos);
    assert(frames[1].substr(frames[1].size() - 2) == "\n\n");

    sse.shutdown();
    loop.join();
    assert(!sse.sessions().contains(session->id));
}

void test_keepalive_when_idle()
{
    SseOptions options;
    options.keepalive = 50ms;
    SseTransport sse(echo_handler, options);
    FrameLog log;
    auto session = sse.open_session();
    std::thread loop([&] { sse.stream(session, log.writer()); });

    assert(log.wait_for(3));
    auto frames = log.snapshot();
    assert(frames[1] == SseTransport::KEEPALIVE_FRAME);
    assert(frames[2] == ": keep-alive\n\n");

    sse.shutdown();
    loop.join();
}

void test_write_failure_deregisters()
{
    SseTransport sse(echo_handler);
    FrameLog log;
    auto session = sse.open_session();
    std::thread loop([&] { sse.stream(session, log.writer()); });
    assert(log.wait_for(1));

    log.fail_writes = true;
    sse.submit(session->id, Json{{"id", 1}});
    loop.join();
    assert(!sse.sessions().contains(session->id));

    // later submissions are rejected
    assert(sse.submit(session->id, Json{{"id", 2}}) == SseTransport::SubmitStatus::UnknownSession);
}

void test_dead_peer_detected_without_traffic()
{
    SseTransport sse(echo_handler);
    FrameLog log;
    std::atomic<bool> peer_alive{true};
    auto session = sse.open_session();
    std::thread loop([&] { sse.stream(session, log.writer(), [&] { return peer_alive.load(); }); });
    assert(log.wait_for(1));

    peer_alive = false;
    assert(wait_until_gone(sse, session->id));
    loop.join();
}

void test_endpoint_write_failure()
{
    SseTransport sse(echo_handler);
    auto session = sse.open_session();
    sse.stream(session, [](const std::string&) { return false; });
    assert(!sse.sessions().contains(session->id));
}

void test_sessions_are_isolated()
{
    SseTransport sse(echo_handler);
    FrameLog log_a;
    FrameLog log_b;
    auto a = sse.open_session();
    auto b = sse.open_session();
    std::thread loop_a([&] { sse.stream(a, log_a.writer()); });
    std::thread loop_b([&] { sse.stream(b, log_b.writer()); });
    assert(log_a.wait_for(1) && log_b.wait_for(1));

    sse.submit(b->id, Json{{"id", "for-b"}});
    assert(log_b.wait_for(2));
    std::this_thread::sleep_for(100ms);
    assert(log_a.snapshot().size() == 1);
    assert(log_b.snapshot()[1].find("for-b") != std::string::npos);

    sse.shutdown();
    loop_a.join();
    loop_b.join();
    assert(sse.sessions().size() == 0);
}

void test_non_positive_keepalive_uses_default()
{
    SseOptions options;
    options.keepalive = 0ms;
    SseTransport sse(echo_handler, options);
    assert(sse.options().keepalive == 30s);

    options.keepalive = -5s;
    SseTransport negative(echo_handler, options);
    assert(negative.options().keepalive == 30s);

    // no keep-alive burst right after the endpoint event
    FrameLog log;
    auto session = sse.open_session();
    std::thread loop([&] { sse.stream(session, log.writer()); });
    assert(log.wait_for(1));
    std::this_thread::sleep_for(300ms);
    assert(log.snapshot().size() == 1);
    sse.shutdown();
    loop.join();
}

void test_session_cap()
{
    SseOptions options;
    options.max_sessions = 2;
    SseTransport sse(echo_handler, options);
    auto a = sse.open_session();
    auto b = sse.open_session();
    assert(a && b);
    assert(!sse.open_session());
    assert(sse.sessions().size() == 2);

    // a closed stream frees its slot
    sse.stream(a, [](const std::string&) { return false; });
    auto c = sse.open_session();
    assert(c);
    assert(sse.sessions().size() == 2);
}

int main()
{
    assert(SseTransport::format_event("message", "{}") == "event: message\ndata: {}\n\n");

    test_endpoint_then_ordered_messages();
    test_keepalive_when_idle();
    test_write_failure_deregisters();
    test_dead_peer_detected_without_traffic();
    test_endpoint_write_failure();
    test_sessions_are_isolated();
    test_non_positive_keepalive_uses_default();
    test_session_cap();
    return 0;
}
