/// @file test_session_state.cpp
/// @brief Tests for the SSE session registry and per-session queues

#include "searxmcp/server/session.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace searxmcp;
using namespace searxmcp::server;
using namespace std::chrono_literals;

void test_create_registers_unique_ids()
{
    SessionRegistry registry;
    auto a = registry.create();
    auto b = registry.create();
    assert(a->id != b->id);
    assert(a->id.size() == 36);
    assert(registry.size() == 2);
    assert(registry.contains(a->id));
    assert(registry.find(b->id) == b);
}

void test_remove_closes_queue()
{
    SessionRegistry registry;
    auto s = registry.create();
    registry.remove(s->id);
    assert(!registry.contains(s->id));
    assert(registry.size() == 0);
    assert(s->queue.closed());
    assert(!s->queue.push(Json{{"late", true}}));

    // unknown ids are ignored
    registry.remove(s->id);
    registry.remove("never-existed");
}

void test_enqueue_fifo()
{
    SessionRegistry registry;
    auto s = registry.create();
    assert(registry.enqueue(s->id, Json{{"n", 1}}));
    assert(registry.enqueue(s->id, Json{{"n", 2}}));
    assert(registry.enqueue(s->id, Json{{"n", 3}}));
    assert(s->queue.size() == 3);

    assert(s->queue.pop(10ms)->at("n") == 1);
    assert(s->queue.pop(10ms)->at("n") == 2);
    assert(s->queue.pop(10ms)->at("n") == 3);
    assert(!s->queue.pop(10ms));
}

void test_enqueue_unknown_session()
{
    SessionRegistry registry;
    assert(!registry.enqueue("nope", Json::object()));
    auto s = registry.create();
    registry.remove(s->id);
    assert(!registry.enqueue(s->id, Json::object()));
}

void test_pop_wakes_on_push()
{
    SessionQueue queue;
    std::thread producer(
        [&]
        {
            std::this_thread::sleep_for(50ms);
            queue.push(Json{{"hello", "world"}});
        });
    auto start = std::chrono::steady_clock::now();
    auto message = queue.pop(5s);
    auto waited = std::chrono::steady_clock::now() - start;
    producer.join();
    assert(message);
    assert((*message)["hello"] == "world");
    assert(waited < 4s);
}

void test_pop_wakes_on_close()
{
    SessionQueue queue;
    std::thread closer(
        [&]
        {
            std::this_thread::sleep_for(50ms);
            queue.close();
        });
    auto start = std::chrono::steady_clock::now();
    auto message = queue.pop(5s);
    auto waited = std::chrono::steady_clock::now() - start;
    closer.join();
    assert(!message);
    assert(waited < 4s);
}

void test_queued_messages_drain_after_close()
{
    SessionQueue queue;
    queue.push(Json{{"n", 1}});
    queue.close();
    auto first = queue.pop(10ms);
    assert(first && (*first)["n"] == 1);
    assert(!queue.pop(10ms));
}

void test_guard_removes_on_scope_exit()
{
    SessionRegistry registry;
    std::string id;
    {
        auto s = registry.create();
        id = s->id;
        SessionGuard guard(registry, id);
        assert(registry.contains(id));
    }
    assert(!registry.contains(id));
}

void test_guard_removes_on_exception()
{
    SessionRegistry registry;
    auto s = registry.create();
    bool caught = false;
    try
    {
        SessionGuard guard(registry, s->id);
        throw std::runtime_error("stream failed");
    }
    catch (const std::runtime_error&)
    {
        caught = true;
    }
    assert(caught);
    assert(!registry.contains(s->id));
}

void test_close_all()
{
    SessionRegistry registry;
    auto a = registry.create();
    auto b = registry.create();
    registry.close_all();
    assert(a->queue.closed());
    assert(b->queue.closed());
}

void test_create_respects_limit()
{
    SessionRegistry registry;
    auto a = registry.create(2);
    auto b = registry.create(2);
    assert(a && b);
    assert(registry.create(2) == nullptr);
    assert(registry.size() == 2);

    registry.remove(a->id);
    assert(registry.create(2) != nullptr);
    // no limit
    assert(registry.create() != nullptr);
    assert(registry.size() == 3);
}

int main()
{
    test_create_registers_unique_ids();
    test_remove_closes_queue();
    test_enqueue_fifo();
    test_enqueue_unknown_session();
    test_pop_wakes_on_push();
    test_pop_wakes_on_close();
    test_queued_messages_drain_after_close();
    test_guard_removes_on_scope_exit();
    test_guard_removes_on_exception();
    test_close_all();
    test_create_respects_limit();
    return 0;
}
