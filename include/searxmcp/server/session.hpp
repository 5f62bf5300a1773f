#pragma once
#include "searxmcp/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace searxmcp::server
{

/**
 * Unbounded FIFO of outbound JSON-RPC messages for one SSE session.
 *
 * Any thread may push(); exactly one consumer (the session's delivery loop)
 * pops. close() wakes the consumer and makes further pushes fail.
 */
class SessionQueue
{
  public:
    /// false once the queue is closed.
    bool push(Json message);

    /// Next message, or nullopt on timeout or when the queue is closed and
    /// drained.
    std::optional<Json> pop(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    std::size_t size() const;

  private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<Json> queue_;
    bool closed_{false};
};

/// A logical SSE connection: an opaque id plus its outbound queue.
struct Session
{
    explicit Session(std::string session_id) : id(std::move(session_id)) {}

    const std::string id;
    SessionQueue queue;
};

/**
 * Owner of all live sessions (id -> queue).
 *
 * Only the SSE stream side creates and removes entries; the submission side
 * looks them up through enqueue() and contains(). cpp-httplib serves requests
 * on a thread pool, so every operation takes the registry mutex.
 */
class SessionRegistry
{
  public:
    /// Register a new session under a fresh UUID. With a non-zero limit,
    /// returns nullptr instead when that many sessions are already open.
    std::shared_ptr<Session> create(std::size_t limit = 0);

    /// Deregister and close. No-op for unknown ids.
    void remove(const std::string& id);

    /// Non-blocking. false when the id is not registered.
    bool enqueue(const std::string& id, Json message);

    bool contains(const std::string& id) const;
    std::shared_ptr<Session> find(const std::string& id) const;
    std::size_t size() const;

    /// Close every session queue so delivery loops exit (server shutdown).
    void close_all();

  private:
    mutable std::mutex m_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

/// Removes a session from its registry when the owning scope exits.
class SessionGuard
{
  public:
    SessionGuard(SessionRegistry& registry, std::string id)
        : registry_(registry), id_(std::move(id))
    {
    }
    ~SessionGuard()
    {
        registry_.remove(id_);
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

  private:
    SessionRegistry& registry_;
    std::string id_;
};

} // namespace searxmcp::server
