#include "searxmcp/server/session.hpp"

#include "searxmcp/util/uuid.hpp"

namespace searxmcp::server
{

bool SessionQueue::push(Json message)
{
    {
        std::lock_guard<std::mutex> lock(m_);
        if (closed_)
            return false;
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::optional<Json> SessionQueue::pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || closed_; });
    if (queue_.empty())
        return std::nullopt;
    Json message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void SessionQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool SessionQueue::closed() const
{
    std::lock_guard<std::mutex> lock(m_);
    return closed_;
}

std::size_t SessionQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_);
    return queue_.size();
}

std::shared_ptr<Session> SessionRegistry::create(std::size_t limit)
{
    std::lock_guard<std::mutex> lock(m_);
    if (limit && sessions_.size() >= limit)
        return nullptr;
    std::string id = util::generate_uuid4();
    while (sessions_.count(id))
        id = util::generate_uuid4();
    auto session = std::make_shared<Session>(id);
    sessions_.emplace(id, session);
    return session;
}

void SessionRegistry::remove(const std::string& id)
{
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_);
        auto it = sessions_.find(id);
        if (it == sessions_.end())
            return;
        session = std::move(it->second);
        sessions_.erase(it);
    }
    session->queue.close();
}

bool SessionRegistry::enqueue(const std::string& id, Json message)
{
    auto session = find(id);
    if (!session)
        return false;
    return session->queue.push(std::move(message));
}

bool SessionRegistry::contains(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_);
    return sessions_.count(id) != 0;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(m_);
    auto it = sessions_.find(id);
    if (it == sessions_.end())
        return nullptr;
    return it->second;
}

std::size_t SessionRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_);
    return sessions_.size();
}

void SessionRegistry::close_all()
{
    std::lock_guard<std::mutex> lock(m_);
    for (auto& [id, session] : sessions_)
        session->queue.close();
}

} // namespace searxmcp::server
