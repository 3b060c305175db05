#include "landrive/server/session_manager.hpp"

#include <vector>

#include <spdlog/spdlog.h>

#include "landrive/server/session.hpp"

namespace landrive::server
{

    void SessionManager::add(const std::shared_ptr<Session> &session)
    {
        std::size_t count = 0;
        {
            std::lock_guard lock(mutex_);
            sessions_[session.get()] = session;
            count = sessions_.size();
        }
        spdlog::debug("Active sessions: {}", count);
        notify(count);
    }

    void SessionManager::remove(const Session *session)
    {
        std::size_t count = 0;
        {
            std::lock_guard lock(mutex_);
            if (sessions_.erase(session) == 0)
            {
                return;
            }
            count = sessions_.size();
        }
        spdlog::debug("Active sessions: {}", count);
        notify(count);
    }

    std::size_t SessionManager::count() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    void SessionManager::close_all()
    {
        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard lock(mutex_);
            live.reserve(sessions_.size());
            for (const auto &[key, weak] : sessions_)
            {
                if (auto session = weak.lock())
                {
                    live.push_back(std::move(session));
                }
            }
        }
        if (!live.empty())
        {
            spdlog::info("Closing {} active session(s)", live.size());
        }
        for (const auto &session : live)
        {
            session->close();
        }
    }

    void SessionManager::set_count_listener(CountListener listener)
    {
        std::lock_guard lock(mutex_);
        listener_ = std::move(listener);
    }

    void SessionManager::notify(std::size_t count) const
    {
        CountListener listener;
        {
            std::lock_guard lock(mutex_);
            listener = listener_;
        }
        if (listener)
        {
            listener(count);
        }
    }

} // namespace landrive::server
