#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace landrive::server
{

    class Session;

    // Live-session set shared by the accept loop and every session. All
    // mutation and iteration happens under one mutex; callbacks run outside it.
    class SessionManager
    {
    public:
        using CountListener = std::function<void(std::size_t)>;

        void add(const std::shared_ptr<Session> &session);

        // Safe to call more than once for the same session.
        void remove(const Session *session);

        std::size_t count() const;

        // Closes every registered session. Sessions unregister themselves as
        // they finish closing.
        void close_all();

        void set_count_listener(CountListener listener);

    private:
        void notify(std::size_t count) const;

        mutable std::mutex mutex_;
        std::unordered_map<const Session *, std::weak_ptr<Session>> sessions_;
        CountListener listener_;
    };

} // namespace landrive::server
