#pragma once

#include <string>
#include <vector>

#include "landrive/protocol.hpp"

namespace landrive::client
{

    enum class LogLevel
    {
        Info,
        Success,
        Warning,
        Error
    };

    // Receives engine events. Called from the listener thread and from
    // whichever thread runs a transfer, never with an engine lock held.
    class EngineObserver
    {
    public:
        virtual ~EngineObserver() = default;

        virtual void on_connection_changed(bool connected) = 0;
        virtual void on_listing(const std::vector<landrive::protocol::Entry> &entries, const std::string &current_path) = 0;
        virtual void on_log(const std::string &message, LogLevel level) = 0;
        virtual void on_progress(int percent) = 0;
        virtual void on_error(const std::string &message) = 0;
    };

} // namespace landrive::client
