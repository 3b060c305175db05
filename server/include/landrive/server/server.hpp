#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/strand.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "landrive/server/config.hpp"
#include "landrive/server/filesystem.hpp"
#include "landrive/server/session_manager.hpp"

namespace landrive::server
{

    class Session;

    class Server
    {
    public:
        // Binds and listens immediately; a port of 0 picks an ephemeral port.
        explicit Server(ServerConfig config);

        // Blocks until stop() has completed and every session has closed.
        void run();

        // Thread-safe. Stops accepting, closes every session and releases
        // the listening port.
        void stop();

        std::uint16_t port() const noexcept { return bound_port_; }

        // Canonical storage root, for the static file mirror.
        const std::filesystem::path &storage_root() const noexcept { return filesystem_.root(); }

        std::size_t session_count() const { return session_manager_.count(); }

        void set_session_count_listener(SessionManager::CountListener listener);

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void shutdown();

        ServerConfig config_;
        // Sessions unregister in their destructors, which may run while the
        // io_context is torn down, so these outlive it.
        Filesystem filesystem_;
        SessionManager session_manager_;

        asio::io_context io_context_;
        asio::strand<asio::io_context::executor_type> strand_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        std::uint16_t bound_port_{0};

        std::vector<std::thread> workers_;
    };

} // namespace landrive::server
