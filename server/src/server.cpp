#include "landrive/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "landrive/server/session.hpp"

namespace landrive::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          filesystem_(config_.root),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          strand_(asio::make_strand(io_context_)),
          acceptor_(strand_),
          signals_(strand_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} with root {}", config_.address, bound_port_, filesystem_.root().string());

        if (config_.handle_signals)
        {
            signals_.add(SIGINT);
            signals_.add(SIGTERM);
            signals_.async_wait([this](const std::error_code &ec, int signal_number)
                                {
            if (!ec) {
                spdlog::info("Signal {} received, shutting down", signal_number);
                shutdown();
            } });
        }
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        spdlog::info("Server stopped");
    }

    void Server::stop()
    {
        asio::post(strand_, [this]
                   { shutdown(); });
    }

    void Server::set_session_count_listener(SessionManager::CountListener listener)
    {
        session_manager_.set_count_listener(std::move(listener));
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!acceptor_.is_open())
        {
            // Raced with shutdown; the socket closes with this scope.
            return;
        }
        if (!ec)
        {
            SessionServices services{filesystem_, session_manager_, config_.idle_timeout};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session_manager_.add(session);
            session->start();
        }
        else if (ec != asio::error::operation_aborted)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void Server::shutdown()
    {
        if (!acceptor_.is_open())
        {
            return;
        }
        std::error_code ec;
        acceptor_.close(ec);
        if (ec)
        {
            spdlog::warn("Closing the listener failed: {}", ec.message());
        }
        signals_.cancel(ec);
        if (ec)
        {
            spdlog::debug("Cancelling signal wait failed: {}", ec.message());
        }
        session_manager_.close_all();
        spdlog::info("Shutting down, no longer accepting connections");
    }

} // namespace landrive::server
