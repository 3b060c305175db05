#include "landrive/client/connection.hpp"

#include <algorithm>

namespace landrive::client
{

    namespace
    {

        std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline)
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                return std::chrono::milliseconds{0};
            }
            return std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        }

    } // namespace

    ConnectionError::ConnectionError(landrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    Connection::Connection(Logger logger) : logger_(std::move(logger)), socket_(io_context_) {}

    Connection::~Connection()
    {
        close();
    }

    template <typename Cancel>
    void Connection::run(std::chrono::milliseconds timeout, Cancel cancel)
    {
        io_context_.restart();
        io_context_.run_for(timeout);
        if (!io_context_.stopped())
        {
            // Timed out: abort the pending operation and let its handler run.
            cancel();
            io_context_.run();
        }
    }

    void Connection::open(const std::string &host, std::uint16_t port, std::chrono::milliseconds timeout)
    {
        close();
        interrupted_ = false;
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        asio::ip::tcp::resolver resolver(io_context_);
        asio::ip::tcp::resolver::results_type endpoints;
        std::error_code result = asio::error::would_block;
        resolver.async_resolve(host, std::to_string(port),
                               [&](const std::error_code &ec, asio::ip::tcp::resolver::results_type resolved)
                               {
                                   result = ec;
                                   endpoints = std::move(resolved);
                               });
        run(timeout, [&]
            { resolver.cancel(); });
        if (result)
        {
            fail(result, "resolve " + host);
        }

        result = asio::error::would_block;
        asio::async_connect(socket_, endpoints,
                            [&](const std::error_code &ec, const asio::ip::tcp::endpoint & /*endpoint*/)
                            { result = ec; });
        run(remaining_until(deadline), [&]
            {
            // A closed socket stops the remaining connect attempts too.
            std::error_code ec;
            socket_.close(ec); });
        if (result)
        {
            std::error_code ec;
            socket_.close(ec);
            fail(result, "connect to " + host + ":" + std::to_string(port));
        }

        std::error_code ec;
        socket_.set_option(asio::ip::tcp::no_delay(true), ec);
        if (ec)
        {
            logger_.warn("net", "TCP_NODELAY not set: ", ec.message());
        }
        logger_.log("net", "connected to ", host, ':', port);
    }

    void Connection::close()
    {
        if (socket_.is_open())
        {
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            if (ec && ec != asio::error::not_connected)
            {
                logger_.warn("net", "shutdown failed: ", ec.message());
            }
            socket_.close(ec);
            if (ec)
            {
                logger_.warn("net", "close failed: ", ec.message());
            }
            else
            {
                logger_.log("net", "connection closed");
            }
        }
        line_buffer_.clear();
        // Runs an interrupt posted while nobody was waiting, so it cannot hit
        // the next connection.
        io_context_.restart();
        io_context_.poll();
    }

    void Connection::interrupt()
    {
        interrupted_ = true;
        asio::post(io_context_, [this]
                   {
            if (!socket_.is_open()) {
                return;
            }
            std::error_code ec;
            socket_.close(ec);
            if (ec) {
                logger_.warn("net", "interrupt close failed: ", ec.message());
            } });
    }

    void Connection::write(std::string_view data, std::chrono::milliseconds timeout)
    {
        if (interrupted_)
        {
            throw ConnectionError(landrive::ErrorCode::ConnectionLost, "Connection interrupted");
        }
        std::error_code result = asio::error::would_block;
        asio::async_write(socket_, asio::buffer(data.data(), data.size()),
                          [&](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          { result = ec; });
        run(timeout, [&]
            {
            std::error_code ec;
            socket_.cancel(ec); });
        if (result)
        {
            fail(result, "write");
        }
    }

    bool Connection::fill(std::chrono::milliseconds timeout)
    {
        if (interrupted_)
        {
            throw ConnectionError(landrive::ErrorCode::ConnectionLost, "Connection interrupted");
        }
        std::error_code result = asio::error::would_block;
        std::size_t received = 0;
        socket_.async_read_some(asio::buffer(read_buffer_),
                                [&](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    result = ec;
                                    received = bytes_transferred;
                                });
        run(timeout, [&]
            {
            std::error_code ec;
            socket_.cancel(ec); });
        if (result == asio::error::operation_aborted && !interrupted_)
        {
            return false;
        }
        if (result)
        {
            fail(result, "read");
        }
        line_buffer_.append(std::string_view(read_buffer_.data(), received));
        return true;
    }

    std::string Connection::read_line(std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            if (auto line = line_buffer_.next_line())
            {
                return *line;
            }
            const auto remaining = remaining_until(deadline);
            if (remaining.count() == 0 || !fill(remaining))
            {
                throw ConnectionError(landrive::ErrorCode::Timeout, "Timed out waiting for the server");
            }
        }
    }

    std::size_t Connection::read_some(std::span<char> out, std::chrono::milliseconds timeout)
    {
        if (line_buffer_.buffered() > 0)
        {
            return line_buffer_.take(out);
        }
        if (interrupted_)
        {
            throw ConnectionError(landrive::ErrorCode::ConnectionLost, "Connection interrupted");
        }

        std::error_code result = asio::error::would_block;
        std::size_t received = 0;
        socket_.async_read_some(asio::buffer(out.data(), out.size()),
                                [&](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    result = ec;
                                    received = bytes_transferred;
                                });
        run(timeout, [&]
            {
            std::error_code ec;
            socket_.cancel(ec); });
        if (result)
        {
            fail(result, "read");
        }
        return received;
    }

    std::vector<std::string> Connection::poll_lines(std::chrono::milliseconds timeout)
    {
        std::vector<std::string> lines;
        while (auto line = line_buffer_.next_line())
        {
            lines.push_back(std::move(*line));
        }
        if (!lines.empty())
        {
            return lines;
        }
        if (fill(timeout))
        {
            while (auto line = line_buffer_.next_line())
            {
                lines.push_back(std::move(*line));
            }
        }
        return lines;
    }

    void Connection::fail(const std::error_code &ec, std::string_view operation) const
    {
        if (ec == asio::error::operation_aborted)
        {
            if (interrupted_)
            {
                throw ConnectionError(landrive::ErrorCode::ConnectionLost, "Connection interrupted");
            }
            throw ConnectionError(landrive::ErrorCode::Timeout, "Timed out: " + std::string(operation));
        }
        if (ec == asio::error::eof || ec == asio::error::connection_reset)
        {
            throw ConnectionError(landrive::ErrorCode::ConnectionLost, "Connection closed by server");
        }
        throw ConnectionError(landrive::ErrorCode::ConnectionLost, std::string(operation) + " failed: " + ec.message());
    }

} // namespace landrive::client
