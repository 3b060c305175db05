#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "landrive/client/logger.hpp"
#include "landrive/error_codes.hpp"
#include "landrive/framing.hpp"

namespace landrive::client
{

    class ConnectionError : public std::runtime_error
    {
    public:
        ConnectionError(landrive::ErrorCode code, std::string message);

        landrive::ErrorCode code() const noexcept { return code_; }

    private:
        landrive::ErrorCode code_;
    };

    // Blocking view of one TCP connection. Every call is bounded by a
    // timeout and throws ConnectionError (Timeout or ConnectionLost).
    //
    // Lines and raw payload are served from the same LineBuffer, so reading
    // a handshake line never consumes payload bytes that follow it.
    //
    // Not thread-safe: only the current owner of the socket may call it,
    // except for interrupt().
    class Connection
    {
    public:
        explicit Connection(Logger logger = Logger{});
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        void open(const std::string &host, std::uint16_t port, std::chrono::milliseconds timeout);

        // Closing failures are logged, never thrown.
        void close();

        bool is_open() const { return socket_.is_open(); }

        // Aborts the operation in progress from any thread. The owner sees
        // ConnectionLost.
        void interrupt();

        void write(std::string_view data, std::chrono::milliseconds timeout);

        std::string read_line(std::chrono::milliseconds timeout);

        // Buffered bytes first, then at most out.size() bytes from the socket.
        std::size_t read_some(std::span<char> out, std::chrono::milliseconds timeout);

        // Waits up to `timeout` for more data and returns every complete
        // line. An empty result means nothing complete arrived in time.
        std::vector<std::string> poll_lines(std::chrono::milliseconds timeout);

        void discard_buffered() noexcept { line_buffer_.clear(); }

        std::size_t buffered() const noexcept { return line_buffer_.buffered(); }

    private:
        template <typename Cancel>
        void run(std::chrono::milliseconds timeout, Cancel cancel);

        // Returns false when the timeout expired before any data arrived.
        bool fill(std::chrono::milliseconds timeout);

        void fail(const std::error_code &ec, std::string_view operation) const;

        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        landrive::protocol::LineBuffer line_buffer_{landrive::protocol::kMaxReplyLineLength};
        std::array<char, 8192> read_buffer_{};
        std::atomic<bool> interrupted_{false};
    };

} // namespace landrive::client
