#pragma once

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/write.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "landrive/framing.hpp"

namespace landrive::tests
{

    // Blocking line client that speaks the wire protocol directly, so tests
    // can send malformed or truncated traffic the real client never would.
    class LineClient
    {
    public:
        explicit LineClient(std::uint16_t port) : socket_(io_context_)
        {
            socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
            socket_.set_option(asio::ip::tcp::no_delay(true));
        }

        void send(const nlohmann::json &message)
        {
            send_raw(landrive::protocol::encode_line(message));
        }

        void send_raw(std::string_view data)
        {
            asio::write(socket_, asio::buffer(data.data(), data.size()));
        }

        nlohmann::json receive()
        {
            while (true)
            {
                if (auto line = buffer_.next_line())
                {
                    return nlohmann::json::parse(*line);
                }
                fill();
            }
        }

        std::string receive_payload(std::size_t size)
        {
            std::string payload(size, '\0');
            std::size_t received = 0;
            while (received < size)
            {
                if (buffer_.buffered() == 0)
                {
                    fill();
                }
                received += buffer_.take(std::span<char>(payload.data() + received, size - received));
            }
            return payload;
        }

        void shutdown_send()
        {
            socket_.shutdown(asio::ip::tcp::socket::shutdown_send);
        }

        // True once the server has closed its end and nothing is left to read.
        bool closed_by_server()
        {
            if (buffer_.buffered() > 0)
            {
                return false;
            }
            std::array<char, 256> chunk{};
            std::error_code ec;
            const auto count = socket_.read_some(asio::buffer(chunk), ec);
            if (count > 0)
            {
                buffer_.append(std::string_view(chunk.data(), count));
                return false;
            }
            return ec == asio::error::eof || ec == asio::error::connection_reset;
        }

    private:
        void fill()
        {
            std::array<char, 8192> chunk{};
            const auto count = socket_.read_some(asio::buffer(chunk));
            buffer_.append(std::string_view(chunk.data(), count));
        }

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        landrive::protocol::LineBuffer buffer_;
    };

} // namespace landrive::tests
