/**
 * LanDrive - Newline-delimited JSON framing helpers.
 *
 * Control messages and raw transfer payloads share one byte stream. The
 * LineBuffer hands out either one complete line or raw bytes from the same
 * buffer, so reading a handshake never swallows payload that follows it.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace landrive::protocol
{

    // Requests are short; a longer unterminated line means a broken peer.
    constexpr std::size_t kMaxCommandLineLength = 1024 * 1024;

    // Replies carry whole directory listings, so only the 32-bit frame
    // bound applies to them.
    constexpr std::size_t kMaxReplyLineLength = std::numeric_limits<std::uint32_t>::max();

    // Serializes one message and appends the '\n' delimiter.
    std::string encode_line(const nlohmann::json &message);

    class LineBuffer
    {
    public:
        explicit LineBuffer(std::size_t max_line_length = kMaxCommandLineLength);

        // Throws ProtocolError once an unterminated line exceeds the limit.
        void append(std::string_view data);

        // Next non-blank line without its delimiter, if one is complete.
        std::optional<std::string> next_line();

        // Moves up to out.size() raw bytes out of the buffer.
        std::size_t take(std::span<char> out) noexcept;

        std::size_t buffered() const noexcept { return buffer_.size() - read_offset_; }

        void clear() noexcept;

    private:
        void compact();

        std::string buffer_;
        std::size_t read_offset_{0};
        // Bytes after the last delimiter.
        std::size_t partial_length_{0};
        std::size_t max_line_length_;
    };

} // namespace landrive::protocol
