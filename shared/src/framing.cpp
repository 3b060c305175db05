#include "landrive/framing.hpp"

#include <algorithm>
#include <cstring>

#include "landrive/error_codes.hpp"
#include "landrive/protocol.hpp"

namespace landrive::protocol
{

    namespace
    {
        constexpr char kDelimiter = '\n';

        bool is_blank(std::string_view line)
        {
            return line.find_first_not_of(" \t\r") == std::string_view::npos;
        }
    } // namespace

    std::string encode_line(const nlohmann::json &message)
    {
        auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        text.push_back(kDelimiter);
        return text;
    }

    LineBuffer::LineBuffer(std::size_t max_line_length) : max_line_length_(max_line_length) {}

    void LineBuffer::append(std::string_view data)
    {
        compact();
        buffer_.append(data.data(), data.size());
        const auto last_delimiter = data.rfind(kDelimiter);
        partial_length_ = last_delimiter == std::string_view::npos ? partial_length_ + data.size()
                                                                   : data.size() - last_delimiter - 1;
        if (partial_length_ > max_line_length_)
        {
            throw ProtocolError(landrive::ErrorCode::ProtocolDecodeError, "Line exceeds maximum length");
        }
    }

    std::optional<std::string> LineBuffer::next_line()
    {
        while (true)
        {
            const auto delimiter = buffer_.find(kDelimiter, read_offset_);
            if (delimiter == std::string::npos)
            {
                return std::nullopt;
            }
            std::string_view line(buffer_.data() + read_offset_, delimiter - read_offset_);
            read_offset_ = delimiter + 1;
            if (is_blank(line))
            {
                continue;
            }
            if (line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            return std::string(line);
        }
    }

    std::size_t LineBuffer::take(std::span<char> out) noexcept
    {
        const auto count = std::min(out.size(), buffered());
        if (count > 0)
        {
            std::memcpy(out.data(), buffer_.data() + read_offset_, count);
            read_offset_ += count;
            partial_length_ = std::min(partial_length_, buffered());
        }
        if (read_offset_ == buffer_.size())
        {
            clear();
        }
        return count;
    }

    void LineBuffer::clear() noexcept
    {
        buffer_.clear();
        read_offset_ = 0;
        partial_length_ = 0;
    }

    void LineBuffer::compact()
    {
        if (read_offset_ == 0)
        {
            return;
        }
        buffer_.erase(0, read_offset_);
        read_offset_ = 0;
    }

} // namespace landrive::protocol
