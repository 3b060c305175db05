#include "landrive/client/share_link.hpp"

#include <asio.hpp>

#include <array>
#include <cctype>

namespace landrive::client
{

    namespace
    {

        bool is_unreserved(unsigned char ch)
        {
            return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
        }

        std::string trim_slashes(std::string_view text)
        {
            const auto first = text.find_first_not_of('/');
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = text.find_last_not_of('/');
            return std::string(text.substr(first, last - first + 1));
        }

    } // namespace

    std::string percent_encode(std::string_view text)
    {
        static constexpr std::array<char, 16> kHex{'0', '1', '2', '3', '4', '5', '6', '7',
                                                   '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
        std::string encoded;
        encoded.reserve(text.size());
        for (const char raw : text)
        {
            const auto ch = static_cast<unsigned char>(raw);
            if (is_unreserved(ch) || ch == '/')
            {
                encoded.push_back(raw);
                continue;
            }
            encoded.push_back('%');
            encoded.push_back(kHex[ch >> 4]);
            encoded.push_back(kHex[ch & 0x0F]);
        }
        return encoded;
    }

    std::string build_share_url(const std::string &host, std::uint16_t mirror_port, const std::string &remote_dir,
                                const std::string &filename)
    {
        const auto directory = trim_slashes(remote_dir);
        const auto full_path = directory.empty() ? filename : directory + "/" + filename;
        return "http://" + host + ":" + std::to_string(mirror_port) + "/" + percent_encode(full_path);
    }

    bool is_loopback_host(const std::string &host)
    {
        if (host == "localhost")
        {
            return true;
        }
        std::error_code ec;
        const auto address = asio::ip::make_address(host, ec);
        return !ec && address.is_loopback();
    }

    std::string detect_lan_address()
    {
        asio::io_context io_context;
        asio::ip::udp::socket socket(io_context);
        std::error_code ec;
        socket.open(asio::ip::udp::v4(), ec);
        if (ec)
        {
            return "127.0.0.1";
        }
        // Connecting a datagram socket only selects a route.
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("8.8.8.8"), 80), ec);
        if (ec)
        {
            return "127.0.0.1";
        }
        const auto local = socket.local_endpoint(ec);
        if (ec)
        {
            return "127.0.0.1";
        }
        return local.address().to_string();
    }

} // namespace landrive::client
