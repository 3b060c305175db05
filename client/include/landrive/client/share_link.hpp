#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace landrive::client
{

    // Percent-encodes everything except unreserved characters and '/'.
    std::string percent_encode(std::string_view text);

    // Link to a stored file on the static mirror, e.g.
    // http://192.168.1.20:9000/photos/my%20cat.jpg
    std::string build_share_url(const std::string &host, std::uint16_t mirror_port, const std::string &remote_dir,
                                const std::string &filename);

    bool is_loopback_host(const std::string &host);

    // Address of the interface that routes to the internet, or "127.0.0.1"
    // when there is none. Sends no packets.
    std::string detect_lan_address();

} // namespace landrive::client
