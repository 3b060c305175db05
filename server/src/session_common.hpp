#pragma once

#include <asio/ip/tcp.hpp>
#include <filesystem>
#include <string>

#include "landrive/protocol.hpp"

namespace landrive::server::session_common
{

    // AccessDenied and NotFound share this message so a requester cannot
    // map the storage layout.
    std::string not_found_message(landrive::protocol::Command command);

    // Removes a partially written file, logging instead of throwing.
    void remove_partial_file(const std::filesystem::path &path);

    std::string describe_endpoint(const asio::ip::tcp::socket &socket);

} // namespace landrive::server::session_common
