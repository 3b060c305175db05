#include "session_common.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace landrive::server::session_common
{

    std::string not_found_message(landrive::protocol::Command command)
    {
        return command == landrive::protocol::Command::Download ? "File not found" : "Not found";
    }

    void remove_partial_file(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            spdlog::warn("Could not remove partial file {}: {}", path.string(), ec.message());
        }
    }

    std::string describe_endpoint(const asio::ip::tcp::socket &socket)
    {
        std::error_code ec;
        const auto endpoint = socket.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace landrive::server::session_common
