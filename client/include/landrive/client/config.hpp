#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace landrive::client
{

    constexpr std::uint16_t kDefaultPort = 5555;
    constexpr std::uint16_t kDefaultMirrorPort = 9000;

    struct ClientConfig
    {
        // Connect right away when given on the command line.
        std::optional<std::string> host;
        std::uint16_t port{kDefaultPort};
        std::optional<std::filesystem::path> log_path;
        std::chrono::milliseconds connect_timeout{std::chrono::seconds{5}};
        std::chrono::milliseconds transfer_timeout{std::chrono::seconds{10}};
        std::uint16_t mirror_port{kDefaultMirrorPort};
    };

    struct Endpoint
    {
        std::string host;
        std::uint16_t port{kDefaultPort};
    };

    // Accepts "host" or "host:port".
    Endpoint parse_endpoint(std::string_view text, std::uint16_t default_port = kDefaultPort);

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace landrive::client
