#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace landrive::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{5555};
        std::filesystem::path root{"storage"};
        std::size_t worker_threads{0};
        std::chrono::seconds idle_timeout{std::chrono::seconds{300}};
        std::optional<std::filesystem::path> log_file;
        bool handle_signals{true};
    };

} // namespace landrive::server
