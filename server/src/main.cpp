#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "landrive/server/server.hpp"
#include "landrive/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    // Port of the static HTTP mirror that serves the same root to browsers.
    constexpr std::uint16_t kMirrorPort = 9000;

    void print_usage(const char *program_name)
    {
        std::cout << "LanDrive server " << landrive::version() << "\n"
                  << "Usage: " << program_name
                  << " [--port <PORT>] [--root <ROOT>] [--address <ADDRESS>] [--threads <N>] "
                     "[--idle-timeout <seconds>] [--log <FILE>]\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using landrive::server::Server;
    using landrive::server::ServerConfig;

    ServerConfig config;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg != "--port" && arg != "--root" && arg != "--address" && arg != "--threads" &&
                arg != "--idle-timeout" && arg != "--log")
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            if (arg == "--port")
            {
                const auto port = std::stoul(*value);
                if (port == 0 || port > 65535)
                {
                    std::cerr << "Invalid port: " << *value << std::endl;
                    return EXIT_FAILURE;
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--idle-timeout")
            {
                config.idle_timeout = std::chrono::seconds(std::stoll(*value));
            }
            else
            {
                config.log_file = std::filesystem::path(*value);
            }
        }
    }
    catch (const std::logic_error &ex)
    {
        // std::stoul and friends report bad numbers this way.
        std::cerr << "Invalid numeric argument: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.root.empty() || config.idle_timeout.count() <= 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting LanDrive server {} on {}:{}", landrive::version(), config.address, config.port);

        Server server(std::move(config));
        spdlog::info("Storage root: {}", server.storage_root().string());
        spdlog::info("Point the static mirror at the storage root, e.g. python3 -m http.server {} --directory {}",
                     kMirrorPort, server.storage_root().string());
        server.set_session_count_listener([](std::size_t count)
                                          { spdlog::info("Active clients: {}", count); });
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
