#include "landrive/client/config.hpp"

#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace landrive::client
{

    namespace
    {

        std::uint16_t parse_port(const std::string &text)
        {
            std::size_t consumed = 0;
            unsigned long value = 0;
            try
            {
                value = std::stoul(text, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid port: " + text);
            }
            if (consumed != text.size() || value == 0 || value > 65535)
            {
                throw std::runtime_error("Invalid port: " + text);
            }
            return static_cast<std::uint16_t>(value);
        }

        std::chrono::milliseconds parse_seconds(const std::string &option, const std::string &text)
        {
            double seconds = 0.0;
            try
            {
                seconds = std::stod(text);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(option + " requires a number of seconds");
            }
            if (!std::isfinite(seconds) || seconds <= 0.0)
            {
                throw std::runtime_error(option + " must be positive");
            }
            if (seconds > 86400.0)
            {
                throw std::runtime_error(option + " must be at most 86400 seconds");
            }
            const std::chrono::milliseconds timeout(static_cast<std::int64_t>(seconds * 1000.0));
            if (timeout.count() < 1)
            {
                throw std::runtime_error(option + " must be at least 0.001 seconds");
            }
            return timeout;
        }

    } // namespace

    Endpoint parse_endpoint(std::string_view text, std::uint16_t default_port)
    {
        Endpoint endpoint;
        endpoint.port = default_port;
        const auto colon_pos = text.rfind(':');
        if (colon_pos == std::string_view::npos)
        {
            endpoint.host = std::string(text);
        }
        else
        {
            endpoint.host = std::string(text.substr(0, colon_pos));
            endpoint.port = parse_port(std::string(text.substr(colon_pos + 1)));
        }
        if (endpoint.host.empty())
        {
            throw std::runtime_error("Expected endpoint format host[:port]");
        }
        return endpoint;
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--connect-timeout" || arg == "--transfer-timeout")
            {
                if (index >= argc)
                {
                    throw std::runtime_error(arg + " requires a value (seconds)");
                }
                const auto timeout = parse_seconds(arg, argv[index++]);
                if (arg == "--connect-timeout")
                {
                    config.connect_timeout = timeout;
                }
                else
                {
                    config.transfer_timeout = timeout;
                }
            }
            else if (arg == "--mirror-port")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--mirror-port requires a value");
                }
                config.mirror_port = parse_port(argv[index++]);
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!config.host)
            {
                const auto endpoint = parse_endpoint(arg);
                config.host = endpoint.host;
                config.port = endpoint.port;
            }
            else
            {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
        }

        return config;
    }

} // namespace landrive::client
