#include <cstdlib>
#include <iostream>

#include "landrive/client/config.hpp"
#include "landrive/client/console.hpp"
#include "landrive/client/logger.hpp"

namespace
{

    void print_usage(const char *program_name)
    {
        std::cerr << "Usage: " << program_name
                  << " [host[:port]] [--log <file>] [--connect-timeout <s>] [--transfer-timeout <s>] "
                     "[--mirror-port <port>]"
                  << std::endl;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace landrive::client;

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        ConsoleShell shell(config, logger);
        return shell.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
}
