#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "landrive/client/config.hpp"
#include "landrive/client/engine_observer.hpp"
#include "landrive/client/logger.hpp"
#include "landrive/client/network_engine.hpp"

namespace landrive::client
{

    // "512 B", "1.5 KB", "3.2 MB".
    std::string format_size(std::uint64_t bytes);

    // Remote paths are relative, '/'-separated and have no leading slash.
    std::string join_remote(const std::string &directory, const std::string &name);
    std::string parent_remote(const std::string &path);

    // Shared by the prompt and the engine threads; each call lands as one
    // uninterrupted block.
    class ConsoleOutput
    {
    public:
        explicit ConsoleOutput(std::ostream &out) : out_(out) {}

        void write(std::string_view text);
        void line(std::string_view text);

    private:
        std::mutex mutex_;
        std::ostream &out_;
    };

    // Prints engine events to the terminal and remembers the last listing.
    class ConsoleObserver : public EngineObserver
    {
    public:
        explicit ConsoleObserver(ConsoleOutput &output) : output_(output) {}

        void on_connection_changed(bool connected) override;
        void on_listing(const std::vector<landrive::protocol::Entry> &entries, const std::string &current_path) override;
        void on_log(const std::string &message, LogLevel level) override;
        void on_progress(int percent) override;
        void on_error(const std::string &message) override;

        std::vector<landrive::protocol::Entry> last_listing() const;

    private:
        ConsoleOutput &output_;
        mutable std::mutex mutex_;
        std::vector<landrive::protocol::Entry> listing_;
        int last_progress_{-1};
    };

    class ConsoleShell
    {
    public:
        ConsoleShell(ClientConfig config, Logger logger);
        ~ConsoleShell();

        int run();

    private:
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        void print_help();
        void print_status();

        bool handle_connect(const std::vector<std::string> &args);
        bool handle_cd(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);
        bool handle_share(const std::vector<std::string> &args);

        template <typename Work>
        void start_transfer(Work work);
        void reap_transfers(bool wait_all);

        struct Transfer
        {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        ClientConfig config_;
        Logger logger_;
        ConsoleOutput output_{std::cout};
        ConsoleObserver observer_{output_};
        NetworkEngine engine_;
        std::vector<Transfer> transfers_;
    };

} // namespace landrive::client
