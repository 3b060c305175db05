#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "landrive/client/config.hpp"
#include "landrive/client/connection.hpp"
#include "landrive/client/engine_observer.hpp"
#include "landrive/client/logger.hpp"
#include "landrive/client/socket_ownership.hpp"
#include "landrive/protocol.hpp"

namespace landrive::client
{

    struct EngineOptions
    {
        std::uint16_t port{kDefaultPort};
        std::chrono::milliseconds connect_timeout{std::chrono::seconds{5}};
        // Bounds every handshake, reply and payload read or write.
        std::chrono::milliseconds transfer_timeout{std::chrono::seconds{10}};
        std::chrono::milliseconds poll_interval{100};
        std::size_t chunk_size{8192};
    };

    // Owns the single connection to a server. A background listener thread
    // reads asynchronous replies whenever no transfer owns the socket;
    // upload() and download() block their caller and take the socket over
    // for the whole exchange.
    class NetworkEngine
    {
    public:
        NetworkEngine(EngineOptions options, EngineObserver &observer, Logger logger = Logger{});
        ~NetworkEngine();

        NetworkEngine(const NetworkEngine &) = delete;
        NetworkEngine &operator=(const NetworkEngine &) = delete;

        void start();

        // Joins the listener and closes the connection. Transfers still
        // running on other threads are interrupted.
        void stop();

        // The listener makes one attempt. On failure the address is
        // forgotten and the caller has to ask again.
        void connect_to(const std::string &host);
        void connect_to(const std::string &host, std::uint16_t port);

        void disconnect();

        bool is_connected() const noexcept { return connected_; }

        std::optional<std::string> connected_host() const;

        // Logical remote directory of the last listing received.
        std::string current_path() const;

        // Queued and sent by the socket owner; replies reach the observer.
        bool request_listing(const std::string &path);
        bool make_directory(const std::string &dirname, const std::string &path);
        bool delete_entry(const std::string &filename, const std::string &path);

        bool upload(const std::filesystem::path &local_file, const std::string &remote_dir);
        bool download(const std::string &filename, const std::string &remote_dir, const std::filesystem::path &save_path);

    private:
        struct PendingConnect
        {
            std::string host;
            std::uint16_t port{};
        };

        void listener_loop();
        void establish(const PendingConnect &target);
        void drop_connection();
        bool enqueue(const nlohmann::json &request);

        // Socket-owner only.
        void flush_outbox();
        void dispatch_line(const std::string &line);
        void dispatch_response(const landrive::protocol::Response &response);
        void prepare_exchange();
        landrive::protocol::Response read_reply();

        EngineOptions options_;
        EngineObserver &observer_;
        Logger logger_;

        Connection connection_;
        SocketOwnership ownership_;
        std::thread listener_;

        std::atomic<bool> running_{false};
        std::atomic<bool> connected_{false};
        std::atomic<bool> disconnect_requested_{false};

        mutable std::mutex state_mutex_;
        std::optional<PendingConnect> pending_connect_;
        std::optional<std::string> host_;
        std::string current_path_;
        std::deque<std::string> outbox_;

        // Replies still owed for commands already written to the socket.
        std::size_t outstanding_replies_{0};
    };

} // namespace landrive::client
