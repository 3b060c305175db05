#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "landrive/framing.hpp"
#include "landrive/protocol.hpp"
#include "landrive/server/filesystem.hpp"
#include "landrive/server/session_manager.hpp"

namespace landrive::server
{

    constexpr std::size_t kTransferChunk = 8192;

    struct SessionServices
    {
        Filesystem &filesystem;
        SessionManager &session_manager;
        std::chrono::seconds idle_timeout;
    };

    // One accepted connection. All handlers run on the socket's strand and
    // only one command is in flight at a time: the next line is read after
    // the previous reply has been written.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, SessionServices services);
        ~Session();

        void start();

        // Thread-safe; the session finishes closing on its own strand.
        void close();

        const std::string &remote_endpoint() const noexcept { return remote_endpoint_; }

    private:
        void stop();
        void arm_idle_timer();

        void read_next_line();
        void process_line(const std::string &line);
        void send_response(const landrive::protocol::Response &response, std::function<void()> next);
        void reply(const landrive::protocol::Response &response);

        // Command handlers. Each one either throws before anything was sent
        // or hands exactly one reply to send_response.
        void handle_list(const nlohmann::json &json);
        void handle_mkdir(const nlohmann::json &json);
        void handle_delete(const nlohmann::json &json);
        void handle_upload(const nlohmann::json &json);
        void handle_download(const nlohmann::json &json);

        void receive_upload_payload();
        void store_upload_bytes(std::size_t count);
        void finish_upload();
        void discard_upload();

        void send_download_chunk();

        asio::ip::tcp::socket socket_;
        asio::steady_timer idle_timer_;
        SessionServices services_;
        std::string remote_endpoint_;

        landrive::protocol::LineBuffer line_buffer_{landrive::protocol::kMaxCommandLineLength};
        std::array<char, kTransferChunk> io_buffer_{};
        bool stopped_{false};

        struct UploadTransfer
        {
            std::string filename;
            std::filesystem::path target;
            std::ofstream stream;
            std::uint64_t expected{};
            std::uint64_t received{};
            bool write_failed{false};
        };
        std::optional<UploadTransfer> upload_;

        struct DownloadTransfer
        {
            std::string filename;
            std::ifstream stream;
            std::uint64_t total{};
            std::uint64_t sent{};
        };
        std::optional<DownloadTransfer> download_;
    };

} // namespace landrive::server
