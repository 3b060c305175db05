#include "landrive/client/network_engine.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <stdexcept>
#include <vector>

#include "landrive/framing.hpp"

namespace landrive::client
{

    namespace
    {

        int percent_of(std::uint64_t done, std::uint64_t total)
        {
            if (total == 0)
            {
                return 100;
            }
            return static_cast<int>((done * 100) / total);
        }

        void remove_quietly(const std::filesystem::path &path, Logger &logger)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                logger.warn("transfer", "could not remove ", path.string(), ": ", ec.message());
            }
        }

    } // namespace

    void NetworkEngine::prepare_exchange()
    {
        flush_outbox();
        const auto deadline = std::chrono::steady_clock::now() + options_.transfer_timeout;
        while (outstanding_replies_ > 0)
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                throw ConnectionError(landrive::ErrorCode::Timeout, "Timed out waiting for earlier replies");
            }
            const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            for (const auto &line : connection_.poll_lines(remaining))
            {
                dispatch_line(line);
            }
        }
        // Anything left is not a reply to anything we sent.
        if (connection_.buffered() > 0)
        {
            logger_.warn("transfer", "discarding ", connection_.buffered(), " stale byte(s)");
        }
        connection_.discard_buffered();
    }

    landrive::protocol::Response NetworkEngine::read_reply()
    {
        const auto deadline = std::chrono::steady_clock::now() + options_.transfer_timeout;
        while (true)
        {
            const auto now = std::chrono::steady_clock::now();
            const auto remaining = now >= deadline ? std::chrono::milliseconds{0}
                                                   : std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            // A line that does not decode here is fatal: the payload framing
            // around it can no longer be trusted.
            auto response = landrive::protocol::decode_response(connection_.read_line(remaining));
            if (!response.is_listing())
            {
                return response;
            }
            dispatch_response(response);
        }
    }

    bool NetworkEngine::upload(const std::filesystem::path &local_file, const std::string &remote_dir)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_file, ec))
        {
            observer_.on_error("Upload failed: " + local_file.string() + " is not a file");
            return false;
        }
        const auto size = static_cast<std::uint64_t>(std::filesystem::file_size(local_file, ec));
        if (ec)
        {
            observer_.on_error("Upload failed: " + ec.message());
            return false;
        }
        std::ifstream input(local_file, std::ios::binary);
        if (!input)
        {
            observer_.on_error("Upload failed: cannot read " + local_file.string());
            return false;
        }

        auto lease = ownership_.acquire_for_transfer();
        if (!connected_)
        {
            observer_.on_error("Not connected");
            return false;
        }

        const auto filename = local_file.filename().string();
        logger_.log("transfer", "upload ", filename, " (", size, " bytes) to '", remote_dir, "'");
        observer_.on_log("Uploading " + filename, LogLevel::Info);

        bool command_sent = false;
        try
        {
            prepare_exchange();
            const landrive::protocol::UploadRequest request{filename, size, remote_dir};
            connection_.write(landrive::protocol::encode_line(request), options_.transfer_timeout);
            command_sent = true;

            const auto handshake = read_reply();
            if (!handshake.is_upload_ready())
            {
                observer_.on_error("Upload failed: " + handshake.message.value_or("Server refused the upload"));
                return false;
            }

            std::vector<char> chunk(options_.chunk_size);
            std::uint64_t sent = 0;
            if (size == 0)
            {
                observer_.on_progress(100);
            }
            while (sent < size)
            {
                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), size - sent));
                input.read(chunk.data(), static_cast<std::streamsize>(wanted));
                const auto count = input.gcount();
                if (count <= 0)
                {
                    throw std::runtime_error("local file shrank during upload");
                }
                connection_.write(std::string_view(chunk.data(), static_cast<std::size_t>(count)),
                                  options_.transfer_timeout);
                sent += static_cast<std::uint64_t>(count);
                observer_.on_progress(percent_of(sent, size));
            }

            const auto verdict = read_reply();
            {
                std::lock_guard lock(state_mutex_);
                outbox_.push_back(landrive::protocol::encode_line(landrive::protocol::ListRequest{remote_dir}));
            }
            if (verdict.status == landrive::protocol::ResponseStatus::Error)
            {
                observer_.on_error("Upload failed: " + verdict.message.value_or("Unknown error"));
                return false;
            }
            logger_.log("transfer", "upload ", filename, " complete");
            observer_.on_log(verdict.message.value_or("Upload complete"), LogLevel::Success);
            return true;
        }
        catch (const std::exception &ex)
        {
            logger_.warn("transfer", "upload ", filename, " failed: ", ex.what());
            if (command_sent || dynamic_cast<const ConnectionError *>(&ex) != nullptr)
            {
                drop_connection();
            }
            observer_.on_error(std::string("Upload failed: ") + ex.what());
            return false;
        }
    }

    bool NetworkEngine::download(const std::string &filename, const std::string &remote_dir,
                                 const std::filesystem::path &save_path)
    {
        auto partial = save_path;
        partial += ".part";

        auto lease = ownership_.acquire_for_transfer();
        if (!connected_)
        {
            observer_.on_error("Not connected");
            return false;
        }

        // Opened before asking so a local failure never strands a payload.
        std::ofstream output(partial, std::ios::binary | std::ios::trunc);
        if (!output)
        {
            observer_.on_error("Download failed: cannot write " + partial.string());
            return false;
        }

        logger_.log("transfer", "download '", remote_dir, "'/", filename, " to ", save_path.string());
        observer_.on_log("Downloading " + filename, LogLevel::Info);

        bool command_sent = false;
        try
        {
            prepare_exchange();
            const landrive::protocol::DownloadRequest request{filename, remote_dir};
            connection_.write(landrive::protocol::encode_line(request), options_.transfer_timeout);
            command_sent = true;

            const auto handshake = read_reply();
            if (!handshake.is_download_ready())
            {
                output.close();
                remove_quietly(partial, logger_);
                observer_.on_error("Download failed: " + handshake.message.value_or("Unexpected reply"));
                return false;
            }

            const auto size = *handshake.size;
            std::vector<char> chunk(options_.chunk_size);
            std::uint64_t received = 0;
            bool write_failed = false;
            if (size == 0)
            {
                observer_.on_progress(100);
            }
            while (received < size)
            {
                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), size - received));
                const auto count =
                    connection_.read_some(std::span<char>(chunk.data(), wanted), options_.transfer_timeout);
                if (!write_failed)
                {
                    output.write(chunk.data(), static_cast<std::streamsize>(count));
                    if (!output)
                    {
                        // Keep reading so the stream stays in sync for the next command.
                        write_failed = true;
                        logger_.warn("transfer", "write to ", partial.string(), " failed, draining the rest");
                    }
                }
                received += count;
                if (!write_failed)
                {
                    observer_.on_progress(percent_of(received, size));
                }
            }

            output.close();
            if (write_failed || !output)
            {
                remove_quietly(partial, logger_);
                observer_.on_error("Download failed: cannot write " + partial.string());
                return false;
            }
            std::error_code ec;
            std::filesystem::rename(partial, save_path, ec);
            if (ec)
            {
                // The stream is still in sync, so the connection survives.
                remove_quietly(partial, logger_);
                observer_.on_error("Download failed: " + ec.message());
                return false;
            }
            logger_.log("transfer", "download ", filename, " complete (", size, " bytes)");
            observer_.on_log("Downloaded " + filename, LogLevel::Success);
            return true;
        }
        catch (const std::exception &ex)
        {
            logger_.warn("transfer", "download ", filename, " failed: ", ex.what());
            output.close();
            remove_quietly(partial, logger_);
            if (command_sent || dynamic_cast<const ConnectionError *>(&ex) != nullptr)
            {
                drop_connection();
            }
            observer_.on_error(std::string("Download failed: ") + ex.what());
            return false;
        }
    }

} // namespace landrive::client
