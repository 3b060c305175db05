#include "landrive/server/session.hpp"

#include <asio/error.hpp>

#include <algorithm>
#include <span>

#include <spdlog/spdlog.h>

#include "session_common.hpp"

namespace landrive::server
{

    void Session::handle_upload(const nlohmann::json &json)
    {
        const auto request = json.get<landrive::protocol::UploadRequest>();
        const auto target = services_.filesystem.upload_target(request.path, request.filename);

        // Opened before the handshake so a failure costs no payload bytes.
        std::ofstream stream(target, std::ios::binary | std::ios::trunc);
        if (!stream)
        {
            spdlog::error("Cannot open {} for writing", target.string());
            reply(landrive::protocol::make_error("Cannot write file"));
            return;
        }

        spdlog::info("Upload started: '{}' ({} bytes) from {}", request.filename, request.size, remote_endpoint_);
        upload_.emplace(UploadTransfer{
            .filename = request.filename,
            .target = target,
            .stream = std::move(stream),
            .expected = request.size,
        });

        auto self = shared_from_this();
        send_response(landrive::protocol::make_upload_ready(), [this, self]
                      { receive_upload_payload(); });
    }

    void Session::receive_upload_payload()
    {
        if (stopped_ || !upload_)
        {
            return;
        }
        auto &upload = *upload_;

        // Payload that arrived in the same read as the command line.
        while (upload.received < upload.expected && line_buffer_.buffered() > 0)
        {
            const auto wanted = static_cast<std::size_t>(
                std::min<std::uint64_t>(io_buffer_.size(), upload.expected - upload.received));
            const auto count = line_buffer_.take(std::span<char>(io_buffer_.data(), wanted));
            store_upload_bytes(count);
        }

        if (upload.received == upload.expected)
        {
            finish_upload();
            return;
        }

        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(io_buffer_.size(), upload.expected - upload.received));
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(io_buffer_.data(), wanted),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    if (ec)
                                    {
                                        if (upload_)
                                        {
                                            spdlog::warn("Upload incomplete: '{}' ({}/{} bytes) from {}", upload_->filename,
                                                         upload_->received, upload_->expected, remote_endpoint_);
                                        }
                                        discard_upload();
                                        if (ec == asio::error::eof)
                                        {
                                            // The peer only closed its sending side; tell it before closing.
                                            send_response(landrive::protocol::make_error("Transfer incomplete"),
                                                          [this, self]
                                                          { stop(); });
                                            return;
                                        }
                                        stop();
                                        return;
                                    }
                                    arm_idle_timer();
                                    store_upload_bytes(bytes_transferred);
                                    receive_upload_payload();
                                });
    }

    void Session::store_upload_bytes(std::size_t count)
    {
        auto &upload = *upload_;
        if (!upload.write_failed)
        {
            upload.stream.write(io_buffer_.data(), static_cast<std::streamsize>(count));
            if (!upload.stream)
            {
                upload.write_failed = true;
                spdlog::error("Write to {} failed, draining the rest of the upload", upload.target.string());
            }
        }
        upload.received += count;
    }

    void Session::finish_upload()
    {
        auto upload = std::move(*upload_);
        upload_.reset();

        upload.stream.close();
        if (upload.write_failed || !upload.stream)
        {
            session_common::remove_partial_file(upload.target);
            spdlog::error("Upload failed: '{}' from {}", upload.filename, remote_endpoint_);
            reply(landrive::protocol::make_error("Cannot write file"));
            return;
        }

        spdlog::info("Upload complete: '{}' ({} bytes) from {}", upload.filename, upload.received, remote_endpoint_);
        reply(landrive::protocol::make_success("Upload complete"));
    }

    void Session::discard_upload()
    {
        if (!upload_)
        {
            return;
        }
        upload_->stream.close();
        session_common::remove_partial_file(upload_->target);
        upload_.reset();
    }

} // namespace landrive::server
