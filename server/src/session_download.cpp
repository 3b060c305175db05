#include "landrive/server/session.hpp"

#include <asio/error.hpp>
#include <asio/write.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace landrive::server
{

    void Session::handle_download(const nlohmann::json &json)
    {
        const auto request = json.get<landrive::protocol::DownloadRequest>();
        const auto source = services_.filesystem.download_source(request.path, request.filename);

        std::ifstream stream(source, std::ios::binary);
        std::error_code ec;
        const auto size = std::filesystem::file_size(source, ec);
        if (!stream || ec)
        {
            spdlog::error("Cannot read {}: {}", source.string(), ec ? ec.message() : "open failed");
            reply(landrive::protocol::make_error("Cannot read file"));
            return;
        }

        spdlog::info("Download started: '{}' ({} bytes) to {}", request.filename, size, remote_endpoint_);
        download_.emplace(DownloadTransfer{
            .filename = request.filename,
            .stream = std::move(stream),
            .total = static_cast<std::uint64_t>(size),
        });

        auto self = shared_from_this();
        send_response(landrive::protocol::make_download_ready(static_cast<std::uint64_t>(size)), [this, self]
                      { send_download_chunk(); });
    }

    void Session::send_download_chunk()
    {
        if (stopped_ || !download_)
        {
            return;
        }
        auto &download = *download_;
        if (download.sent == download.total)
        {
            spdlog::info("Download served: '{}' ({} bytes) to {}", download.filename, download.total, remote_endpoint_);
            download_.reset();
            read_next_line();
            return;
        }

        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(io_buffer_.size(), download.total - download.sent));
        download.stream.read(io_buffer_.data(), static_cast<std::streamsize>(wanted));
        const auto count = download.stream.gcount();
        if (count <= 0)
        {
            // The handshake already promised the full size; the stream cannot recover.
            spdlog::error("Download failed: '{}' truncated at {}/{} bytes", download.filename, download.sent,
                          download.total);
            stop();
            return;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(io_buffer_.data(), static_cast<std::size_t>(count)),
                          [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                          {
                              if (ec)
                              {
                                  if (ec != asio::error::operation_aborted && download_)
                                  {
                                      spdlog::warn("Download failed: '{}' to {}: {}", download_->filename,
                                                   remote_endpoint_, ec.message());
                                  }
                                  stop();
                                  return;
                              }
                              arm_idle_timer();
                              if (download_)
                              {
                                  download_->sent += bytes_transferred;
                              }
                              send_download_chunk();
                          });
    }

} // namespace landrive::server
