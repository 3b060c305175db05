#include "landrive/server/session.hpp"

#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>
#include <nlohmann/json.hpp>

#include <string_view>

#include <spdlog/spdlog.h>

#include "landrive/error_codes.hpp"
#include "session_common.hpp"

namespace landrive::server
{

    Session::Session(asio::ip::tcp::socket socket, SessionServices services)
        : socket_(std::move(socket)),
          idle_timer_(socket_.get_executor()),
          services_(services),
          remote_endpoint_(session_common::describe_endpoint(socket_)) {}

    Session::~Session()
    {
        services_.session_manager.remove(this);
    }

    void Session::start()
    {
        spdlog::info("Client connected: {}", remote_endpoint_);
        arm_idle_timer();
        read_next_line();
    }

    void Session::close()
    {
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [self]
                   { self->stop(); });
    }

    void Session::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        idle_timer_.cancel();

        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected)
        {
            spdlog::debug("Shutdown of {} failed: {}", remote_endpoint_, ec.message());
        }
        socket_.close(ec);
        if (ec)
        {
            spdlog::debug("Close of {} failed: {}", remote_endpoint_, ec.message());
        }

        discard_upload();
        download_.reset();
        services_.session_manager.remove(this);
        spdlog::info("Client disconnected: {}", remote_endpoint_);
    }

    void Session::arm_idle_timer()
    {
        if (stopped_)
        {
            return;
        }
        idle_timer_.expires_after(services_.idle_timeout);
        auto self = shared_from_this();
        idle_timer_.async_wait([this, self](const std::error_code &ec)
                               {
                                   // A wait that completed just before being rearmed still sees
                                   // a future expiry.
                                   if (ec || stopped_ || idle_timer_.expiry() > asio::steady_timer::clock_type::now())
                                   {
                                       return;
                                   }
                                   spdlog::warn("Timeout: {} idle for {}s", remote_endpoint_, services_.idle_timeout.count());
                                   stop(); });
    }

    void Session::read_next_line()
    {
        if (stopped_)
        {
            return;
        }
        if (auto line = line_buffer_.next_line())
        {
            process_line(*line);
            return;
        }

        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(io_buffer_),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                {
                                    if (ec)
                                    {
                                        if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                                        {
                                            spdlog::warn("Read from {} failed: {}", remote_endpoint_, ec.message());
                                        }
                                        stop();
                                        return;
                                    }
                                    arm_idle_timer();
                                    try
                                    {
                                        line_buffer_.append(std::string_view(io_buffer_.data(), bytes_transferred));
                                    }
                                    catch (const landrive::protocol::ProtocolError &ex)
                                    {
                                        spdlog::warn("Dropping {}: {}", remote_endpoint_, ex.what());
                                        stop();
                                        return;
                                    }
                                    read_next_line();
                                });
    }

    void Session::process_line(const std::string &line)
    {
        nlohmann::json request;
        try
        {
            request = nlohmann::json::parse(line);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            spdlog::warn("Invalid JSON from {}: {}", remote_endpoint_, ex.what());
            reply(landrive::protocol::make_error("Invalid request"));
            return;
        }

        const auto command = landrive::protocol::peek_command(request);
        if (!command)
        {
            spdlog::warn("Unknown command from {}", remote_endpoint_);
            reply(landrive::protocol::make_error("Unknown command"));
            return;
        }

        spdlog::info("{} -> {}", remote_endpoint_, landrive::protocol::to_string(*command));

        try
        {
            switch (*command)
            {
            case landrive::protocol::Command::List:
                handle_list(request);
                break;
            case landrive::protocol::Command::Upload:
                handle_upload(request);
                break;
            case landrive::protocol::Command::Download:
                handle_download(request);
                break;
            case landrive::protocol::Command::Delete:
                handle_delete(request);
                break;
            case landrive::protocol::Command::Mkdir:
                handle_mkdir(request);
                break;
            }
        }
        catch (const landrive::protocol::ProtocolError &ex)
        {
            spdlog::warn("Incomplete {} from {}: {}", landrive::protocol::to_string(*command), remote_endpoint_,
                         ex.what());
            reply(landrive::protocol::make_error("Missing info"));
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::warn("Malformed {} from {}: {}", landrive::protocol::to_string(*command), remote_endpoint_,
                         ex.what());
            reply(landrive::protocol::make_error("Missing info"));
        }
        catch (const FilesystemError &fs)
        {
            spdlog::warn("{} from {} refused ({}): {}", landrive::protocol::to_string(*command), remote_endpoint_,
                         landrive::to_string(fs.code()), fs.what());
            if (fs.code() == landrive::ErrorCode::AccessDenied || fs.code() == landrive::ErrorCode::NotFound)
            {
                reply(landrive::protocol::make_error(session_common::not_found_message(*command)));
            }
            else
            {
                reply(landrive::protocol::make_error(fs.what()));
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} from {} failed: {}", landrive::protocol::to_string(*command), remote_endpoint_, ex.what());
            reply(landrive::protocol::make_error("Internal error"));
        }
    }

    void Session::send_response(const landrive::protocol::Response &response, std::function<void()> next)
    {
        if (stopped_)
        {
            return;
        }
        auto line = std::make_shared<std::string>(landrive::protocol::encode_line(nlohmann::json(response)));
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*line),
                          [this, self, line, next = std::move(next)](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  if (ec != asio::error::operation_aborted)
                                  {
                                      spdlog::warn("Write to {} failed: {}", remote_endpoint_, ec.message());
                                  }
                                  stop();
                                  return;
                              }
                              arm_idle_timer();
                              if (next)
                              {
                                  next();
                              }
                          });
    }

    void Session::reply(const landrive::protocol::Response &response)
    {
        auto self = shared_from_this();
        send_response(response, [this, self]
                      { read_next_line(); });
    }

} // namespace landrive::server
