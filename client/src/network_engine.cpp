#include "landrive/client/network_engine.hpp"

#include <utility>

#include "landrive/framing.hpp"

namespace landrive::client
{

    NetworkEngine::NetworkEngine(EngineOptions options, EngineObserver &observer, Logger logger)
        : options_(options), observer_(observer), logger_(logger), connection_(logger) {}

    NetworkEngine::~NetworkEngine()
    {
        stop();
    }

    void NetworkEngine::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        listener_ = std::thread([this]
                                { listener_loop(); });
    }

    void NetworkEngine::stop()
    {
        running_ = false;
        if (ownership_.holder() == SocketOwnership::Owner::Transfer)
        {
            connection_.interrupt();
        }
        if (listener_.joinable())
        {
            listener_.join();
        }
        auto lease = ownership_.acquire_for_transfer();
        if (connected_)
        {
            drop_connection();
        }
        else
        {
            connection_.close();
        }
    }

    void NetworkEngine::connect_to(const std::string &host)
    {
        connect_to(host, options_.port);
    }

    void NetworkEngine::connect_to(const std::string &host, std::uint16_t port)
    {
        {
            std::lock_guard lock(state_mutex_);
            pending_connect_ = PendingConnect{host, port};
        }
        if (connected_)
        {
            disconnect();
        }
    }

    void NetworkEngine::disconnect()
    {
        disconnect_requested_ = true;
        if (ownership_.holder() == SocketOwnership::Owner::Transfer)
        {
            connection_.interrupt();
        }
    }

    std::optional<std::string> NetworkEngine::connected_host() const
    {
        std::lock_guard lock(state_mutex_);
        return host_;
    }

    std::string NetworkEngine::current_path() const
    {
        std::lock_guard lock(state_mutex_);
        return current_path_;
    }

    bool NetworkEngine::request_listing(const std::string &path)
    {
        return enqueue(landrive::protocol::ListRequest{path});
    }

    bool NetworkEngine::make_directory(const std::string &dirname, const std::string &path)
    {
        return enqueue(landrive::protocol::MkdirRequest{dirname, path});
    }

    bool NetworkEngine::delete_entry(const std::string &filename, const std::string &path)
    {
        return enqueue(landrive::protocol::DeleteRequest{filename, path});
    }

    bool NetworkEngine::enqueue(const nlohmann::json &request)
    {
        if (!connected_)
        {
            observer_.on_error("Not connected");
            return false;
        }
        std::lock_guard lock(state_mutex_);
        outbox_.push_back(landrive::protocol::encode_line(request));
        return true;
    }

    void NetworkEngine::listener_loop()
    {
        logger_.log("listener", "started");
        while (running_)
        {
            auto lease = ownership_.try_acquire_for_listener();
            if (!lease)
            {
                std::this_thread::sleep_for(options_.poll_interval);
                continue;
            }

            try
            {
                if (disconnect_requested_.exchange(false) && connected_)
                {
                    drop_connection();
                    observer_.on_log("Disconnected", LogLevel::Info);
                }

                std::optional<PendingConnect> target;
                {
                    std::lock_guard lock(state_mutex_);
                    target = std::exchange(pending_connect_, std::nullopt);
                }
                if (target)
                {
                    establish(*target);
                }

                if (!connected_)
                {
                    lease->release();
                    std::this_thread::sleep_for(options_.poll_interval);
                    continue;
                }

                flush_outbox();
                for (const auto &line : connection_.poll_lines(options_.poll_interval))
                {
                    dispatch_line(line);
                }
            }
            catch (const ConnectionError &ex)
            {
                logger_.warn("listener", "connection lost: ", ex.what());
                const bool was_connected = connected_;
                drop_connection();
                if (running_ && was_connected)
                {
                    observer_.on_error(std::string("Connection lost: ") + ex.what());
                }
            }
            catch (const landrive::protocol::ProtocolError &ex)
            {
                // Only an unterminated line over the size limit gets here.
                logger_.warn("listener", "stream unusable: ", ex.what());
                drop_connection();
                observer_.on_error(std::string("Connection lost: ") + ex.what());
            }
        }
        logger_.log("listener", "stopped");
    }

    void NetworkEngine::establish(const PendingConnect &target)
    {
        observer_.on_log("Connecting to " + target.host + ":" + std::to_string(target.port), LogLevel::Info);
        try
        {
            connection_.open(target.host, target.port, options_.connect_timeout);
        }
        catch (const ConnectionError &ex)
        {
            logger_.warn("listener", "connect to ", target.host, ':', target.port, " failed: ", ex.what());
            observer_.on_error(std::string("Connection failed: ") + ex.what());
            observer_.on_connection_changed(false);
            return;
        }

        {
            std::lock_guard lock(state_mutex_);
            host_ = target.host;
            current_path_.clear();
            outbox_.clear();
            // Show the root right away.
            outbox_.push_back(landrive::protocol::encode_line(landrive::protocol::ListRequest{""}));
        }
        outstanding_replies_ = 0;
        connected_ = true;
        observer_.on_connection_changed(true);
        observer_.on_log("Connected to " + target.host + ":" + std::to_string(target.port), LogLevel::Success);
    }

    void NetworkEngine::drop_connection()
    {
        connection_.close();
        {
            std::lock_guard lock(state_mutex_);
            host_.reset();
            outbox_.clear();
        }
        outstanding_replies_ = 0;
        if (connected_.exchange(false))
        {
            observer_.on_connection_changed(false);
        }
    }

    void NetworkEngine::flush_outbox()
    {
        std::deque<std::string> pending;
        {
            std::lock_guard lock(state_mutex_);
            pending.swap(outbox_);
        }
        for (const auto &line : pending)
        {
            connection_.write(line, options_.transfer_timeout);
            ++outstanding_replies_;
        }
    }

    void NetworkEngine::dispatch_line(const std::string &line)
    {
        if (outstanding_replies_ > 0)
        {
            --outstanding_replies_;
        }
        landrive::protocol::Response response;
        try
        {
            response = landrive::protocol::decode_response(line);
        }
        catch (const landrive::protocol::ProtocolError &ex)
        {
            logger_.warn("listener", "ignoring malformed message: ", ex.what());
            observer_.on_log(std::string("Ignoring malformed message: ") + ex.what(), LogLevel::Warning);
            return;
        }
        dispatch_response(response);
    }

    void NetworkEngine::dispatch_response(const landrive::protocol::Response &response)
    {
        if (response.is_listing())
        {
            const auto path = response.current_path.value_or("");
            {
                std::lock_guard lock(state_mutex_);
                current_path_ = path;
            }
            observer_.on_listing(*response.items, path);
            return;
        }
        if (response.status == landrive::protocol::ResponseStatus::Error)
        {
            observer_.on_error(response.message.value_or("Unknown error"));
            return;
        }
        if (response.message)
        {
            observer_.on_log(*response.message, LogLevel::Success);
        }
    }

} // namespace landrive::client
