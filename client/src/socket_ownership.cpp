#include "landrive/client/socket_ownership.hpp"

#include <utility>

namespace landrive::client
{

    SocketOwnership::Lease::~Lease()
    {
        release();
    }

    SocketOwnership::Lease::Lease(Lease &&other) noexcept : ownership_(std::exchange(other.ownership_, nullptr)) {}

    SocketOwnership::Lease &SocketOwnership::Lease::operator=(Lease &&other) noexcept
    {
        if (this != &other)
        {
            release();
            ownership_ = std::exchange(other.ownership_, nullptr);
        }
        return *this;
    }

    void SocketOwnership::Lease::release() noexcept
    {
        if (auto *ownership = std::exchange(ownership_, nullptr))
        {
            ownership->release();
        }
    }

    SocketOwnership::Lease SocketOwnership::acquire_for_transfer()
    {
        std::unique_lock lock(mutex_);
        ++waiting_transfers_;
        released_.wait(lock, [this]
                       { return holder_ == Owner::None; });
        --waiting_transfers_;
        holder_ = Owner::Transfer;
        return Lease(*this);
    }

    std::optional<SocketOwnership::Lease> SocketOwnership::try_acquire_for_listener()
    {
        std::lock_guard lock(mutex_);
        if (holder_ != Owner::None || waiting_transfers_ > 0)
        {
            return std::nullopt;
        }
        holder_ = Owner::Listener;
        return Lease(*this);
    }

    SocketOwnership::Owner SocketOwnership::holder() const
    {
        std::lock_guard lock(mutex_);
        return holder_;
    }

    std::size_t SocketOwnership::waiting_transfers() const
    {
        std::lock_guard lock(mutex_);
        return waiting_transfers_;
    }

    void SocketOwnership::release() noexcept
    {
        {
            std::lock_guard lock(mutex_);
            holder_ = Owner::None;
        }
        released_.notify_all();
    }

} // namespace landrive::client
