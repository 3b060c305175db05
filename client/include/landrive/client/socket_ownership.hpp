#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace landrive::client
{

    // Exclusive-ownership token for the one client socket. Whoever holds a
    // Lease may touch the connection; nobody else may.
    //
    // Transfers block until they own the socket. The background listener only
    // ever tries, and backs off while a transfer is waiting or running, so a
    // transfer never waits behind more than one listener poll.
    class SocketOwnership
    {
    public:
        enum class Owner
        {
            None,
            Listener,
            Transfer
        };

        class Lease
        {
        public:
            Lease() = default;
            ~Lease();

            Lease(Lease &&other) noexcept;
            Lease &operator=(Lease &&other) noexcept;

            Lease(const Lease &) = delete;
            Lease &operator=(const Lease &) = delete;

            void release() noexcept;

            bool owns() const noexcept { return ownership_ != nullptr; }

        private:
            friend class SocketOwnership;
            explicit Lease(SocketOwnership &ownership) : ownership_(&ownership) {}

            SocketOwnership *ownership_{nullptr};
        };

        SocketOwnership() = default;
        SocketOwnership(const SocketOwnership &) = delete;
        SocketOwnership &operator=(const SocketOwnership &) = delete;

        // Blocks until no one else owns the socket. Transfers are served one
        // at a time.
        Lease acquire_for_transfer();

        // Fails while anyone owns the socket or a transfer is waiting for it.
        std::optional<Lease> try_acquire_for_listener();

        Owner holder() const;

        std::size_t waiting_transfers() const;

    private:
        void release() noexcept;

        mutable std::mutex mutex_;
        std::condition_variable released_;
        Owner holder_{Owner::None};
        std::size_t waiting_transfers_{0};
    };

} // namespace landrive::client
