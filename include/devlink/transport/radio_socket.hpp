#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>

namespace devlink {

    // ─── Raw radio socket (provided by the platform binding) ────────────────────
    class RadioSocket {
      public:
        virtual ~RadioSocket() = default;

        virtual Result<void> set_blocking(bool blocking) = 0;
        virtual Result<void> send(const Bytes &data) = 0;
        // Returns an empty buffer when nothing is pending in non-blocking mode
        virtual Result<Bytes> recv(usize max_size) = 0;
        virtual Result<void> close() = 0;
    };

    // ─── Socket shared between the receiver task and foreground senders ─────────
    // Every access to the underlying socket, including mode changes, happens
    // inside one scoped lock. The receive path only performs a non-blocking
    // attempt while holding it.
    class GuardedSocket {
        std::unique_ptr<RadioSocket> socket_;
        mutable std::mutex mutex_;

      public:
        GuardedSocket() = default;
        explicit GuardedSocket(std::unique_ptr<RadioSocket> socket) : socket_(std::move(socket)) {}

        void reset(std::unique_ptr<RadioSocket> socket) {
            std::lock_guard<std::mutex> lock(mutex_);
            socket_ = std::move(socket);
        }

        bool is_open() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return socket_ != nullptr;
        }

        Result<void> send_blocking(const Bytes &data) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!socket_)
                return Result<void>::err(Error::not_connected());
            auto mode = socket_->set_blocking(true);
            if (!mode.is_ok())
                return mode;
            return socket_->send(data);
        }

        Result<void> send(const Bytes &data) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!socket_)
                return Result<void>::err(Error::not_connected());
            return socket_->send(data);
        }

        Result<Bytes> try_recv(usize max_size) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!socket_)
                return Result<Bytes>::err(Error::not_connected());
            auto mode = socket_->set_blocking(false);
            if (!mode.is_ok())
                return Result<Bytes>::err(mode.error());
            return socket_->recv(max_size);
        }

        // Closes and releases the socket. The handle is dropped even when close fails.
        Result<void> close() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!socket_)
                return {};
            auto result = socket_->close();
            socket_.reset();
            return result;
        }
    };

} // namespace devlink
