#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace devlink {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        AlreadyConnected,
        UnsupportedTransport,
        JoinTimeout,
        AuthFailure,
        NotConnected,
        PayloadTooLarge,
        TransportIo,
        DecodeFailed,
        InvalidData,
        InvalidState,
        HardwareFault,
        NotFound,
        ConsoleError,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error already_connected() noexcept {
            return Error(ErrorCode::AlreadyConnected, "connection already exists, disconnect first");
        }
        static Error unsupported_transport(dp::String msg = "") noexcept {
            return Error(ErrorCode::UnsupportedTransport, std::move(msg));
        }
        static Error join_timeout(u32 timeout_ms) noexcept {
            return Error(ErrorCode::JoinTimeout, "join timed out after " + dp::String(std::to_string(timeout_ms)) +
                                                     " ms");
        }
        static Error auth_failure(dp::String msg = "") noexcept {
            return Error(ErrorCode::AuthFailure, std::move(msg));
        }
        static Error not_connected() noexcept { return Error(ErrorCode::NotConnected, "not connected"); }
        static Error payload_too_large(usize size, usize limit) noexcept {
            return Error(ErrorCode::PayloadTooLarge, "payload of " + dp::String(std::to_string(size)) +
                                                         " bytes exceeds limit of " +
                                                         dp::String(std::to_string(limit)));
        }
        static Error transport_io(dp::String msg = "") noexcept {
            return Error(ErrorCode::TransportIo, std::move(msg));
        }
        static Error decode_failed(dp::String msg = "") noexcept {
            return Error(ErrorCode::DecodeFailed, std::move(msg));
        }
        static Error invalid_data(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidData, std::move(msg));
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error hardware_fault(dp::String msg = "") noexcept {
            return Error(ErrorCode::HardwareFault, std::move(msg));
        }
        static Error not_found(dp::String msg = "") noexcept { return Error(ErrorCode::NotFound, std::move(msg)); }
        static Error console_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::ConsoleError, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace devlink
