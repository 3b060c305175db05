/**
 * LanDrive - Shared error codes used across client and server layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace landrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        UnknownCommand = 1,
        InvalidPayload = 2,
        ProtocolDecodeError = 3,
        AccessDenied = 4,
        NotFound = 5,
        AlreadyExists = 6,
        TransferIncomplete = 7,
        ConnectionLost = 8,
        Timeout = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace landrive
