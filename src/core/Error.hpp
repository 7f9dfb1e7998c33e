// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Error codes for categorizing failures across the application.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    ProtocolError,
    ProcessError,
    HotkeyUnavailable,
    DeviceUnavailable,
    NetworkError,
    AuthError,
    Cancelled,
    InjectionFailed,
};

/// @brief Returns a stable, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ProcessError: return "ProcessError";
        case ErrorCode::HotkeyUnavailable: return "HotkeyUnavailable";
        case ErrorCode::DeviceUnavailable: return "DeviceUnavailable";
        case ErrorCode::NetworkError: return "NetworkError";
        case ErrorCode::AuthError: return "AuthError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InjectionFailed: return "InjectionFailed";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace pushscribe

template <>
struct std::formatter<pushscribe::Error>: std::formatter<std::string>
{
    auto format(const pushscribe::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", pushscribe::errorCodeName(error.code), error.message), ctx);
    }
};
