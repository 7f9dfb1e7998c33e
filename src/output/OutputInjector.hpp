// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Delivers final text into the application that has input focus.
class OutputInjector
{
  public:
    virtual ~OutputInjector() = default;

    /// @brief Delivers @p text. Blocks until the text was handed to the desktop.
    ///
    /// Called from worker threads; concurrent calls are delivered one after the other.
    /// @return Success or InjectionFailed.
    [[nodiscard]] virtual auto deliver(const std::string& text) -> VoidResult = 0;
};

/// @brief Desktop tooling used for clipboard and synthetic input.
enum class OutputBackend : std::uint8_t
{
    Auto,    ///< Chosen from the session environment.
    X11,     ///< xclip and xdotool.
    Wayland, ///< wl-copy, wl-paste and wtype.
};

/// @brief How the text reaches the focused application.
enum class OutputMethod : std::uint8_t
{
    Paste, ///< Clipboard swap plus a synthetic paste keystroke.
    Type,  ///< Synthetic typing of every character.
};

[[nodiscard]] auto outputBackendName(OutputBackend backend) -> std::string_view;
[[nodiscard]] auto parseOutputBackend(std::string_view name) -> std::optional<OutputBackend>;
[[nodiscard]] auto outputMethodName(OutputMethod method) -> std::string_view;
[[nodiscard]] auto parseOutputMethod(std::string_view name) -> std::optional<OutputMethod>;

/// @brief Environment lookup, injectable for tests.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

/// @brief Resolves Auto to a concrete backend.
///
/// WAYLAND_DISPLAY selects Wayland, otherwise DISPLAY selects X11.
/// @return The backend, or InjectionFailed when no graphical session is found.
[[nodiscard]] auto resolveOutputBackend(OutputBackend requested, const EnvironmentLookup& lookup)
    -> Result<OutputBackend>;

} // namespace pushscribe
