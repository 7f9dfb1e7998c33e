// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <input/HotkeyCombo.hpp>

#include <functional>

namespace pushscribe
{

/// @brief Callback receiving hotkey edges. Invoked on the watcher's own thread.
using HotkeyHandler = std::function<void(HotkeyEvent event)>;

/// @brief Abstract global hotkey source.
///
/// Observes keyboard state independently of which window has focus.
class HotkeyWatcher
{
  public:
    virtual ~HotkeyWatcher() = default;

    /// @brief Starts delivering events to @p handler until stop() is called.
    ///
    /// The sequence cannot be restarted: a second call fails with InvalidArgument.
    /// @return Success, or HotkeyUnavailable if the OS hook cannot be installed (fatal at startup).
    [[nodiscard]] virtual auto observe(HotkeyHandler handler) -> VoidResult = 0;

    /// @brief Replaces the hotkey without restarting observation.
    virtual void setHotkey(HotkeyCombo combo) = 0;

    /// @brief Enables or disables the cancel key.
    virtual void setCancelArmed(bool armed) = 0;

    /// @brief Stops observation. Safe to call more than once.
    virtual void stop() = 0;
};

} // namespace pushscribe
