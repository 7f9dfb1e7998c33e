// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <input/HotkeyWatcher.hpp>

#include <memory>
#include <optional>

namespace pushscribe
{

/// @brief Global hotkey watcher using passive X11 key grabs on the root window.
///
/// Detectable auto-repeat is enabled so a held key produces repeated key-down
/// events only, which HotkeyTracker collapses into a single Press. The cancel
/// key is grabbed only while armed, so it is not stolen from other applications
/// while the pipeline is idle. A self-pipe wakes the event thread for rebinding
/// and shutdown.
class X11HotkeyWatcher: public HotkeyWatcher
{
  public:
    /// @param combo The push-to-talk hotkey.
    /// @param cancelCombo Optional key that cancels the active run while armed.
    X11HotkeyWatcher(HotkeyCombo combo, std::optional<HotkeyCombo> cancelCombo);
    ~X11HotkeyWatcher() override;

    X11HotkeyWatcher(const X11HotkeyWatcher&) = delete;
    X11HotkeyWatcher& operator=(const X11HotkeyWatcher&) = delete;

    [[nodiscard]] auto observe(HotkeyHandler handler) -> VoidResult override;
    void setHotkey(HotkeyCombo combo) override;
    void setCancelArmed(bool armed) override;
    void stop() override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
