// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <input/HotkeyCombo.hpp>

#include <optional>
#include <string>

namespace pushscribe
{

/// @brief A raw key transition reported by a platform keyboard source.
struct RawKeyEvent
{
    std::string key;                     ///< Normalized key name (see normalizeKeyName()).
    bool pressed = false;                ///< True for key down, false for key up.
    Modifier modifiers = Modifier::NoModifiers; ///< Modifiers held at the time of the event.
};

/// @brief Turns raw key transitions into edge-triggered hotkey events.
///
/// A held key yields exactly one Press no matter how many repeated key-down
/// transitions arrive, followed by exactly one Release when the main key goes
/// up. Press requires the exact modifier set; Release ignores modifiers so that
/// letting go of a modifier first still ends the hold.
class HotkeyTracker
{
  public:
    explicit HotkeyTracker(HotkeyCombo combo = {});

    /// @brief Replaces the hotkey and forgets any held state.
    void setCombo(HotkeyCombo combo);

    /// @brief Sets the key that produces Cancel events, or disables it with std::nullopt.
    void setCancelCombo(std::optional<HotkeyCombo> combo);

    [[nodiscard]] auto combo() const noexcept -> const HotkeyCombo& { return _combo; }
    [[nodiscard]] auto isHeld() const noexcept -> bool { return _held; }

    /// @brief Feeds one raw transition.
    /// @return The resulting edge, if any.
    [[nodiscard]] auto onKey(const RawKeyEvent& event) -> std::optional<HotkeyEvent::Kind>;

  private:
    HotkeyCombo _combo;
    std::optional<HotkeyCombo> _cancelCombo;
    bool _held = false;
};

} // namespace pushscribe
