// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <input/Modifier.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief A global key combination: a modifier set plus one main key.
///
/// Key names follow X11 keysym naming in lower case ("r", "apostrophe", "f9",
/// "escape"). Single punctuation characters are accepted when parsing and
/// normalized to their keysym name.
struct HotkeyCombo
{
    Modifier modifiers = Modifier::NoModifiers;
    std::string key;

    /// @brief Returns true if a main key is set.
    [[nodiscard]] auto isValid() const -> bool { return !key.empty(); }

    /// @brief Formats the combo as "ctrl+shift+key" (modifiers in a fixed order).
    [[nodiscard]] auto toString() const -> std::string;

    /// @brief Parses a combo such as "ctrl+'", "Ctrl+Shift+R" or "F9".
    /// @return The combo, or InvalidArgument for unknown modifiers or a missing main key.
    [[nodiscard]] static auto parse(std::string_view text) -> Result<HotkeyCombo>;

    auto operator==(const HotkeyCombo&) const -> bool = default;
};

/// @brief Normalizes a key name or single character to its lower-case keysym name.
[[nodiscard]] auto normalizeKeyName(std::string_view name) -> std::string;

/// @brief Edge-triggered hotkey event.
struct HotkeyEvent
{
    enum class Kind : std::uint8_t
    {
        Press,
        Release,
        Cancel,
    };

    Kind kind = Kind::Press;
    std::chrono::steady_clock::time_point timestamp = std::chrono::steady_clock::now();
};

[[nodiscard]] constexpr auto hotkeyKindName(HotkeyEvent::Kind kind) -> std::string_view
{
    switch (kind)
    {
        case HotkeyEvent::Kind::Press: return "press";
        case HotkeyEvent::Kind::Release: return "release";
        case HotkeyEvent::Kind::Cancel: return "cancel";
    }
    return "unknown";
}

} // namespace pushscribe
