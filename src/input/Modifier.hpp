// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace pushscribe
{

/// @brief Modifier keys that may take part in a hotkey combo.
///
/// Lock modifiers (CapsLock, NumLock) are deliberately absent: they never
/// decide whether a combo matches.
enum class Modifier : std::uint8_t
{
    NoModifiers = 0,
    Ctrl = 1 << 0,
    Shift = 1 << 1,
    Alt = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr auto operator|(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(Modifier lhs, Modifier rhs) noexcept -> Modifier
{
    return static_cast<Modifier>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

constexpr auto operator|=(Modifier& lhs, Modifier rhs) noexcept -> Modifier&
{
    lhs = lhs | rhs;
    return lhs;
}

[[nodiscard]] constexpr auto hasModifier(Modifier mods, Modifier flag) noexcept -> bool
{
    return (mods & flag) != Modifier::NoModifiers;
}

/// @brief Single modifiers in the order they are written in a combo string.
constexpr auto ModifierOrder = std::array { Modifier::Ctrl, Modifier::Shift, Modifier::Alt, Modifier::Super };

/// @brief Canonical lower-case name of a single modifier ("ctrl", "shift", "alt", "super").
[[nodiscard]] constexpr auto modifierName(Modifier flag) noexcept -> std::string_view
{
    switch (flag)
    {
        case Modifier::Ctrl: return "ctrl";
        case Modifier::Shift: return "shift";
        case Modifier::Alt: return "alt";
        case Modifier::Super: return "super";
        case Modifier::NoModifiers: break;
    }
    return {};
}

} // namespace pushscribe
