// SPDX-License-Identifier: Apache-2.0
#include "HotkeyTracker.hpp"

namespace pushscribe
{

HotkeyTracker::HotkeyTracker(HotkeyCombo combo): _combo(std::move(combo))
{
}

void HotkeyTracker::setCombo(HotkeyCombo combo)
{
    _combo = std::move(combo);
    _held = false;
}

void HotkeyTracker::setCancelCombo(std::optional<HotkeyCombo> combo)
{
    _cancelCombo = std::move(combo);
}

auto HotkeyTracker::onKey(const RawKeyEvent& event) -> std::optional<HotkeyEvent::Kind>
{
    if (!_combo.isValid())
        return std::nullopt;

    if (event.pressed)
    {
        if (event.key == _combo.key && event.modifiers == _combo.modifiers)
        {
            if (_held)
                return std::nullopt; // key repeat
            _held = true;
            return HotkeyEvent::Kind::Press;
        }

        if (_cancelCombo && event.key == _cancelCombo->key && event.modifiers == _cancelCombo->modifiers)
            return HotkeyEvent::Kind::Cancel;

        return std::nullopt;
    }

    if (_held && event.key == _combo.key)
    {
        _held = false;
        return HotkeyEvent::Kind::Release;
    }

    return std::nullopt;
}

} // namespace pushscribe
