// SPDX-License-Identifier: Apache-2.0
#include "HotkeyCombo.hpp"

#include <core/StringUtils.hpp>

#include <array>
#include <format>
#include <utility>
#include <vector>

namespace pushscribe
{

namespace
{

    constexpr auto PunctuationNames = std::array<std::pair<char, std::string_view>, 15> { {
        { '\'', "apostrophe" },
        { '`', "grave" },
        { ',', "comma" },
        { '.', "period" },
        { '/', "slash" },
        { ';', "semicolon" },
        { '-', "minus" },
        { '=', "equal" },
        { '[', "bracketleft" },
        { ']', "bracketright" },
        { '\\', "backslash" },
        { ' ', "space" },
        { '+', "plus" },
        { '*', "asterisk" },
        { '#', "numbersign" },
    } };

    constexpr auto ModifierNames = std::array<std::pair<std::string_view, Modifier>, 9> { {
        { "ctrl", Modifier::Ctrl },
        { "control", Modifier::Ctrl },
        { "shift", Modifier::Shift },
        { "alt", Modifier::Alt },
        { "option", Modifier::Alt },
        { "super", Modifier::Super },
        { "cmd", Modifier::Super },
        { "meta", Modifier::Super },
        { "win", Modifier::Super },
    } };

} // namespace

auto normalizeKeyName(std::string_view name) -> std::string
{
    if (name.size() == 1)
    {
        for (auto const& [ch, keysym]: PunctuationNames)
            if (name.front() == ch)
                return std::string(keysym);
    }
    if (name == "esc")
        return "escape";
    if (name == "enter")
        return "return";
    return toLower(name);
}

auto HotkeyCombo::toString() const -> std::string
{
    auto out = std::string {};
    for (auto const flag: ModifierOrder)
    {
        if (hasModifier(modifiers, flag))
        {
            out += modifierName(flag);
            out += '+';
        }
    }
    out += key;
    return out;
}

auto HotkeyCombo::parse(std::string_view text) -> Result<HotkeyCombo>
{
    auto tokens = std::vector<std::string_view> {};
    auto rest = trim(text);

    // A trailing "++" means the main key is '+' itself
    auto plusKey = false;
    if (rest.size() >= 2 && rest.ends_with("++"))
    {
        plusKey = true;
        rest.remove_suffix(2);
    }
    else if (rest == "+")
    {
        plusKey = true;
        rest = {};
    }

    while (!rest.empty())
    {
        auto const pos = rest.find('+');
        tokens.push_back(trim(rest.substr(0, pos)));
        if (pos == std::string_view::npos)
            break;
        rest.remove_prefix(pos + 1);
    }
    if (plusKey)
        tokens.push_back("+");

    auto combo = HotkeyCombo {};
    for (auto i = std::size_t { 0 }; i < tokens.size(); ++i)
    {
        auto const token = tokens[i];
        if (token.empty())
            return makeError(ErrorCode::InvalidArgument, std::format("Empty key in hotkey '{}'", text));

        auto const isLast = i + 1 == tokens.size();
        if (isLast)
        {
            combo.key = normalizeKeyName(token);
            break;
        }

        auto const lower = toLower(token);
        auto matched = false;
        for (auto const& [name, flag]: ModifierNames)
        {
            if (lower == name)
            {
                combo.modifiers |= flag;
                matched = true;
                break;
            }
        }
        if (!matched)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Unknown modifier '{}' in hotkey '{}'", token, text));
    }

    if (!combo.isValid())
        return makeError(ErrorCode::InvalidArgument, std::format("Hotkey '{}' has no main key", text));

    for (auto const& [name, flag]: ModifierNames)
        if (combo.key == name)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Hotkey '{}' must end with a non-modifier key", text));

    return combo;
}

} // namespace pushscribe
