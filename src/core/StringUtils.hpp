// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Returns the input without leading and trailing whitespace.
[[nodiscard]] inline auto trim(std::string_view text) -> std::string_view
{
    auto const start = text.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos)
        return {};
    auto const end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

/// @brief Returns an ASCII lower-case copy of the input.
[[nodiscard]] inline auto toLower(std::string_view text) -> std::string
{
    auto s = std::string(text);
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace pushscribe
