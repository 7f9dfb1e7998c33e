// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <span>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Standard base64 (RFC 4648) with padding.
[[nodiscard]] auto encodeBase64(std::string_view data) -> std::string;

/// @brief Converts float samples to signed 16-bit little-endian PCM bytes, clamping to [-1, 1].
[[nodiscard]] auto toPcm16(std::span<const float> samples) -> std::string;

} // namespace pushscribe
