// SPDX-License-Identifier: Apache-2.0
#include "Encoding.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace pushscribe
{

namespace
{
    constexpr auto Alphabet = std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
} // namespace

auto encodeBase64(std::string_view data) -> std::string
{
    auto out = std::string {};
    out.reserve((data.size() + 2) / 3 * 4);

    auto i = std::size_t { 0 };
    for (; i + 2 < data.size(); i += 3)
    {
        auto const n = (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i])) << 16)
                       | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8)
                       | static_cast<std::uint32_t>(static_cast<unsigned char>(data[i + 2]));
        out += Alphabet[(n >> 18) & 0x3F];
        out += Alphabet[(n >> 12) & 0x3F];
        out += Alphabet[(n >> 6) & 0x3F];
        out += Alphabet[n & 0x3F];
    }

    auto const rest = data.size() - i;
    if (rest == 1)
    {
        auto const n = static_cast<std::uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        out += Alphabet[(n >> 18) & 0x3F];
        out += Alphabet[(n >> 12) & 0x3F];
        out += "==";
    }
    else if (rest == 2)
    {
        auto const n = (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i])) << 16)
                       | (static_cast<std::uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8);
        out += Alphabet[(n >> 18) & 0x3F];
        out += Alphabet[(n >> 12) & 0x3F];
        out += Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

auto toPcm16(std::span<const float> samples) -> std::string
{
    auto out = std::string {};
    out.reserve(samples.size() * 2);
    for (auto const sample: samples)
    {
        auto const clamped = std::isnan(sample) ? 0.0f : std::clamp(sample, -1.0f, 1.0f);
        auto const value = static_cast<std::int16_t>(std::lround(clamped * 32767.0f));
        auto const bits = static_cast<std::uint16_t>(value);
        out += static_cast<char>(bits & 0xFF);
        out += static_cast<char>((bits >> 8) & 0xFF);
    }
    return out;
}

} // namespace pushscribe
