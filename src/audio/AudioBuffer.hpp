// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

namespace pushscribe
{

/// @brief Sample rate used for all captured audio (speech recognition friendly).
constexpr auto CaptureSampleRate = 16000u;

/// @brief Duration of one analysis frame used for amplitude measurement.
constexpr auto FrameDuration = std::chrono::milliseconds(10);

/// @brief Mono float32 PCM audio with its sample rate.
///
/// Filled by an AudioCapture session while recording. Once returned by
/// AudioCapture::stop() the buffer is frozen and owned by the caller.
struct AudioBuffer
{
    std::vector<float> samples;
    unsigned sampleRate = CaptureSampleRate;

    [[nodiscard]] auto empty() const noexcept -> bool { return samples.empty(); }

    /// @brief Number of samples in one analysis frame at this buffer's sample rate.
    [[nodiscard]] auto samplesPerFrame() const noexcept -> std::size_t
    {
        auto const n = static_cast<std::size_t>(sampleRate) * FrameDuration.count() / 1000;
        return n > 0 ? n : 1;
    }

    /// @brief Number of frames, counting a trailing partial frame.
    [[nodiscard]] auto frameCount() const noexcept -> std::size_t
    {
        auto const perFrame = samplesPerFrame();
        return (samples.size() + perFrame - 1) / perFrame;
    }

    [[nodiscard]] auto duration() const noexcept -> std::chrono::milliseconds
    {
        if (sampleRate == 0)
            return std::chrono::milliseconds(0);
        return std::chrono::milliseconds(samples.size() * 1000 / sampleRate);
    }

    auto operator==(const AudioBuffer&) const -> bool = default;
};

} // namespace pushscribe
