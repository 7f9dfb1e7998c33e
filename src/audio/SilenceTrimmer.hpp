// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>

#include <chrono>
#include <span>

namespace pushscribe
{

/// @brief Lowest level reported by amplitudeToDb(), used for digital silence.
constexpr auto SilenceFloorDb = -120.0f;

/// @brief Computes the RMS amplitude (0.0 to 1.0) of a block of samples.
[[nodiscard]] auto rmsAmplitude(std::span<const float> samples) -> float;

/// @brief Converts a linear amplitude to dBFS, clamped at SilenceFloorDb.
[[nodiscard]] auto amplitudeToDb(float amplitude) -> float;

/// @brief Returns the RMS level in dBFS of the frame at @p index.
/// @pre index < buffer.frameCount()
[[nodiscard]] auto frameLevelDb(const AudioBuffer& buffer, std::size_t index) -> float;

/// @brief Removes leading and trailing silence from a frozen buffer.
///
/// A frame is silent when its RMS level is below @p thresholdDb. A leading or
/// trailing run of silent frames is removed only when it lasts at least
/// @p minSilence. A buffer in which every frame is silent trims to an empty
/// buffer. Cuts happen on frame boundaries measured from the start of the
/// buffer, which makes the operation idempotent.
/// @param buffer The captured audio.
/// @param thresholdDb Silence threshold in dBFS (e.g. -50).
/// @param minSilence Minimum duration of a removable silent span.
/// @return The trimmed audio, with the same sample rate.
[[nodiscard]] auto trimSilence(const AudioBuffer& buffer, float thresholdDb, std::chrono::milliseconds minSilence)
    -> AudioBuffer;

} // namespace pushscribe
