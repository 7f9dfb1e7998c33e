// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>

namespace pushscribe
{

/// @brief Abstract source of push-to-talk audio sessions.
///
/// A session runs from start() to stop(). At most one session is active at a time.
class AudioCapture
{
  public:
    virtual ~AudioCapture() = default;

    /// @brief Begins writing frames into a new AudioBuffer.
    /// @return Success, or DeviceUnavailable if no device can be used or a session is active.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Ends the session and returns the frozen buffer accumulated since start().
    [[nodiscard]] virtual auto stop() -> AudioBuffer = 0;

    /// @brief Returns true while a session is active.
    [[nodiscard]] virtual auto isCapturing() const -> bool = 0;

    /// @brief Returns the RMS amplitude (0.0 to 1.0) of the most recent frame.
    ///
    /// Non-blocking snapshot read, safe to call from any thread.
    [[nodiscard]] virtual auto currentAmplitude() const -> float = 0;
};

} // namespace pushscribe
