// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>

#include <memory>
#include <string_view>

namespace pushscribe
{

/// @brief Captures push-to-talk sessions from a microphone using miniaudio.
///
/// Captures float32 PCM audio at 16kHz mono. The device is opened once by
/// initialize() and only runs between start() and stop().
class MicrophoneCapture: public AudioCapture
{
  public:
    MicrophoneCapture();
    ~MicrophoneCapture() override;

    MicrophoneCapture(const MicrophoneCapture&) = delete;
    MicrophoneCapture& operator=(const MicrophoneCapture&) = delete;

    /// @brief Opens the capture device.
    /// @param deviceName Optional substring to match against capture device names (case-insensitive).
    ///                   If empty, the first non-monitor device or the system default is used.
    /// @return Success or DeviceUnavailable.
    [[nodiscard]] auto initialize(std::string_view deviceName = {}) -> VoidResult;

    [[nodiscard]] auto start() -> VoidResult override;
    [[nodiscard]] auto stop() -> AudioBuffer override;
    [[nodiscard]] auto isCapturing() const -> bool override;
    [[nodiscard]] auto currentAmplitude() const -> float override;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
