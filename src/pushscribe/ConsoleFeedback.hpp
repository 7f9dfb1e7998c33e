// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <pipeline/FeedbackSink.hpp>

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

namespace pushscribe
{

/// @brief Number of capsules in the console level meter.
constexpr auto LevelMeterCapsules = std::size_t { 16 };

/// @brief Renders a linear RMS amplitude as a capsule meter spanning -80 dBFS to 0 dBFS.
[[nodiscard]] auto renderLevelMeter(float amplitude, std::size_t capsules = LevelMeterCapsules) -> std::string;

/// @brief Status line on the terminal.
///
/// Shows a live level meter while recording and a spinner while waiting for
/// the remote services; prints one line per finished run.
class ConsoleFeedback: public FeedbackSink
{
  public:
    explicit ConsoleFeedback(const AudioCapture& capture, std::FILE* out = stdout);
    ~ConsoleFeedback() override;

    ConsoleFeedback(const ConsoleFeedback&) = delete;
    ConsoleFeedback& operator=(const ConsoleFeedback&) = delete;

    void notify(const FeedbackEvent& event) override;

    /// @brief Writes a log line to stderr above the status line, then redraws it.
    void printLog(log::Level level, std::string_view message);

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pushscribe
