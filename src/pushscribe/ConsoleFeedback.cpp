// SPDX-License-Identifier: Apache-2.0
#include "ConsoleFeedback.hpp"

#include <audio/SilenceTrimmer.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <format>
#include <mutex>
#include <print>
#include <string_view>
#include <thread>

namespace pushscribe
{

namespace
{
    constexpr auto MeterFloorDb = -80.0f;
    constexpr auto FilledCapsule = std::string_view { "\u25AE" }; // ▮
    constexpr auto EmptyCapsule = std::string_view { "\u25AF" };  // ▯

    constexpr auto SpinnerFrames = std::array {
        std::string_view { "\u280B" }, // ⠋
        std::string_view { "\u2819" }, // ⠙
        std::string_view { "\u2839" }, // ⠹
        std::string_view { "\u2838" }, // ⠸
        std::string_view { "\u283C" }, // ⠼
        std::string_view { "\u2834" }, // ⠴
        std::string_view { "\u2826" }, // ⠦
        std::string_view { "\u2827" }, // ⠧
        std::string_view { "\u2807" }, // ⠇
        std::string_view { "\u280F" }, // ⠏
    };
    constexpr auto FrameInterval = std::chrono::milliseconds(80);

    constexpr auto ClearLine = std::string_view { "\r\033[2K" };

    enum class LineMode
    {
        Hidden,
        Meter,
        Spinner,
    };
} // namespace

auto renderLevelMeter(float amplitude, std::size_t capsules) -> std::string
{
    auto const db = amplitudeToDb(amplitude);
    auto const fraction = std::clamp((db - MeterFloorDb) / -MeterFloorDb, 0.0f, 1.0f);
    auto const lit = static_cast<std::size_t>(std::lround(fraction * static_cast<float>(capsules)));

    auto meter = std::string {};
    for (auto i = std::size_t { 0 }; i < capsules; ++i)
        meter += i < lit ? FilledCapsule : EmptyCapsule;
    return meter;
}

struct ConsoleFeedback::Impl
{
    const AudioCapture& capture;
    std::FILE* out;

    std::mutex mutex;
    std::condition_variable_any cv;
    LineMode mode = LineMode::Hidden;
    std::string label;
    std::size_t frame = 0;
    std::jthread ticker;

    Impl(const AudioCapture& c, std::FILE* o): capture(c), out(o) {}

    void redraw()
    {
        switch (mode)
        {
            case LineMode::Hidden: return;
            case LineMode::Meter:
                std::print(out, "{}\u25CF Recording {}", ClearLine, renderLevelMeter(capture.currentAmplitude()));
                break;
            case LineMode::Spinner:
                std::print(out, "{}{} {}", ClearLine, SpinnerFrames[frame % SpinnerFrames.size()], label);
                ++frame;
                break;
        }
        std::fflush(out);
    }

    void run(const std::stop_token& stopToken)
    {
        auto lock = std::unique_lock(mutex);
        while (!stopToken.stop_requested())
        {
            cv.wait_for(lock, stopToken, FrameInterval, [] { return false; });
            redraw();
        }
    }

    void setLine(LineMode newMode, std::string newLabel = {})
    {
        mode = newMode;
        label = std::move(newLabel);
        frame = 0;
        redraw();
    }

    void finishLine(std::string_view text)
    {
        mode = LineMode::Hidden;
        std::print(out, "{}{}\n", ClearLine, text);
        std::fflush(out);
    }
};

ConsoleFeedback::ConsoleFeedback(const AudioCapture& capture, std::FILE* out):
    _impl(std::make_unique<Impl>(capture, out))
{
    _impl->ticker = std::jthread([impl = _impl.get()](std::stop_token stopToken) { impl->run(stopToken); });
}

ConsoleFeedback::~ConsoleFeedback()
{
    _impl->ticker.request_stop();
    if (_impl->ticker.joinable())
        _impl->ticker.join();
}

void ConsoleFeedback::notify(const FeedbackEvent& event)
{
    auto lock = std::lock_guard(_impl->mutex);
    switch (event.kind)
    {
        case FeedbackKind::RecordingStarted: _impl->setLine(LineMode::Meter); break;
        case FeedbackKind::TranscribingStarted: _impl->setLine(LineMode::Spinner, "Transcribing..."); break;
        case FeedbackKind::PostProcessingStarted: _impl->setLine(LineMode::Spinner, "Post-processing..."); break;
        case FeedbackKind::NoSpeechDetected: _impl->finishLine("No speech detected"); break;
        case FeedbackKind::Cancelled: _impl->finishLine("Cancelled"); break;
        case FeedbackKind::Done: _impl->finishLine(std::format(">>> {}", event.text)); break;
        case FeedbackKind::Error:
            _impl->finishLine(std::format("\u2717 {}: {}", errorCodeName(event.error), event.text));
            break;
        case FeedbackKind::Warning:
            // Non-terminal: print above the still-running status line
            std::print(_impl->out, "{}\u26A0 {}: {}\n", ClearLine, errorCodeName(event.error), event.text);
            _impl->redraw();
            break;
    }
}

void ConsoleFeedback::printLog(log::Level level, std::string_view message)
{
    auto lock = std::lock_guard(_impl->mutex);
    if (_impl->mode != LineMode::Hidden)
    {
        std::print(_impl->out, "{}", ClearLine);
        std::fflush(_impl->out);
    }
    std::println(stderr, "{}", log::formatLine(level, message));
    _impl->redraw();
}

} // namespace pushscribe
