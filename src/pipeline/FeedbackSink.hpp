// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/PipelineState.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace pushscribe
{

enum class FeedbackKind : std::uint8_t
{
    RecordingStarted,
    NoSpeechDetected,
    TranscribingStarted,
    PostProcessingStarted,
    Warning,
    Error,
    Cancelled,
    Done,
};

[[nodiscard]] constexpr auto feedbackKindName(FeedbackKind kind) -> std::string_view
{
    switch (kind)
    {
        case FeedbackKind::RecordingStarted: return "recording-started";
        case FeedbackKind::NoSpeechDetected: return "no-speech-detected";
        case FeedbackKind::TranscribingStarted: return "transcribing-started";
        case FeedbackKind::PostProcessingStarted: return "post-processing-started";
        case FeedbackKind::Warning: return "warning";
        case FeedbackKind::Error: return "error";
        case FeedbackKind::Cancelled: return "cancelled";
        case FeedbackKind::Done: return "done";
    }
    return "unknown";
}

/// @brief A state-transition notification.
struct FeedbackEvent
{
    FeedbackKind kind = FeedbackKind::RecordingStarted;
    RunId runId = 0;
    ErrorCode error = ErrorCode::Unknown; ///< Set for Warning and Error.
    std::string text;                     ///< Delivered text for Done, message for Warning and Error.

    /// @brief Returns true if this notification ends a run.
    [[nodiscard]] auto isTerminal() const noexcept -> bool
    {
        return kind == FeedbackKind::NoSpeechDetected || kind == FeedbackKind::Error
               || kind == FeedbackKind::Cancelled || kind == FeedbackKind::Done;
    }
};

/// @brief Observer of pipeline transitions. Must not call back into the pipeline.
class FeedbackSink
{
  public:
    virtual ~FeedbackSink() = default;

    virtual void notify(const FeedbackEvent& event) = 0;
};

/// @brief FeedbackSink forwarding to a callable.
class CallbackFeedback: public FeedbackSink
{
  public:
    using Callback = std::function<void(const FeedbackEvent& event)>;

    explicit CallbackFeedback(Callback callback): _callback(std::move(callback)) {}

    void notify(const FeedbackEvent& event) override
    {
        if (_callback)
            _callback(event);
    }

  private:
    Callback _callback;
};

} // namespace pushscribe
