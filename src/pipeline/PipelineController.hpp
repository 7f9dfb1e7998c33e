// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioCapture.hpp>
#include <output/OutputInjector.hpp>
#include <pipeline/FeedbackSink.hpp>
#include <pipeline/PipelineEvent.hpp>
#include <remote/PostProcessor.hpp>
#include <remote/TranscriptionService.hpp>

#include <atomic>
#include <optional>
#include <stop_token>
#include <string>

namespace pushscribe
{

/// @brief The push-to-talk state machine.
///
/// Sequences one run at a time: Recording, Trimming, Transcribing, the optional
/// PostProcessing and Injecting, then back to Idle. Remote calls and the
/// delivery of the final text run on the TaskExecutor and report back through the Scheduler as events tagged with
/// their run id; a completion for any run other than the current one, or for a
/// stage the run has already left, is dropped without side effects.
///
/// handle() must only be called from the scheduler's thread. state() and
/// currentRunId() may be read from any thread.
class PipelineController
{
  public:
    PipelineController(AudioCapture& capture,
                       TranscriptionService& transcriber,
                       PostProcessor& postProcessor,
                       OutputInjector& injector,
                       FeedbackSink& feedback,
                       Scheduler& scheduler,
                       TaskExecutor& executor,
                       PipelineSettings settings);

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    /// @brief Processes one event.
    void handle(PipelineEvent event);

    /// @brief Signals the active run's cancel token and discards any capture, without feedback.
    ///
    /// Used at shutdown, after the scheduler's thread has stopped.
    void abandonActiveRun();

    [[nodiscard]] auto state() const noexcept -> PipelineState { return _state.load(std::memory_order_acquire); }
    [[nodiscard]] auto currentRunId() const noexcept -> RunId { return _currentRunId.load(std::memory_order_acquire); }
    [[nodiscard]] auto settings() const noexcept -> const PipelineSettings& { return _settings; }

  private:
    struct Run
    {
        RunId id = 0;
        std::stop_source cancel;
        std::string rawTranscript;
        PipelineSettings settings;
    };

    void onHotkey(const HotkeyEvent& event);
    void onPress();
    void onRelease();
    void onCancel();
    void onTranscriptionFinished(TranscriptionFinished& event);
    void onRewriteFinished(RewriteFinished& event);
    void onDeliveryFinished(DeliveryFinished& event);
    void onDeadlineExpired(const DeadlineExpired& event);

    [[nodiscard]] auto isCurrent(RunId runId, PipelineState expected) const -> bool;

    void startRun();
    void startTranscription(AudioBuffer audio);
    void startPostProcessing();
    void inject(std::string text);
    void stopRun(bool discardCapture);
    void finishRun();

    void setState(PipelineState state);
    void notify(FeedbackKind kind, ErrorCode error = ErrorCode::Unknown, std::string text = {});

    AudioCapture& _capture;
    TranscriptionService& _transcriber;
    PostProcessor& _postProcessor;
    OutputInjector& _injector;
    FeedbackSink& _feedback;
    Scheduler& _scheduler;
    TaskExecutor& _executor;
    PipelineSettings _settings;

    std::optional<Run> _run;
    RunId _lastRunId = 0;
    std::atomic<PipelineState> _state { PipelineState::Idle };
    std::atomic<RunId> _currentRunId { 0 };
};

} // namespace pushscribe
