// SPDX-License-Identifier: Apache-2.0
#include "PipelineController.hpp"

#include <audio/SilenceTrimmer.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <format>
#include <type_traits>

namespace pushscribe
{

PipelineController::PipelineController(AudioCapture& capture,
                                       TranscriptionService& transcriber,
                                       PostProcessor& postProcessor,
                                       OutputInjector& injector,
                                       FeedbackSink& feedback,
                                       Scheduler& scheduler,
                                       TaskExecutor& executor,
                                       PipelineSettings settings):
    _capture(capture),
    _transcriber(transcriber),
    _postProcessor(postProcessor),
    _injector(injector),
    _feedback(feedback),
    _scheduler(scheduler),
    _executor(executor),
    _settings(std::move(settings))
{
}

void PipelineController::handle(PipelineEvent event)
{
    std::visit(
        [this](auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, HotkeyEvent>)
                onHotkey(e);
            else if constexpr (std::is_same_v<T, TranscriptionFinished>)
                onTranscriptionFinished(e);
            else if constexpr (std::is_same_v<T, RewriteFinished>)
                onRewriteFinished(e);
            else if constexpr (std::is_same_v<T, DeliveryFinished>)
                onDeliveryFinished(e);
            else if constexpr (std::is_same_v<T, DeadlineExpired>)
                onDeadlineExpired(e);
            else if constexpr (std::is_same_v<T, SettingsChanged>)
            {
                _settings = std::move(e.settings);
                log::debug("Pipeline settings updated; effective from the next run");
            }
        },
        event);
}

void PipelineController::abandonActiveRun()
{
    if (!_run)
        return;
    stopRun(true);
    _run.reset();
    setState(PipelineState::Idle);
}

void PipelineController::onHotkey(const HotkeyEvent& event)
{
    switch (event.kind)
    {
        case HotkeyEvent::Kind::Press: onPress(); break;
        case HotkeyEvent::Kind::Release: onRelease(); break;
        case HotkeyEvent::Kind::Cancel: onCancel(); break;
    }
}

void PipelineController::onPress()
{
    if (_run)
    {
        // Superseded: its completions will fail the run-id check
        log::info("Run {} superseded while {}", _run->id, pipelineStateName(state()));
        stopRun(true);
        _run.reset();
        setState(PipelineState::Idle);
    }
    startRun();
}

void PipelineController::onRelease()
{
    if (state() != PipelineState::Recording || !_run)
    {
        log::trace("Release ignored while {}", pipelineStateName(state()));
        return;
    }

    setState(PipelineState::Trimming);
    auto const captured = _capture.stop();
    auto trimmed = trimSilence(captured, _run->settings.silenceThresholdDb, _run->settings.minSilence);
    log::debug("Run {}: captured {} ms, {} ms after trimming",
               _run->id,
               captured.duration().count(),
               trimmed.duration().count());

    if (trimmed.empty())
    {
        notify(FeedbackKind::NoSpeechDetected);
        finishRun();
        return;
    }

    startTranscription(std::move(trimmed));
}

void PipelineController::onCancel()
{
    auto const current = state();
    if (!_run
        || (current != PipelineState::Recording && current != PipelineState::Transcribing
            && current != PipelineState::PostProcessing))
    {
        log::trace("Cancel ignored while {}", pipelineStateName(current));
        return;
    }

    log::info("Run {} cancelled while {}", _run->id, pipelineStateName(current));
    stopRun(current == PipelineState::Recording);
    notify(FeedbackKind::Cancelled);
    finishRun();
}

void PipelineController::onTranscriptionFinished(TranscriptionFinished& event)
{
    if (!isCurrent(event.runId, PipelineState::Transcribing))
    {
        log::debug("Dropping stale transcription result of run {}", event.runId);
        return;
    }

    if (!event.result)
    {
        log::error("Transcription failed: {}", event.result.error());
        notify(FeedbackKind::Error, event.result.error().code, event.result.error().message);
        finishRun();
        return;
    }

    if (trim(*event.result).empty())
    {
        notify(FeedbackKind::NoSpeechDetected);
        finishRun();
        return;
    }

    _run->rawTranscript = std::move(*event.result);
    log::info("Transcript: {}", _run->rawTranscript);

    if (_run->settings.instruction.empty())
    {
        inject(_run->rawTranscript);
        return;
    }

    startPostProcessing();
}

void PipelineController::onRewriteFinished(RewriteFinished& event)
{
    if (!isCurrent(event.runId, PipelineState::PostProcessing))
    {
        log::debug("Dropping stale post-processing result of run {}", event.runId);
        return;
    }

    if (!event.result)
    {
        log::warning("Post-processing failed, using the raw transcript: {}", event.result.error());
        notify(FeedbackKind::Warning, event.result.error().code, event.result.error().message);
        inject(_run->rawTranscript);
        return;
    }

    inject(std::move(*event.result));
}

void PipelineController::onDeliveryFinished(DeliveryFinished& event)
{
    if (!isCurrent(event.runId, PipelineState::Injecting))
    {
        log::debug("Dropping stale delivery result of run {}", event.runId);
        return;
    }

    if (!event.result)
    {
        log::error("Delivering text failed: {}", event.result.error());
        notify(FeedbackKind::Error, ErrorCode::InjectionFailed, event.result.error().message);
    }
    else
    {
        notify(FeedbackKind::Done, ErrorCode::Unknown, std::move(event.text));
    }

    finishRun();
}

void PipelineController::onDeadlineExpired(const DeadlineExpired& event)
{
    auto const guarded =
        event.stage == PipelineStage::Transcription ? PipelineState::Transcribing : PipelineState::PostProcessing;
    if (!isCurrent(event.runId, guarded))
        return;

    stopRun(false);

    if (event.stage == PipelineStage::Transcription)
    {
        auto message = std::format("Transcription timed out after {} ms", _run->settings.transcriptionTimeout.count());
        log::error("{}", message);
        notify(FeedbackKind::Error, ErrorCode::NetworkError, std::move(message));
        finishRun();
        return;
    }

    auto message = std::format("Post-processing timed out after {} ms", _run->settings.postProcessingTimeout.count());
    log::warning("{}, using the raw transcript", message);
    notify(FeedbackKind::Warning, ErrorCode::NetworkError, std::move(message));
    inject(_run->rawTranscript);
}

auto PipelineController::isCurrent(RunId runId, PipelineState expected) const -> bool
{
    return _run && _run->id == runId && state() == expected;
}

void PipelineController::startRun()
{
    auto const id = ++_lastRunId;
    _currentRunId.store(id, std::memory_order_release);

    if (auto started = _capture.start(); !started)
    {
        log::error("Cannot start recording: {}", started.error());
        _feedback.notify(FeedbackEvent {
            .kind = FeedbackKind::Error,
            .runId = id,
            .error = ErrorCode::DeviceUnavailable,
            .text = started.error().message,
        });
        setState(PipelineState::Idle);
        return;
    }

    _run.emplace();
    _run->id = id;
    _run->settings = _settings;
    setState(PipelineState::Recording);
    notify(FeedbackKind::RecordingStarted);
}

void PipelineController::startTranscription(AudioBuffer audio)
{
    setState(PipelineState::Transcribing);
    notify(FeedbackKind::TranscribingStarted);

    auto const id = _run->id;
    auto request = TranscriptRequest { .audio = std::move(audio), .language = _run->settings.language };
    _executor.execute([&transcriber = _transcriber,
                       &scheduler = _scheduler,
                       request = std::move(request),
                       token = _run->cancel.get_token(),
                       id] {
        auto result = transcriber.transcribe(request, token);
        scheduler.post(TranscriptionFinished { .runId = id, .result = std::move(result) });
    });

    if (_run->settings.transcriptionTimeout.count() > 0)
        _scheduler.postAfter(_run->settings.transcriptionTimeout,
                             DeadlineExpired { .runId = id, .stage = PipelineStage::Transcription });
}

void PipelineController::startPostProcessing()
{
    setState(PipelineState::PostProcessing);
    notify(FeedbackKind::PostProcessingStarted);

    auto const id = _run->id;
    _executor.execute([&postProcessor = _postProcessor,
                       &scheduler = _scheduler,
                       text = _run->rawTranscript,
                       instruction = _run->settings.instruction,
                       token = _run->cancel.get_token(),
                       id] {
        auto result = postProcessor.rewrite(text, instruction, token);
        scheduler.post(RewriteFinished { .runId = id, .result = std::move(result) });
    });

    if (_run->settings.postProcessingTimeout.count() > 0)
        _scheduler.postAfter(_run->settings.postProcessingTimeout,
                             DeadlineExpired { .runId = id, .stage = PipelineStage::PostProcessing });
}

void PipelineController::inject(std::string text)
{
    setState(PipelineState::Injecting);

    // Delivery sleeps and spawns tools, so it never runs on the loop thread
    _executor.execute([&injector = _injector, &scheduler = _scheduler, text = std::move(text), id = _run->id]() mutable {
        auto result = injector.deliver(text);
        scheduler.post(DeliveryFinished { .runId = id, .text = std::move(text), .result = std::move(result) });
    });
}

void PipelineController::stopRun(bool discardCapture)
{
    _run->cancel.request_stop();
    if (discardCapture && _capture.isCapturing())
    {
        auto const discarded = _capture.stop();
        log::debug("Discarded {} ms of audio", discarded.duration().count());
    }
}

void PipelineController::finishRun()
{
    _run.reset();
    setState(PipelineState::Idle);
}

void PipelineController::setState(PipelineState state)
{
    auto const previous = _state.exchange(state, std::memory_order_acq_rel);
    if (previous != state)
        log::trace("Pipeline {} -> {}", pipelineStateName(previous), pipelineStateName(state));
}

void PipelineController::notify(FeedbackKind kind, ErrorCode error, std::string text)
{
    _feedback.notify(FeedbackEvent {
        .kind = kind,
        .runId = _run ? _run->id : _lastRunId,
        .error = error,
        .text = std::move(text),
    });
}

} // namespace pushscribe
