// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <input/HotkeyCombo.hpp>
#include <pipeline/PipelineState.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace pushscribe
{

/// @brief Stage guarded by a deadline.
enum class PipelineStage : std::uint8_t
{
    Transcription,
    PostProcessing,
};

/// @brief Completion of a transcription call started by run @c runId.
struct TranscriptionFinished
{
    RunId runId = 0;
    Result<std::string> result;
};

/// @brief Completion of a post-processing call started by run @c runId.
struct RewriteFinished
{
    RunId runId = 0;
    Result<std::string> result;
};

/// @brief Delivery of run @c runId's final text has finished.
struct DeliveryFinished
{
    RunId runId = 0;
    std::string text;
    VoidResult result;
};

/// @brief A stage deadline of run @c runId has passed.
struct DeadlineExpired
{
    RunId runId = 0;
    PipelineStage stage = PipelineStage::Transcription;
};

/// @brief New settings that apply from the next run on.
struct SettingsChanged
{
    PipelineSettings settings;
};

/// @brief Everything the pipeline controller reacts to.
using PipelineEvent =
    std::variant<HotkeyEvent, TranscriptionFinished, RewriteFinished, DeliveryFinished, DeadlineExpired, SettingsChanged>;

/// @brief Delivers events to the controller's thread.
class Scheduler
{
  public:
    virtual ~Scheduler() = default;

    /// @brief Enqueues an event. Safe to call from any thread.
    virtual void post(PipelineEvent event) = 0;

    /// @brief Enqueues an event once @p delay has elapsed. Safe to call from any thread.
    virtual void postAfter(std::chrono::milliseconds delay, PipelineEvent event) = 0;
};

/// @brief Runs blocking work off the controller's thread.
class TaskExecutor
{
  public:
    virtual ~TaskExecutor() = default;

    virtual void execute(std::function<void()> task) = 0;
};

} // namespace pushscribe
