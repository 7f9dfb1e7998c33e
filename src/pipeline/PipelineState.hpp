// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <cstdint>
#include <string_view>

namespace pushscribe
{

/// @brief Identifier of one press-to-paste cycle. Strictly increasing, never 0.
using RunId = std::uint64_t;

enum class PipelineState : std::uint8_t
{
    Idle,
    Recording,
    Trimming,
    Transcribing,
    PostProcessing,
    Injecting,
};

[[nodiscard]] constexpr auto pipelineStateName(PipelineState state) -> std::string_view
{
    switch (state)
    {
        case PipelineState::Idle: return "idle";
        case PipelineState::Recording: return "recording";
        case PipelineState::Trimming: return "trimming";
        case PipelineState::Transcribing: return "transcribing";
        case PipelineState::PostProcessing: return "post-processing";
        case PipelineState::Injecting: return "injecting";
    }
    return "unknown";
}

/// @brief Settings that a run snapshots when it starts.
struct PipelineSettings
{
    float silenceThresholdDb = -50.0f;
    std::chrono::milliseconds minSilence { 300 };
    Language language = Language::EnglishUS;
    PostProcessInstruction instruction;
    std::chrono::milliseconds transcriptionTimeout { 0 };  ///< Zero disables the deadline.
    std::chrono::milliseconds postProcessingTimeout { 0 }; ///< Zero disables the deadline.
};

} // namespace pushscribe
