// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <stop_token>
#include <string>

namespace pushscribe
{

/// @brief One utterance to transcribe. Consumed by a single attempt.
struct TranscriptRequest
{
    AudioBuffer audio;
    Language language = Language::EnglishUS;
};

/// @brief Abstract speech-to-text service.
class TranscriptionService
{
  public:
    virtual ~TranscriptionService() = default;

    /// @brief Transcribes the request, blocking the calling thread.
    /// @param request The audio and its language.
    /// @param stopToken Signalled when the caller no longer wants the result.
    /// @return The transcript (possibly empty when no speech was recognized),
    ///         or NetworkError, AuthError or Cancelled.
    [[nodiscard]] virtual auto transcribe(const TranscriptRequest& request, std::stop_token stopToken)
        -> Result<std::string> = 0;
};

} // namespace pushscribe
