// SPDX-License-Identifier: Apache-2.0
#include "RetryingTranscriptionService.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace pushscribe
{

auto retryDelay(const RetryConfig& config, int retry) -> std::chrono::milliseconds
{
    auto delay = static_cast<double>(config.initialDelay.count());
    for (auto i = 1; i < retry; ++i)
    {
        delay *= config.backoffMultiplier;
        if (delay >= static_cast<double>(config.maxDelay.count()))
            break;
    }
    auto const capped = std::min(delay, static_cast<double>(config.maxDelay.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(capped));
}

RetryingTranscriptionService::RetryingTranscriptionService(TranscriptionService& inner, RetryConfig config):
    _inner(inner), _config(config)
{
}

auto RetryingTranscriptionService::transcribe(const TranscriptRequest& request, std::stop_token stopToken)
    -> Result<std::string>
{
    auto result = _inner.transcribe(TranscriptRequest(request), stopToken);

    for (auto retry = 1; retry <= _config.maxRetries; ++retry)
    {
        if (result || result.error().code != ErrorCode::NetworkError)
            return result;

        auto const delay = retryDelay(_config, retry);
        log::warning("Transcription failed ({}), retry {}/{} in {} ms",
                     result.error().message,
                     retry,
                     _config.maxRetries,
                     delay.count());

        auto mutex = std::mutex {};
        auto cv = std::condition_variable_any {};
        auto lock = std::unique_lock(mutex);
        cv.wait_for(lock, stopToken, delay, [] { return false; });
        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "Transcription cancelled");

        result = _inner.transcribe(TranscriptRequest(request), stopToken);
    }

    return result;
}

} // namespace pushscribe
