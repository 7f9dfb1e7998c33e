// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <remote/TranscriptionService.hpp>

#include <chrono>

namespace pushscribe
{

struct RetryConfig
{
    int maxRetries = 0; ///< Extra attempts after the first one.
    std::chrono::milliseconds initialDelay { 500 };
    std::chrono::milliseconds maxDelay { 8000 };
    double backoffMultiplier = 2.0;
};

/// @brief Returns the wait before retry number @p retry (1-based), exponentially growing and capped.
[[nodiscard]] auto retryDelay(const RetryConfig& config, int retry) -> std::chrono::milliseconds;

/// @brief Decorator that retries transient failures of another TranscriptionService.
///
/// Only NetworkError is retried. AuthError and Cancelled are returned at once.
/// Each attempt gets a fresh copy of the request. The backoff wait ends
/// immediately when the stop token is signalled.
class RetryingTranscriptionService: public TranscriptionService
{
  public:
    RetryingTranscriptionService(TranscriptionService& inner, RetryConfig config);

    [[nodiscard]] auto transcribe(const TranscriptRequest& request, std::stop_token stopToken)
        -> Result<std::string> override;

  private:
    TranscriptionService& _inner;
    RetryConfig _config;
};

} // namespace pushscribe
