// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <remote/Credentials.hpp>
#include <remote/HttpTransport.hpp>
#include <remote/TranscriptionService.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace pushscribe
{

struct GoogleSpeechConfig
{
    std::string endpoint = "https://speech.googleapis.com";
    std::string model = "latest_short";
    std::chrono::milliseconds requestTimeout { 0 };
};

/// @brief Builds the JSON body of a Speech-to-Text v1 "speech:recognize" call.
[[nodiscard]] auto buildRecognizeRequest(const TranscriptRequest& request, std::string_view model)
    -> nlohmann::json;

/// @brief Extracts the transcript from a "speech:recognize" response body.
///
/// The transcript is the first alternative of each result joined by single
/// spaces. A response without results yields an empty string.
/// @return The transcript, or NetworkError if the body is malformed.
[[nodiscard]] auto parseRecognizeResponse(std::string_view body) -> Result<std::string>;

/// @brief TranscriptionService backed by Google Cloud Speech-to-Text v1 REST.
class GoogleSpeechTranscriber: public TranscriptionService
{
  public:
    GoogleSpeechTranscriber(HttpTransport& transport, Credentials credentials, GoogleSpeechConfig config);

    [[nodiscard]] auto transcribe(const TranscriptRequest& request, std::stop_token stopToken)
        -> Result<std::string> override;

  private:
    HttpTransport& _transport;
    Credentials _credentials;
    GoogleSpeechConfig _config;
};

} // namespace pushscribe
