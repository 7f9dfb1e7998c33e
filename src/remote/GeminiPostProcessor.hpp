// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <remote/Credentials.hpp>
#include <remote/HttpTransport.hpp>
#include <remote/PostProcessor.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace pushscribe
{

struct GeminiConfig
{
    std::string endpoint = "https://generativelanguage.googleapis.com";
    std::string model = "gemini-2.0-flash";
    std::chrono::milliseconds requestTimeout { 0 };
};

/// @brief Builds the single-turn prompt sent to the model.
[[nodiscard]] auto buildRewritePrompt(std::string_view text, const PostProcessInstruction& instruction)
    -> std::string;

/// @brief Builds the JSON body of a "generateContent" call.
[[nodiscard]] auto buildGenerateRequest(std::string_view text, const PostProcessInstruction& instruction)
    -> nlohmann::json;

/// @brief Extracts the concatenated text parts of the first candidate, trimmed.
/// @return The text (empty when there is no candidate), or NetworkError if the body is malformed.
[[nodiscard]] auto parseGenerateResponse(std::string_view body) -> Result<std::string>;

/// @brief PostProcessor backed by the Gemini "generateContent" REST API.
class GeminiPostProcessor: public PostProcessor
{
  public:
    GeminiPostProcessor(HttpTransport& transport, Credentials credentials, GeminiConfig config);

  protected:
    [[nodiscard]] auto doRewrite(const std::string& text,
                                 const PostProcessInstruction& instruction,
                                 std::stop_token stopToken) -> Result<std::string> override;

  private:
    HttpTransport& _transport;
    Credentials _credentials;
    GeminiConfig _config;
};

} // namespace pushscribe
