// SPDX-License-Identifier: Apache-2.0
#include "GeminiPostProcessor.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <format>

namespace pushscribe
{

auto buildRewritePrompt(std::string_view text, const PostProcessInstruction& instruction) -> std::string
{
    return std::format("{}\n\nTranscript:\n{}\n\nRespond ONLY with the processed text, nothing else.",
                       trim(instruction.prompt),
                       text);
}

auto buildGenerateRequest(std::string_view text, const PostProcessInstruction& instruction) -> nlohmann::json
{
    auto part = nlohmann::json { { "text", buildRewritePrompt(text, instruction) } };
    auto turn = nlohmann::json { { "role", "user" }, { "parts", nlohmann::json::array({ std::move(part) }) } };
    return nlohmann::json { { "contents", nlohmann::json::array({ std::move(turn) }) } };
}

auto parseGenerateResponse(std::string_view body) -> Result<std::string>
{
    auto parsed = json::parse(body, "Gemini response");
    if (!parsed)
        return makeError(ErrorCode::NetworkError, parsed.error().message);
    if (!parsed->is_object())
        return makeError(ErrorCode::NetworkError, "Gemini response is not a JSON object");

    auto const* candidates = json::findArray(*parsed, "candidates");
    if (!candidates || candidates->empty())
        return std::string {};

    auto const* content = json::findObject(candidates->front(), "content");
    if (!content)
        return std::string {};
    auto const* parts = json::findArray(*content, "parts");
    if (!parts)
        return std::string {};

    auto text = std::string {};
    for (auto const& part: *parts)
        text += json::getStringOr(part, "text", "");
    return std::string(trim(text));
}

GeminiPostProcessor::GeminiPostProcessor(HttpTransport& transport, Credentials credentials, GeminiConfig config):
    _transport(transport), _credentials(std::move(credentials)), _config(std::move(config))
{
}

auto GeminiPostProcessor::doRewrite(const std::string& text,
                                    const PostProcessInstruction& instruction,
                                    std::stop_token stopToken) -> Result<std::string>
{
    auto request = HttpRequest {
        .url = std::format("{}/v1beta/models/{}:generateContent", _config.endpoint, _config.model),
        .headers = {},
        .body = buildGenerateRequest(text, instruction).dump(),
        .timeout = _config.requestTimeout,
    };
    if (auto applied = _credentials.apply(request); !applied)
        return std::unexpected(applied.error());

    log::debug("Post-processing {} characters with {}", text.size(), _config.model);

    auto response = _transport.post(request, stopToken);
    if (!response)
        return std::unexpected(response.error());
    if (auto status = checkStatus(*response, "Gemini"); !status)
        return std::unexpected(status.error());

    return parseGenerateResponse(response->body);
}

} // namespace pushscribe
