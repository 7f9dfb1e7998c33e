// SPDX-License-Identifier: Apache-2.0
#include "GoogleSpeechTranscriber.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <remote/Encoding.hpp>

#include <format>

namespace pushscribe
{

auto buildRecognizeRequest(const TranscriptRequest& request, std::string_view model) -> nlohmann::json
{
    auto config = nlohmann::json {
        { "encoding", "LINEAR16" },
        { "sampleRateHertz", request.audio.sampleRate },
        { "audioChannelCount", 1 },
        { "languageCode", std::string(languageCode(request.language)) },
        { "enableAutomaticPunctuation", true },
    };
    if (!model.empty())
        config["model"] = std::string(model);

    return nlohmann::json {
        { "config", std::move(config) },
        { "audio", { { "content", encodeBase64(toPcm16(request.audio.samples)) } } },
    };
}

auto parseRecognizeResponse(std::string_view body) -> Result<std::string>
{
    auto parsed = json::parse(body, "Speech response");
    if (!parsed)
        return makeError(ErrorCode::NetworkError, parsed.error().message);
    if (!parsed->is_object())
        return makeError(ErrorCode::NetworkError, "Speech response is not a JSON object");

    auto const* results = json::findArray(*parsed, "results");
    if (!results)
        return std::string {};

    auto transcript = std::string {};
    for (auto const& result: *results)
    {
        auto const* alternatives = json::findArray(result, "alternatives");
        if (!alternatives || alternatives->empty())
            continue;
        auto const text = json::getStringOr(alternatives->front(), "transcript", "");
        if (text.empty())
            continue;
        if (!transcript.empty())
            transcript += ' ';
        transcript += text;
    }

    return std::string(trim(transcript));
}

GoogleSpeechTranscriber::GoogleSpeechTranscriber(HttpTransport& transport,
                                                 Credentials credentials,
                                                 GoogleSpeechConfig config):
    _transport(transport), _credentials(std::move(credentials)), _config(std::move(config))
{
}

auto GoogleSpeechTranscriber::transcribe(const TranscriptRequest& request, std::stop_token stopToken)
    -> Result<std::string>
{
    auto httpRequest = HttpRequest {
        .url = std::format("{}/v1/speech:recognize", _config.endpoint),
        .headers = {},
        .body = buildRecognizeRequest(request, _config.model).dump(),
        .timeout = _config.requestTimeout,
    };
    if (auto applied = _credentials.apply(httpRequest); !applied)
        return std::unexpected(applied.error());

    log::debug("Transcribing {} ms of audio ({})", request.audio.duration().count(), languageCode(request.language));

    auto response = _transport.post(httpRequest, stopToken);
    if (!response)
        return std::unexpected(response.error());
    if (auto status = checkStatus(*response, "Speech service"); !status)
        return std::unexpected(status.error());

    return parseRecognizeResponse(response->body);
}

} // namespace pushscribe
