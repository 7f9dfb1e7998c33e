// SPDX-License-Identifier: Apache-2.0
#include <remote/Credentials.hpp>
#include <remote/Encoding.hpp>
#include <remote/GeminiPostProcessor.hpp>
#include <remote/GoogleSpeechTranscriber.hpp>
#include <remote/HttpTransport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <vector>

using namespace pushscribe;

namespace
{

/// @brief Replays canned responses and records what was sent.
class FakeHttpTransport: public HttpTransport
{
  public:
    std::vector<HttpRequest> requests;
    Result<HttpResponse> response = HttpResponse { .status = 200, .body = "{}" };

    auto post(const HttpRequest& request, std::stop_token /*stopToken*/) -> Result<HttpResponse> override
    {
        requests.push_back(request);
        return response;
    }
};

auto lookupFrom(std::map<std::string, std::string> values) -> Credentials::Lookup
{
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        if (auto const it = values.find(std::string(name)); it != values.end())
            return it->second;
        return std::nullopt;
    };
}

auto apiKey(std::string key) -> Credentials
{
    return Credentials { .kind = Credentials::Kind::ApiKey, .secret = std::move(key), .project = {} };
}

auto shortUtterance() -> TranscriptRequest
{
    return TranscriptRequest {
        .audio = AudioBuffer { .samples = { 0.0f, 0.5f, -0.5f }, .sampleRate = 16000 },
        .language = Language::French,
    };
}

} // namespace

// {{{ Encoding

TEST_CASE("encodeBase64 pads according to RFC 4648", "[remote]")
{
    CHECK(encodeBase64("") == "");
    CHECK(encodeBase64("f") == "Zg==");
    CHECK(encodeBase64("fo") == "Zm8=");
    CHECK(encodeBase64("foo") == "Zm9v");
    CHECK(encodeBase64("foobar") == "Zm9vYmFy");
    CHECK(encodeBase64(std::string_view("\xff\x00\x10", 3)) == "/wAQ");
}

TEST_CASE("toPcm16 writes clamped little-endian samples", "[remote]")
{
    auto const samples = std::vector { 0.0f, 1.0f, -1.0f, 2.0f, 0.5f };
    auto const pcm = toPcm16(samples);

    REQUIRE(pcm.size() == samples.size() * 2);
    auto const sampleAt = [&](std::size_t i) {
        auto const lo = static_cast<unsigned char>(pcm[i * 2]);
        auto const hi = static_cast<unsigned char>(pcm[i * 2 + 1]);
        return static_cast<std::int16_t>(static_cast<std::uint16_t>(lo | (hi << 8)));
    };
    CHECK(sampleAt(0) == 0);
    CHECK(sampleAt(1) == 32767);
    CHECK(sampleAt(2) == -32767);
    CHECK(sampleAt(3) == 32767);
    CHECK(sampleAt(4) == 16384);
}

// }}}
// {{{ Credentials and status mapping

TEST_CASE("Credentials prefer the dedicated API key", "[remote]")
{
    auto const credentials = Credentials::resolve(lookupFrom({
        { "PUSHSCRIBE_API_KEY", " primary\n" },
        { "GOOGLE_API_KEY", "secondary" },
        { "GOOGLE_OAUTH_ACCESS_TOKEN", "token" },
    }));
    CHECK(credentials.kind == Credentials::Kind::ApiKey);
    CHECK(credentials.secret == "primary");
}

TEST_CASE("Credentials fall back to an access token with quota project", "[remote]")
{
    auto const credentials = Credentials::resolve(lookupFrom({
        { "GOOGLE_API_KEY", "   " },
        { "GOOGLE_OAUTH_ACCESS_TOKEN", "ya29.token" },
        { "GOOGLE_CLOUD_PROJECT", "my-project" },
    }));
    REQUIRE(credentials.kind == Credentials::Kind::AccessToken);

    auto request = HttpRequest { .url = "https://example.test/v1/x", .headers = {}, .body = {}, .timeout = {} };
    REQUIRE(credentials.apply(request));
    CHECK(request.url == "https://example.test/v1/x");
    CHECK(request.headers
          == std::vector<std::string> { "Authorization: Bearer ya29.token", "x-goog-user-project: my-project" });
}

TEST_CASE("API key is appended as query parameter", "[remote]")
{
    auto request = HttpRequest { .url = "https://example.test/a", .headers = {}, .body = {}, .timeout = {} };
    REQUIRE(apiKey("k1").apply(request));
    CHECK(request.url == "https://example.test/a?key=k1");

    auto withQuery = HttpRequest { .url = "https://example.test/a?alt=json", .headers = {}, .body = {}, .timeout = {} };
    REQUIRE(apiKey("k2").apply(withQuery));
    CHECK(withQuery.url == "https://example.test/a?alt=json&key=k2");
}

TEST_CASE("Missing credentials are an authentication error", "[remote]")
{
    auto const credentials = Credentials::resolve(lookupFrom({}));
    CHECK(credentials.empty());

    auto request = HttpRequest {};
    auto const result = credentials.apply(request);
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::AuthError);
}

TEST_CASE("checkStatus maps HTTP status codes to error kinds", "[remote]")
{
    CHECK(checkStatus(HttpResponse { .status = 200, .body = "" }, "svc"));
    CHECK(checkStatus(HttpResponse { .status = 204, .body = "" }, "svc"));

    auto const denied = checkStatus(HttpResponse { .status = 403, .body = "" }, "svc");
    REQUIRE(!denied);
    CHECK(denied.error().code == ErrorCode::AuthError);

    auto const unavailable =
        checkStatus(HttpResponse { .status = 503, .body = R"({"error":{"message":"Backend busy"}})" }, "svc");
    REQUIRE(!unavailable);
    CHECK(unavailable.error().code == ErrorCode::NetworkError);
    CHECK(unavailable.error().message == "svc returned HTTP 503: Backend busy");
}

// }}}
// {{{ Speech-to-text

TEST_CASE("Recognize request carries audio format and language", "[remote]")
{
    auto const body = buildRecognizeRequest(shortUtterance(), "latest_short");

    auto const& config = body.at("config");
    CHECK(config.at("encoding") == "LINEAR16");
    CHECK(config.at("sampleRateHertz") == 16000);
    CHECK(config.at("audioChannelCount") == 1);
    CHECK(config.at("languageCode") == "fr-FR");
    CHECK(config.at("model") == "latest_short");
    CHECK(body.at("audio").at("content") == encodeBase64(toPcm16(shortUtterance().audio.samples)));

    CHECK(!buildRecognizeRequest(shortUtterance(), "").at("config").contains("model"));
}

TEST_CASE("Recognize response joins the top alternative of each result", "[remote]")
{
    auto const text = parseRecognizeResponse(R"({
        "results": [
            { "alternatives": [ { "transcript": "hello", "confidence": 0.9 }, { "transcript": "yellow" } ] },
            { "alternatives": [ { "transcript": "world " } ] }
        ]
    })");
    REQUIRE(text);
    CHECK(*text == "hello world");

    auto const empty = parseRecognizeResponse("{}");
    REQUIRE(empty);
    CHECK(empty->empty());

    auto const broken = parseRecognizeResponse("<html>");
    REQUIRE(!broken);
    CHECK(broken.error().code == ErrorCode::NetworkError);
}

TEST_CASE("GoogleSpeechTranscriber posts to the recognize endpoint", "[remote]")
{
    auto transport = FakeHttpTransport {};
    transport.response =
        HttpResponse { .status = 200, .body = R"({"results":[{"alternatives":[{"transcript":"bonjour"}]}]})" };
    auto transcriber = GoogleSpeechTranscriber(transport, apiKey("secret"), GoogleSpeechConfig {});

    auto const text = transcriber.transcribe(shortUtterance(), {});

    REQUIRE(text);
    CHECK(*text == "bonjour");
    REQUIRE(transport.requests.size() == 1);
    CHECK(transport.requests[0].url == "https://speech.googleapis.com/v1/speech:recognize?key=secret");
}

TEST_CASE("GoogleSpeechTranscriber reports transport and status failures", "[remote]")
{
    auto transport = FakeHttpTransport {};
    auto transcriber = GoogleSpeechTranscriber(transport, apiKey("secret"), GoogleSpeechConfig {});

    transport.response = HttpResponse { .status = 401, .body = "" };
    auto const unauthorized = transcriber.transcribe(shortUtterance(), {});
    REQUIRE(!unauthorized);
    CHECK(unauthorized.error().code == ErrorCode::AuthError);

    transport.response = makeError(ErrorCode::NetworkError, "Could not resolve host");
    auto const offline = transcriber.transcribe(shortUtterance(), {});
    REQUIRE(!offline);
    CHECK(offline.error().code == ErrorCode::NetworkError);
}

TEST_CASE("GoogleSpeechTranscriber without credentials makes no request", "[remote]")
{
    auto transport = FakeHttpTransport {};
    auto transcriber = GoogleSpeechTranscriber(transport, Credentials {}, GoogleSpeechConfig {});

    auto const result = transcriber.transcribe(shortUtterance(), {});

    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::AuthError);
    CHECK(transport.requests.empty());
}

// }}}
// {{{ Post-processing

TEST_CASE("Rewrite prompt wraps the transcript with the instruction", "[remote]")
{
    auto const prompt =
        buildRewritePrompt("hello world", PostProcessInstruction { .prompt = "  translate to French\n" });
    CHECK(prompt
          == "translate to French\n\nTranscript:\nhello world\n\nRespond ONLY with the processed text, nothing else.");

    auto const request = buildGenerateRequest("hi", PostProcessInstruction { .prompt = "shout" });
    CHECK(request.at("contents").at(0).at("role") == "user");
    CHECK(request.at("contents").at(0).at("parts").at(0).at("text") == buildRewritePrompt("hi", { .prompt = "shout" }));
}

TEST_CASE("Generate response concatenates the first candidate's parts", "[remote]")
{
    auto const text = parseGenerateResponse(R"({
        "candidates": [
            { "content": { "role": "model", "parts": [ { "text": "Bonjour " }, { "text": "le monde\n" } ] } },
            { "content": { "parts": [ { "text": "ignored" } ] } }
        ]
    })");
    REQUIRE(text);
    CHECK(*text == "Bonjour le monde");

    auto const blocked = parseGenerateResponse(R"({"promptFeedback":{"blockReason":"SAFETY"}})");
    REQUIRE(blocked);
    CHECK(blocked->empty());
}

TEST_CASE("GeminiPostProcessor calls the service only for a non-empty instruction", "[remote]")
{
    auto transport = FakeHttpTransport {};
    transport.response =
        HttpResponse { .status = 200, .body = R"({"candidates":[{"content":{"parts":[{"text":"Bonjour"}]}}]})" };
    auto processor = GeminiPostProcessor(transport, apiKey("k"), GeminiConfig {});

    auto const unchanged = processor.rewrite("hello", PostProcessInstruction { .prompt = " \t" }, {});
    REQUIRE(unchanged);
    CHECK(*unchanged == "hello");
    CHECK(transport.requests.empty());

    auto const rewritten = processor.rewrite("hello", PostProcessInstruction { .prompt = "translate to French" }, {});
    REQUIRE(rewritten);
    CHECK(*rewritten == "Bonjour");
    REQUIRE(transport.requests.size() == 1);
    CHECK(transport.requests[0].url
          == "https://generativelanguage.googleapis.com/v1beta/models/gemini-2.0-flash:generateContent?key=k");
}

TEST_CASE("Empty rewrite keeps the original transcript", "[remote]")
{
    auto transport = FakeHttpTransport {};
    transport.response = HttpResponse { .status = 200, .body = R"({"candidates":[]})" };
    auto processor = GeminiPostProcessor(transport, apiKey("k"), GeminiConfig {});

    auto const result = processor.rewrite("hello", PostProcessInstruction { .prompt = "summarize" }, {});
    REQUIRE(result);
    CHECK(*result == "hello");
    CHECK(transport.requests.size() == 1);
}

TEST_CASE("GeminiPostProcessor propagates service errors", "[remote]")
{
    auto transport = FakeHttpTransport {};
    transport.response = HttpResponse { .status = 500, .body = "" };
    auto processor = GeminiPostProcessor(transport, apiKey("k"), GeminiConfig {});

    auto const result = processor.rewrite("hello", PostProcessInstruction { .prompt = "summarize" }, {});
    REQUIRE(!result);
    CHECK(result.error().code == ErrorCode::NetworkError);
}

// }}}
