// SPDX-License-Identifier: Apache-2.0
#include <audio/SilenceTrimmer.hpp>
#include <pushscribe/ConsoleFeedback.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <numbers>
#include <string_view>

using namespace pushscribe;

using namespace std::chrono_literals;

namespace
{

auto silence(int ms) -> std::vector<float>
{
    return std::vector<float>(static_cast<std::size_t>(ms) * CaptureSampleRate / 1000, 0.0f);
}

auto tone(int ms, float amplitude) -> std::vector<float>
{
    auto samples = std::vector<float>(static_cast<std::size_t>(ms) * CaptureSampleRate / 1000);
    for (auto i = std::size_t { 0 }; i < samples.size(); ++i)
        samples[i] = amplitude
                     * static_cast<float>(std::sin(2.0 * std::numbers::pi * 300.0 * static_cast<double>(i)
                                                   / static_cast<double>(CaptureSampleRate)));
    return samples;
}

auto concat(std::initializer_list<std::vector<float>> parts) -> AudioBuffer
{
    auto buffer = AudioBuffer {};
    for (auto const& part: parts)
        buffer.samples.insert(buffer.samples.end(), part.begin(), part.end());
    return buffer;
}

auto countOf(std::string_view text, std::string_view needle) -> std::size_t
{
    auto count = std::size_t { 0 };
    for (auto pos = text.find(needle); pos != std::string_view::npos; pos = text.find(needle, pos + needle.size()))
        ++count;
    return count;
}

} // namespace

// {{{ Levels

TEST_CASE("amplitudeToDb converts linear amplitude to dBFS", "[audio]")
{
    CHECK(amplitudeToDb(1.0f) == 0.0f);
    CHECK(std::abs(amplitudeToDb(0.1f) - -20.0f) < 0.01f);
    CHECK(amplitudeToDb(0.0f) == SilenceFloorDb);
    CHECK(amplitudeToDb(1e-9f) == SilenceFloorDb);
}

TEST_CASE("rmsAmplitude of a sine is its peak over sqrt(2)", "[audio]")
{
    auto const samples = tone(100, 0.5f);
    CHECK(std::abs(rmsAmplitude(samples) - 0.5f / std::numbers::sqrt2_v<float>) < 0.01f);
    CHECK(rmsAmplitude({}) == 0.0f);
}

// }}}
// {{{ Trimming

TEST_CASE("trimSilence removes long leading and trailing silence", "[audio][trim]")
{
    auto const buffer = concat({ silence(600), tone(400, 0.3f), silence(800) });

    auto const trimmed = trimSilence(buffer, -50.0f, 300ms);

    CHECK(trimmed.sampleRate == buffer.sampleRate);
    CHECK(trimmed.duration() == 400ms);
    CHECK(std::abs(trimmed.samples.front()) < 0.3f);
    CHECK(rmsAmplitude(trimmed.samples) > 0.2f);
}

TEST_CASE("trimSilence keeps silent edges shorter than the minimum", "[audio][trim]")
{
    auto const buffer = concat({ silence(200), tone(400, 0.3f), silence(250) });

    auto const trimmed = trimSilence(buffer, -50.0f, 300ms);

    CHECK(trimmed == buffer);
}

TEST_CASE("trimSilence keeps pauses inside speech", "[audio][trim]")
{
    auto const buffer = concat({ silence(500), tone(200, 0.3f), silence(1000), tone(200, 0.3f), silence(500) });

    auto const trimmed = trimSilence(buffer, -50.0f, 300ms);

    CHECK(trimmed.duration() == 1400ms);
}

TEST_CASE("Entirely silent audio trims to empty", "[audio][trim]")
{
    CHECK(trimSilence(concat({ silence(1000) }), -50.0f, 300ms).empty());
    CHECK(trimSilence(concat({ tone(1000, 0.001f) }), -50.0f, 300ms).empty());
    CHECK(trimSilence(AudioBuffer {}, -50.0f, 300ms).empty());
}

TEST_CASE("Quiet speech above the threshold is kept", "[audio][trim]")
{
    // 0.01 peak is about -43 dBFS RMS
    auto const buffer = concat({ silence(400), tone(300, 0.01f), silence(400) });

    CHECK(trimSilence(buffer, -50.0f, 300ms).duration() == 300ms);
    CHECK(trimSilence(buffer, -30.0f, 300ms).empty());
}

TEST_CASE("trimSilence is idempotent", "[audio][trim]")
{
    auto const buffers = std::vector {
        concat({ silence(600), tone(400, 0.3f), silence(800) }),
        concat({ silence(205), tone(333, 0.2f), silence(517) }),
        concat({ tone(250, 0.2f), silence(1000) }),
        concat({ silence(1000) }),
    };

    for (auto const& buffer: buffers)
    {
        auto const once = trimSilence(buffer, -50.0f, 300ms);
        auto const twice = trimSilence(once, -50.0f, 300ms);
        CHECK(once == twice);
    }
}

// }}}
// {{{ Level meter

TEST_CASE("Level meter spans -80 dBFS to full scale", "[audio][meter]")
{
    constexpr auto Filled = std::string_view { "\u25AE" };
    constexpr auto Empty = std::string_view { "\u25AF" };

    auto const full = renderLevelMeter(1.0f);
    CHECK(countOf(full, Filled) == LevelMeterCapsules);
    CHECK(countOf(full, Empty) == 0);

    auto const silent = renderLevelMeter(0.0f);
    CHECK(countOf(silent, Filled) == 0);
    CHECK(countOf(silent, Empty) == LevelMeterCapsules);

    // -40 dBFS is the middle of the range
    auto const half = renderLevelMeter(0.01f);
    CHECK(countOf(half, Filled) == LevelMeterCapsules / 2);
    CHECK(countOf(renderLevelMeter(0.01f, 4), Filled) == 2);
}

// }}}
