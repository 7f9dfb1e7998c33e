// SPDX-License-Identifier: Apache-2.0
#include "SilenceTrimmer.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>

namespace pushscribe
{

auto rmsAmplitude(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto energy = 0.0;
    for (auto const sample: samples)
        energy += static_cast<double>(sample) * static_cast<double>(sample);

    return static_cast<float>(std::sqrt(energy / static_cast<double>(samples.size())));
}

auto amplitudeToDb(float amplitude) -> float
{
    if (amplitude <= 0.0f)
        return SilenceFloorDb;
    return std::max(SilenceFloorDb, 20.0f * std::log10(amplitude));
}

auto frameLevelDb(const AudioBuffer& buffer, std::size_t index) -> float
{
    auto const perFrame = buffer.samplesPerFrame();
    auto const begin = index * perFrame;
    auto const end = std::min(buffer.samples.size(), begin + perFrame);
    return amplitudeToDb(rmsAmplitude(std::span(buffer.samples).subspan(begin, end - begin)));
}

auto trimSilence(const AudioBuffer& buffer, float thresholdDb, std::chrono::milliseconds minSilence)
    -> AudioBuffer
{
    auto const frames = buffer.frameCount();
    auto const isSilent = [&](std::size_t i) { return frameLevelDb(buffer, i) < thresholdDb; };

    auto firstLoud = std::size_t { 0 };
    while (firstLoud < frames && isSilent(firstLoud))
        ++firstLoud;

    if (firstLoud == frames)
    {
        log::debug("Trim: all {} frames below {:.1f} dB", frames, thresholdDb);
        return AudioBuffer { .samples = {}, .sampleRate = buffer.sampleRate };
    }

    auto lastLoud = frames - 1;
    while (lastLoud > firstLoud && isSilent(lastLoud))
        --lastLoud;

    auto const perFrame = buffer.samplesPerFrame();
    auto const minSilenceSamples =
        static_cast<std::size_t>(minSilence.count()) * static_cast<std::size_t>(buffer.sampleRate) / 1000;

    auto begin = firstLoud * perFrame;
    if (begin < minSilenceSamples)
        begin = 0;

    auto end = std::min(buffer.samples.size(), (lastLoud + 1) * perFrame);
    if (buffer.samples.size() - end < minSilenceSamples)
        end = buffer.samples.size();

    log::debug("Trim: kept samples [{}, {}) of {}", begin, end, buffer.samples.size());

    return AudioBuffer {
        .samples = std::vector<float>(buffer.samples.begin() + static_cast<std::ptrdiff_t>(begin),
                                      buffer.samples.begin() + static_cast<std::ptrdiff_t>(end)),
        .sampleRate = buffer.sampleRate,
    };
}

} // namespace pushscribe
