// SPDX-License-Identifier: Apache-2.0

#include "MicrophoneCapture.hpp"

#include <audio/SilenceTrimmer.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <span>
#include <string>

namespace pushscribe
{

struct MicrophoneCapture::Impl
{
    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool initialized = false;

    std::atomic<bool> capturing { false };
    std::atomic<float> amplitude { 0.0f };

    std::mutex bufferMutex;
    AudioBuffer buffer;

    void append(std::span<const float> samples)
    {
        // Level of the most recent frame only, for the live meter
        auto const perFrame = static_cast<std::size_t>(CaptureSampleRate) * FrameDuration.count() / 1000;
        auto const tail = samples.size() > perFrame ? samples.subspan(samples.size() - perFrame) : samples;
        amplitude.store(rmsAmplitude(tail), std::memory_order_relaxed);

        auto lock = std::lock_guard(bufferMutex);
        buffer.samples.insert(buffer.samples.end(), samples.begin(), samples.end());
    }
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MicrophoneCapture::Impl*>(device->pUserData);
        if (impl && input && impl->capturing.load(std::memory_order_acquire))
            impl->append(std::span<const float>(static_cast<const float*>(input), frameCount));
    }

} // namespace

MicrophoneCapture::MicrophoneCapture(): _impl(std::make_unique<Impl>())
{
}

MicrophoneCapture::~MicrophoneCapture()
{
    if (_impl->capturing)
        ma_device_stop(&_impl->device);
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto MicrophoneCapture::initialize(std::string_view deviceName) -> VoidResult
{
    // Persistent context, must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        if (captureCount == 0)
            return makeError(ErrorCode::DeviceUnavailable, "No audio capture device found");

        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, pCaptureDevices[i].name);

        if (!deviceName.empty())
        {
            auto const lowerTarget = toLower(deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (toLower(pCaptureDevices[i].name).find(lowerTarget) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", pCaptureDevices[i].name, deviceName);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }

            if (!matchedDeviceId)
                log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        // Monitors are loopback sources, not microphones
        if (!matchedDeviceId)
        {
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!toLower(pCaptureDevices[i].name).starts_with("monitor"))
                {
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }
        }
    }
    else
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default", static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = CaptureSampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();

    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    log::info("Audio capture device: {} (16kHz, mono, float32)", _impl->device.capture.name);
    return {};
}

auto MicrophoneCapture::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::DeviceUnavailable, "Audio device not initialized");

    if (_impl->capturing)
        return makeError(ErrorCode::DeviceUnavailable, "Audio capture session already active");

    {
        auto lock = std::lock_guard(_impl->bufferMutex);
        _impl->buffer = AudioBuffer {};
    }
    _impl->amplitude.store(0.0f, std::memory_order_relaxed);
    _impl->capturing.store(true, std::memory_order_release);

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->capturing.store(false, std::memory_order_release);
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));
    }

    log::debug("Audio capture started");
    return {};
}

auto MicrophoneCapture::stop() -> AudioBuffer
{
    if (!_impl->capturing)
    {
        log::warning("Audio capture stop() without an active session");
        return AudioBuffer {};
    }

    // ma_device_stop() waits for the data callback to return, so no append races the move below
    ma_device_stop(&_impl->device);
    _impl->capturing.store(false, std::memory_order_release);
    _impl->amplitude.store(0.0f, std::memory_order_relaxed);

    auto frozen = AudioBuffer {};
    {
        auto lock = std::lock_guard(_impl->bufferMutex);
        frozen = std::move(_impl->buffer);
        _impl->buffer = AudioBuffer {};
    }

    log::debug("Audio capture stopped ({} samples, {} ms)", frozen.samples.size(), frozen.duration().count());
    return frozen;
}

auto MicrophoneCapture::isCapturing() const -> bool
{
    return _impl->capturing.load(std::memory_order_acquire);
}

auto MicrophoneCapture::currentAmplitude() const -> float
{
    return _impl->amplitude.load(std::memory_order_relaxed);
}

} // namespace pushscribe
