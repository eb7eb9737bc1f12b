// SPDX-License-Identifier: Apache-2.0

#include "MicrophoneVoiceSession.hpp"

#include <audio/CaptureBuffer.hpp>
#include <audio/WavFile.hpp>
#include <core/Log.hpp>
#include <pipeline/StagingArea.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <format>
#include <optional>
#include <string>

namespace voicescribe
{

struct MicrophoneVoiceSession::Impl
{
    MicrophoneConfig config;
    ActivityHandler activityHandler;
    VoiceActivityDetector vad;

    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool deviceInitialized = false;
    std::atomic<bool> connected = false;
    std::atomic<float> peakLevel { 0.0f };

    CaptureBuffer capture;
    std::filesystem::path directory;
    CaptureEncoding encoding = CaptureEncoding::Wav;
    std::uint64_t segmentCounter = 0;

    explicit Impl(MicrophoneConfig cfg): config(std::move(cfg)), vad(config.vad) {}

    void release()
    {
        if (deviceInitialized)
        {
            ma_device_uninit(&device);
            deviceInitialized = false;
        }
        if (contextInitialized)
        {
            ma_context_uninit(&context);
            contextInitialized = false;
        }
    }

    /// @brief Picks a capture device: the first whose name contains the configured filter,
    /// otherwise the first that is not a monitor (loopback) source.
    [[nodiscard]] auto selectDevice() -> std::optional<ma_device_id>
    {
        ma_device_info* captureDevices = nullptr;
        auto captureCount = ma_uint32 { 0 };
        auto const enumResult = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);
        if (enumResult != MA_SUCCESS)
        {
            log::warning("Failed to enumerate capture devices (code: {}), using default",
                         static_cast<int>(enumResult));
            return std::nullopt;
        }

        auto const lower = [](std::string s) {
            std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
            return s;
        };

        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  capture device [{}] {}", i, captureDevices[i].name);

        if (!config.deviceName.empty())
        {
            auto const target = lower(config.deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (lower(captureDevices[i].name).find(target) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", captureDevices[i].name, config.deviceName);
                    return captureDevices[i].id;
                }
            }
            log::warning("No capture device matching '{}' found, falling back to auto-select", config.deviceName);
        }

        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        {
            if (!lower(captureDevices[i].name).starts_with("monitor"))
                return captureDevices[i].id;
        }
        return std::nullopt;
    }
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MicrophoneVoiceSession::Impl*>(device->pUserData);
        if (!impl || !input)
            return;

        auto const samples = std::span<const float>(static_cast<const float*>(input), frameCount);

        auto peak = 0.0f;
        for (auto const sample: samples)
            peak = std::max(peak, std::abs(sample));
        impl->peakLevel.store(peak, std::memory_order_relaxed);

        auto const transition = impl->vad.update(samples);
        if (impl->activityHandler && transition != VadTransition::None)
        {
            impl->activityHandler(VoiceActivityEvent {
                .participantId = impl->config.participantId,
                .speaking = transition != VadTransition::SpeechEnded,
            });
        }

        impl->capture.append(samples, transition);
    }

} // namespace

MicrophoneVoiceSession::MicrophoneVoiceSession(MicrophoneConfig config):
    _impl(std::make_unique<Impl>(std::move(config)))
{
}

MicrophoneVoiceSession::~MicrophoneVoiceSession()
{
    disconnect();
}

void MicrophoneVoiceSession::setActivityHandler(ActivityHandler handler)
{
    _impl->activityHandler = std::move(handler);
}

auto MicrophoneVoiceSession::connect() -> VoidResult
{
    if (_impl->connected)
        return {};

    if (!isValidParticipantId(_impl->config.participantId))
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid capture participant id: '{}'", _impl->config.participantId));

    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    auto deviceId = _impl->selectDevice();

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = SpeechSampleRate;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();
    if (deviceId)
        deviceConfig.capture.pDeviceID = &*deviceId;

    auto const initResult = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (initResult != MA_SUCCESS)
    {
        _impl->release();
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize capture device: {}", static_cast<int>(initResult)));
    }
    _impl->deviceInitialized = true;

    _impl->vad.reset();
    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
    {
        _impl->release();
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start capture device: {}", static_cast<int>(startResult)));
    }

    _impl->connected = true;
    log::info("Capturing from '{}' as participant {} (16kHz, mono)",
              _impl->device.capture.name,
              _impl->config.participantId);
    return {};
}

void MicrophoneVoiceSession::disconnect()
{
    if (!_impl->connected)
        return;

    ma_device_stop(&_impl->device);
    _impl->release();
    _impl->connected = false;
    _impl->capture.discard();
    log::info("Capture device closed");
}

auto MicrophoneVoiceSession::isConnected() const -> bool
{
    return _impl->connected;
}

auto MicrophoneVoiceSession::startCapture(const std::filesystem::path& directory, CaptureEncoding encoding)
    -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::CaptureError, "Cannot start capture: not connected");
    if (_impl->capture.isCapturing())
        return makeError(ErrorCode::CaptureError, "Cannot start capture: a capture is already in progress");

    _impl->directory = directory;
    _impl->encoding = encoding;
    _impl->capture.begin();
    return {};
}

auto MicrophoneVoiceSession::stopCapture() -> Result<std::vector<std::filesystem::path>>
{
    auto finished = _impl->capture.finish();
    if (!finished)
        return makeError(ErrorCode::CaptureError, "Cannot stop capture: no capture in progress");

    auto const samples = std::move(*finished);
    if (samples.empty())
    {
        log::debug("Segment contained no speech, nothing written");
        return std::vector<std::filesystem::path> {};
    }

    auto const epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    auto const tag = std::format("segment-{}-{}", epochMs, ++_impl->segmentCounter);
    auto name = formatStagingFileName(tag, _impl->config.participantId, _impl->encoding);
    if (!name)
        return makeError(ErrorCode::CaptureError, name.error().message);

    // Write under a temporary name so the sweeper never lists a half-written segment.
    auto const finalPath = _impl->directory / *name;
    auto const partPath = std::filesystem::path(finalPath.string() + ".part");

    auto written = writeWavFile(partPath, samples, SpeechSampleRate);
    if (!written)
    {
        auto ec = std::error_code {};
        std::filesystem::remove(partPath, ec);
        return makeError(ErrorCode::CaptureError, written.error().message);
    }

    auto ec = std::error_code {};
    std::filesystem::rename(partPath, finalPath, ec);
    if (ec)
    {
        std::filesystem::remove(partPath, ec);
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to publish segment '{}': {}", finalPath.string(), ec.message()));
    }

    log::debug("Wrote {} ({:.1f}s of audio)",
               finalPath.filename().string(),
               static_cast<double>(samples.size()) / SpeechSampleRate);
    return std::vector<std::filesystem::path> { finalPath };
}

auto MicrophoneVoiceSession::peakLevel() const -> float
{
    return _impl->peakLevel.load(std::memory_order_relaxed);
}

} // namespace voicescribe
