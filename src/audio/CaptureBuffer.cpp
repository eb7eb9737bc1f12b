// SPDX-License-Identifier: Apache-2.0
#include "CaptureBuffer.hpp"

namespace voicescribe
{

void CaptureBuffer::begin()
{
    auto lock = std::lock_guard(_mutex);
    _samples.clear();
    _capturing = true;
    _heardSpeech = false;
}

void CaptureBuffer::append(std::span<const float> samples, VadTransition transition)
{
    auto lock = std::lock_guard(_mutex);
    if (!_capturing)
        return;

    if (transition == VadTransition::SpeechStarted || transition == VadTransition::SpeechContinues)
        _heardSpeech = true;
    _samples.insert(_samples.end(), samples.begin(), samples.end());
}

auto CaptureBuffer::finish() -> std::optional<std::vector<float>>
{
    auto lock = std::lock_guard(_mutex);
    if (!_capturing)
        return std::nullopt;

    _capturing = false;
    auto samples = std::vector<float> {};
    if (_heardSpeech)
        samples = std::move(_samples);
    _samples.clear();
    _heardSpeech = false;
    return samples;
}

void CaptureBuffer::discard()
{
    auto lock = std::lock_guard(_mutex);
    _capturing = false;
    _heardSpeech = false;
    _samples.clear();
}

auto CaptureBuffer::isCapturing() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _capturing;
}

auto CaptureBuffer::heardSpeech() const -> bool
{
    auto lock = std::lock_guard(_mutex);
    return _heardSpeech;
}

} // namespace voicescribe
