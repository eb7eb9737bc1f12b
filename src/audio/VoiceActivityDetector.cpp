// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <algorithm>
#include <cmath>

namespace voicescribe
{

VoiceActivityDetector::VoiceActivityDetector(VadConfig config):
    _config(config),
    _releaseSamples(static_cast<std::uint64_t>(config.releaseMs) * config.sampleRate / 1000)
{
}

auto VoiceActivityDetector::probability(std::span<const float> samples) const -> float
{
    if (samples.empty() || _config.energyThreshold <= 0.0f)
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: samples)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(samples.size()));

    // Normalize so that the energy threshold lands at 0.5
    return std::min(1.0f, energy / (_config.energyThreshold * 2.0f));
}

auto VoiceActivityDetector::update(std::span<const float> samples) -> VadTransition
{
    if (isSpeech(probability(samples), _config.speechThreshold))
    {
        _silentSamples = 0;
        if (_speaking)
            return VadTransition::SpeechContinues;
        _speaking = true;
        return VadTransition::SpeechStarted;
    }

    if (!_speaking)
        return VadTransition::None;

    _silentSamples += samples.size();
    if (_silentSamples < _releaseSamples)
        return VadTransition::None;

    _speaking = false;
    _silentSamples = 0;
    return VadTransition::SpeechEnded;
}

auto VoiceActivityDetector::isSpeech(float probability, float threshold) -> bool
{
    return probability >= threshold;
}

void VoiceActivityDetector::reset()
{
    _speaking = false;
    _silentSamples = 0;
}

} // namespace voicescribe
