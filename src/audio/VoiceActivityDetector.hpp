// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <span>

namespace voicescribe
{

/// @brief Configuration for the energy-based voice activity detector.
struct VadConfig
{
    /// @brief RMS energy that maps to a speech probability of 0.5.
    float energyThreshold = 0.01f;

    /// @brief Probability at or above which a frame counts as speech.
    float speechThreshold = 0.5f;

    /// @brief Silence needed after speech before the detector reports silence again.
    unsigned releaseMs = 300;

    unsigned sampleRate = 16000;
};

/// @brief Transition reported by VoiceActivityDetector::update().
enum class VadTransition : std::uint8_t
{
    None,
    SpeechStarted,
    SpeechContinues,
    SpeechEnded,
};

/// @brief Energy-based voice activity detection with a release hangover.
///
/// Not thread-safe; meant to be driven from a single audio callback thread.
class VoiceActivityDetector
{
  public:
    explicit VoiceActivityDetector(VadConfig config = {});

    /// @brief Returns the speech probability (0.0 to 1.0) of a block of float32 PCM samples.
    [[nodiscard]] auto probability(std::span<const float> samples) const -> float;

    /// @brief Feeds a block of samples and returns how the speaking state changed.
    [[nodiscard]] auto update(std::span<const float> samples) -> VadTransition;

    /// @brief Returns true while speech (including the release hangover) is in progress.
    [[nodiscard]] auto isSpeaking() const -> bool { return _speaking; }

    /// @brief Returns true if the probability meets the threshold.
    [[nodiscard]] static auto isSpeech(float probability, float threshold = 0.5f) -> bool;

    /// @brief Returns to the silent state.
    void reset();

  private:
    VadConfig _config;
    std::uint64_t _releaseSamples = 0;
    std::uint64_t _silentSamples = 0;
    bool _speaking = false;
};

} // namespace voicescribe
