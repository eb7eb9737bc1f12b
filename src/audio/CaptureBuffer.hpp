// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/VoiceActivityDetector.hpp>

#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace voicescribe
{

/// @brief Accumulates the samples of one capture segment and remembers whether any of them
/// were voiced.
///
/// append() is called from the audio callback thread, everything else from the recorder.
class CaptureBuffer
{
  public:
    /// @brief Starts a new segment, dropping anything buffered before.
    void begin();

    /// @brief Appends a block of samples if a segment is open.
    /// @param transition What the detector reported for this block.
    void append(std::span<const float> samples, VadTransition transition);

    /// @brief Closes the segment.
    /// @return nullopt if no segment was open, an empty vector if the segment never contained
    ///         speech, otherwise all samples of the segment.
    [[nodiscard]] auto finish() -> std::optional<std::vector<float>>;

    /// @brief Closes the segment and drops its samples.
    void discard();

    [[nodiscard]] auto isCapturing() const -> bool;

    [[nodiscard]] auto heardSpeech() const -> bool;

  private:
    mutable std::mutex _mutex;
    std::vector<float> _samples;
    bool _capturing = false;
    bool _heardSpeech = false;
};

} // namespace voicescribe
