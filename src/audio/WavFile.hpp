// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <span>
#include <vector>

namespace voicescribe
{

/// @brief Sample rate of all audio handed to the transcription engine.
constexpr auto SpeechSampleRate = 16000u;

/// @brief Writes mono float32 samples as a 16-bit PCM WAV file.
/// @param path Destination file; overwritten if it exists.
/// @param samples Samples in the range [-1, 1]; values outside are clipped.
/// @param sampleRate Sample rate in Hz.
/// @return Success or an IoError.
[[nodiscard]] auto writeWavFile(const std::filesystem::path& path,
                                std::span<const float> samples,
                                unsigned sampleRate = SpeechSampleRate) -> VoidResult;

/// @brief Decodes an audio file to float32 mono at 16 kHz, resampling and downmixing as needed.
/// @param path The audio file (any format miniaudio decodes: WAV, FLAC, MP3).
/// @return The samples or an AudioError.
[[nodiscard]] auto readSpeechSamples(const std::filesystem::path& path) -> Result<std::vector<float>>;

} // namespace voicescribe
