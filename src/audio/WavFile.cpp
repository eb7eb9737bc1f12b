// SPDX-License-Identifier: Apache-2.0
#include "WavFile.hpp"

#include <miniaudio.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>

namespace voicescribe
{

auto writeWavFile(const std::filesystem::path& path, std::span<const float> samples, unsigned sampleRate)
    -> VoidResult
{
    auto pcm = std::vector<std::int16_t>(samples.size());
    std::ranges::transform(samples, pcm.begin(), [](float sample) {
        return static_cast<std::int16_t>(std::clamp(sample, -1.0f, 1.0f) * 32767.0f);
    });

    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, 1, sampleRate);
    auto encoder = ma_encoder {};
    auto const initResult = ma_encoder_init_file(path.string().c_str(), &config, &encoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create WAV file '{}': {}", path.string(), static_cast<int>(initResult)));

    auto written = ma_uint64 { 0 };
    auto const writeResult = ma_encoder_write_pcm_frames(&encoder, pcm.data(), pcm.size(), &written);
    ma_encoder_uninit(&encoder);

    if (writeResult != MA_SUCCESS || written != pcm.size())
        return makeError(ErrorCode::IoError,
                         std::format("Failed to write WAV file '{}' ({} of {} frames)",
                                     path.string(),
                                     written,
                                     pcm.size()));
    return {};
}

auto readSpeechSamples(const std::filesystem::path& path) -> Result<std::vector<float>>
{
    auto config = ma_decoder_config_init(ma_format_f32, 1, SpeechSampleRate);
    auto decoder = ma_decoder {};
    auto const initResult = ma_decoder_init_file(path.string().c_str(), &config, &decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to open audio file '{}': {}", path.string(), static_cast<int>(initResult)));

    auto samples = std::vector<float> {};
    auto chunk = std::array<float, 4096> {};
    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const result = ma_decoder_read_pcm_frames(&decoder, chunk.data(), chunk.size(), &framesRead);
        samples.insert(samples.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(framesRead));

        if (result == MA_AT_END || framesRead == 0)
            break;
        if (result != MA_SUCCESS)
        {
            ma_decoder_uninit(&decoder);
            return makeError(ErrorCode::AudioError,
                             std::format("Failed to decode '{}': {}", path.string(), static_cast<int>(result)));
        }
    }

    ma_decoder_uninit(&decoder);
    return samples;
}

} // namespace voicescribe
