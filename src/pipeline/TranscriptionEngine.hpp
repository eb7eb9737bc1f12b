// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <array>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace voicescribe
{

/// @brief Decoding parameters handed to the transcription engine for every segment.
///
/// The defaults give deterministic output: greedy sampling at temperature zero with the
/// temperature fallback disabled, and no context carried over from earlier segments.
struct DecodingOptions
{
    std::string language = "en";
    bool translate = false;
    bool conditionOnPreviousText = false;
    std::string initialPrompt = "Speak naturally.";
    float temperature = 0.0f;

    /// @brief Step used to retry a failed decode at a higher temperature. Zero disables the fallback.
    float temperatureIncrement = 0.0f;

    /// @brief Repetition filter: a decode whose token entropy falls below this counts as failed.
    ///
    /// This is whisper.cpp's counterpart of a compression-ratio threshold, on a different scale.
    /// A failed decode is only retried when temperatureIncrement is non-zero; with the fallback
    /// disabled the first decode is kept, so neither this nor logprobThreshold changes the text.
    /// Raise it together with temperatureIncrement for a stricter filter.
    float entropyThreshold = 2.4f;
    float logprobThreshold = -1.0f;
    float noSpeechThreshold = 0.6f;
    int threads = 4;
};

/// @brief Speech-to-text engine operating on finished segment files.
///
/// Implementations serialize calls internally; the pipeline never calls transcribe()
/// concurrently, but nothing else is assumed about the caller.
class TranscriptionEngine
{
  public:
    virtual ~TranscriptionEngine() = default;

    /// @brief Transcribes an audio file.
    /// @param file The segment file.
    /// @param options Decoding parameters.
    /// @param timeout Upper bound on the decode; exceeding it yields a TimeoutError.
    /// @return The transcribed text (possibly empty) or an error.
    [[nodiscard]] virtual auto transcribe(const std::filesystem::path& file,
                                          const DecodingOptions& options,
                                          std::chrono::milliseconds timeout) -> Result<std::string> = 0;
};

/// @brief Returns the text with leading and trailing whitespace removed.
[[nodiscard]] inline auto trimWhitespace(std::string_view text) -> std::string
{
    constexpr auto Whitespace = std::string_view { " \t\n\r\f\v" };
    auto const start = text.find_first_not_of(Whitespace);
    if (start == std::string_view::npos)
        return {};
    auto const end = text.find_last_not_of(Whitespace);
    return std::string(text.substr(start, end - start + 1));
}

/// @brief Returns true for the bracketed markers speech models emit for non-speech audio.
[[nodiscard]] inline auto isNonSpeechMarker(std::string_view text) -> bool
{
    static constexpr auto Markers = std::array {
        std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
        std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
        std::string_view { "[NOISE]" },       std::string_view { "[SILENCE]" },
    };
    for (auto const& marker: Markers)
        if (text == marker)
            return true;
    return false;
}

} // namespace voicescribe
