// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace voicescribe
{

/// @brief Opaque identifier of a voice session participant (e.g. a platform user id).
using ParticipantId = std::string;

/// @brief Container format a voice session provider writes segments in.
enum class CaptureEncoding
{
    Wav,
};

/// @brief Converts a CaptureEncoding to its name, which is also the staging file extension.
[[nodiscard]] constexpr auto encodingToString(CaptureEncoding encoding) -> std::string_view
{
    switch (encoding)
    {
        case CaptureEncoding::Wav: return "wav";
    }
    return "wav";
}

/// @brief Parses an encoding name.
/// @return The encoding, or std::nullopt if the name is not supported.
[[nodiscard]] constexpr auto encodingFromString(std::string_view name) -> std::optional<CaptureEncoding>
{
    if (name == "wav")
        return CaptureEncoding::Wav;
    return std::nullopt;
}

/// @brief A voice-activity signal delivered by the voice session provider.
struct VoiceActivityEvent
{
    ParticipantId participantId;
    bool speaking = false;
};

/// @brief An attributed transcription, handed to the text sink. Not persisted by the pipeline.
struct TranscriptEvent
{
    ParticipantId participantId;
    std::string displayName;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

} // namespace voicescribe
