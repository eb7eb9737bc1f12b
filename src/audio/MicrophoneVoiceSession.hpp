// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/VoiceActivityDetector.hpp>
#include <core/Types.hpp>
#include <pipeline/VoiceSessionProvider.hpp>

#include <memory>
#include <string>

namespace voicescribe
{

/// @brief Configuration of the local microphone session.
struct MicrophoneConfig
{
    /// @brief Substring matched (case-insensitive) against capture device names; empty auto-selects.
    std::string deviceName;

    /// @brief Participant id all locally captured audio is attributed to.
    ParticipantId participantId = "local";

    VadConfig vad;
};

/// @brief Voice session backed by a local capture device via miniaudio.
///
/// Captures float32 PCM at 16 kHz mono. Voice activity is derived from signal energy and
/// reported for the single local participant; a speaking signal is repeated for every audio
/// block that contains speech. Finished segments are written as WAV files; a segment in
/// which the detector never heard speech produces no file.
class MicrophoneVoiceSession final: public VoiceSessionProvider
{
  public:
    explicit MicrophoneVoiceSession(MicrophoneConfig config);
    ~MicrophoneVoiceSession() override;

    MicrophoneVoiceSession(const MicrophoneVoiceSession&) = delete;
    MicrophoneVoiceSession& operator=(const MicrophoneVoiceSession&) = delete;

    void setActivityHandler(ActivityHandler handler) override;

    /// @brief Opens and starts the capture device.
    /// @return Success or an AudioError if no usable capture device exists.
    [[nodiscard]] auto connect() -> VoidResult override;

    void disconnect() override;

    [[nodiscard]] auto isConnected() const -> bool override;

    [[nodiscard]] auto startCapture(const std::filesystem::path& directory, CaptureEncoding encoding)
        -> VoidResult override;

    [[nodiscard]] auto stopCapture() -> Result<std::vector<std::filesystem::path>> override;

    /// @brief Returns the current peak audio level (0.0 to 1.0). Safe to call from any thread.
    [[nodiscard]] auto peakLevel() const -> float;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace voicescribe
