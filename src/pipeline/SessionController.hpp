// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <pipeline/NameResolver.hpp>
#include <pipeline/SegmentRecorder.hpp>
#include <pipeline/TranscriptSink.hpp>
#include <pipeline/TranscriptionEngine.hpp>
#include <pipeline/TranscriptionSweeper.hpp>
#include <pipeline/VoiceActivityTracker.hpp>
#include <pipeline/VoiceSessionProvider.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace voicescribe
{

/// @brief Session-level settings.
struct SessionConfig
{
    std::filesystem::path stagingDirectory = "recordings";

    /// @brief Scope of participant name lookups (the server/guild of a chat platform).
    std::string sessionId = "local";

    /// @brief Activity signals from this participant (our own voice state) are ignored.
    ParticipantId selfParticipantId;

    CaptureEncoding encoding = CaptureEncoding::Wav;

    /// @brief How long start() and stop() wait after clearing the active flag.
    std::chrono::milliseconds settlePeriod { 1000 };
};

/// @brief Collaborators a session runs against. All must outlive the controller.
struct SessionCollaborators
{
    VoiceSessionProvider& provider;
    TranscriptionEngine& engine;
    CachingNameResolver& names;
    TranscriptSink& sink;
    Clock& clock;
};

/// @brief Runs a recording session: one SegmentRecorder loop and one TranscriptionSweeper loop
/// on their own threads, sharing the staging directory and the active flag.
///
/// At most one session runs per controller; starting again restarts it.
class SessionController
{
  public:
    SessionController(SessionConfig session,
                      RecorderConfig recorder,
                      SweeperConfig sweeper,
                      DecodingOptions decoding,
                      SessionCollaborators collaborators);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// @brief Starts the session, restarting it if already active.
    ///
    /// A restart deactivates the running loops, waits one settle period and joins them before
    /// new loops are spawned, so two recorders never share the staging directory.
    /// @return Success, or the setup error (staging directory, voice connection) that aborted the start.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the session: clears the active flag, waits one settle period, joins both loops,
    /// transcribes whatever settled segments remain and disconnects the voice session.
    void stop();

    /// @brief Returns true between a successful start() and stop().
    [[nodiscard]] auto isActive() const -> bool;

    /// @brief Feeds a voice-activity signal into the session. Never blocks.
    void onVoiceActivity(const VoiceActivityEvent& event);

    [[nodiscard]] auto tracker() const -> const VoiceActivityTracker&;

    [[nodiscard]] auto recorder() -> SegmentRecorder&;

    [[nodiscard]] auto sweeper() -> TranscriptionSweeper&;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicescribe
