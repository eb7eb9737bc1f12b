// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <atomic>
#include <cstdint>

namespace voicescribe
{

/// @brief A consistent view of the tracker state.
struct ActivitySnapshot
{
    bool speaking = false;
    double secondsSinceLastSpeech = 0.0;
};

/// @brief Most-recent-wins cell holding the session's speaking state.
///
/// One writer (the provider's event thread) and any number of readers (the recorder and
/// sweeper loops). Both fields live in a single atomic word, so a snapshot never mixes
/// the flag of one event with the timestamp of another. Intermediate transitions between
/// two reads are lost, which is intended.
class VoiceActivityTracker
{
  public:
    /// @brief Starts silent, with the last speech timestamp set to the current time.
    explicit VoiceActivityTracker(const Clock& clock);

    VoiceActivityTracker(const VoiceActivityTracker&) = delete;
    VoiceActivityTracker& operator=(const VoiceActivityTracker&) = delete;

    /// @brief Records a voice-activity signal.
    ///
    /// A speaking signal refreshes the last speech timestamp; a silence signal only clears
    /// the flag. Never blocks.
    void onActivity(bool speaking);

    /// @brief Returns the current state and the time elapsed since the last speaking signal.
    [[nodiscard]] auto snapshot() const -> ActivitySnapshot;

    /// @brief Returns true if the last signal was a speaking signal.
    [[nodiscard]] auto isSpeaking() const -> bool;

    /// @brief Forgets any speech in progress, as if a silence signal arrived now after speech.
    void reset();

  private:
    [[nodiscard]] auto encode(bool speaking, Clock::TimePoint lastSpeech) const -> std::uint64_t;

    const Clock& _clock;
    std::atomic<std::uint64_t> _state;
};

} // namespace voicescribe
