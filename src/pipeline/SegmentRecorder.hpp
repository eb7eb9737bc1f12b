// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <pipeline/SessionContext.hpp>
#include <pipeline/VoiceActivityTracker.hpp>
#include <pipeline/VoiceSessionProvider.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace voicescribe
{

/// @brief Timing of the adaptive segmentation. All values are tunable heuristics.
struct RecorderConfig
{
    /// @brief Minimum segment length; a segment is never stopped before this much time elapsed.
    double baseDurationSeconds = 20.0;

    /// @brief While speech is in progress the target is kept at least this far ahead of now.
    double graceSeconds = 2.0;

    /// @brief Silence required since the last speaking signal before a segment may stop.
    double silenceHoldSeconds = 1.0;

    std::chrono::milliseconds tickInterval { 100 };
    std::chrono::milliseconds retryBackoff { 500 };
};

/// @brief One audio-capture unit. Exists only inside a recorder cycle; once finalized the
/// files belong to the staging area and this record is discarded.
struct Segment
{
    std::uint64_t sequence = 0;
    Clock::TimePoint startedAt {};
    double targetDurationSeconds = 0.0;

    /// @brief Elapsed seconds at the tick the segment was stopped.
    double elapsedSeconds = 0.0;

    /// @brief True if the segment ended because the session was deactivated.
    bool interrupted = false;

    std::vector<std::filesystem::path> files;
};

enum class SegmentDecision
{
    Continue,
    Stop,
};

/// @brief The state observed by one recorder tick, reported to a TickObserver.
struct RecorderTick
{
    double elapsedSeconds = 0.0;
    double targetDurationSeconds = 0.0;
    ActivitySnapshot activity;
    SegmentDecision decision = SegmentDecision::Continue;
};

using TickObserver = std::function<void(const RecorderTick& tick)>;

/// @brief Producer loop: captures one segment at a time while the session is active,
/// stretching each segment until speech has ended.
class SegmentRecorder
{
  public:
    SegmentRecorder(RecorderConfig config,
                    SessionContext& context,
                    VoiceSessionProvider& provider,
                    const VoiceActivityTracker& tracker,
                    Clock& clock);

    SegmentRecorder(const SegmentRecorder&) = delete;
    SegmentRecorder& operator=(const SegmentRecorder&) = delete;

    /// @brief Decides one tick of a segment.
    ///
    /// While speaking, extends @p targetDurationSeconds to at least elapsed + grace and continues.
    /// While silent, stops only once the silence hold has passed and the target has been reached.
    /// @param config The timing parameters.
    /// @param elapsedSeconds Time since the segment started.
    /// @param activity The tracker state at this tick.
    /// @param targetDurationSeconds The segment target, updated in place.
    [[nodiscard]] static auto evaluateTick(const RecorderConfig& config,
                                           double elapsedSeconds,
                                           const ActivitySnapshot& activity,
                                           double& targetDurationSeconds) -> SegmentDecision;

    /// @brief Captures one segment: starts a capture, polls until a stop condition or until the
    /// session is deactivated, then finalizes the capture.
    /// @return The finalized segment or a CaptureError.
    [[nodiscard]] auto runCycle() -> Result<Segment>;

    /// @brief Runs cycles until the session becomes inactive. A failed cycle is logged and
    /// retried after the backoff; it never ends the loop.
    void run();

    /// @brief Installs an observer called on every tick (from the recorder thread).
    void setTickObserver(TickObserver observer);

    [[nodiscard]] auto completedSegments() const -> std::uint64_t;

    [[nodiscard]] auto failedCycles() const -> std::uint64_t;

  private:
    RecorderConfig _config;
    SessionContext& _context;
    VoiceSessionProvider& _provider;
    const VoiceActivityTracker& _tracker;
    Clock& _clock;
    TickObserver _tickObserver;
    std::uint64_t _nextSequence = 1;
    std::atomic<std::uint64_t> _completedSegments = 0;
    std::atomic<std::uint64_t> _failedCycles = 0;
};

} // namespace voicescribe
