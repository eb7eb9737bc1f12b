// SPDX-License-Identifier: Apache-2.0
#include "SegmentRecorder.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace voicescribe
{

SegmentRecorder::SegmentRecorder(RecorderConfig config,
                                 SessionContext& context,
                                 VoiceSessionProvider& provider,
                                 const VoiceActivityTracker& tracker,
                                 Clock& clock):
    _config(config), _context(context), _provider(provider), _tracker(tracker), _clock(clock)
{
}

auto SegmentRecorder::evaluateTick(const RecorderConfig& config,
                                   double elapsedSeconds,
                                   const ActivitySnapshot& activity,
                                   double& targetDurationSeconds) -> SegmentDecision
{
    if (activity.speaking)
    {
        targetDurationSeconds = std::max(targetDurationSeconds, elapsedSeconds + config.graceSeconds);
        return SegmentDecision::Continue;
    }

    if (activity.secondsSinceLastSpeech >= config.silenceHoldSeconds && elapsedSeconds >= targetDurationSeconds)
        return SegmentDecision::Stop;

    return SegmentDecision::Continue;
}

auto SegmentRecorder::runCycle() -> Result<Segment>
{
    auto started = _provider.startCapture(_context.stagingDirectory, _context.encoding);
    if (!started)
        return std::unexpected(started.error());

    auto segment = Segment {
        .sequence = _nextSequence++,
        .startedAt = _clock.now(),
        .targetDurationSeconds = _config.baseDurationSeconds,
    };
    log::debug("Segment {} started", segment.sequence);

    while (true)
    {
        if (!_context.isActive())
        {
            segment.interrupted = true;
            break;
        }

        auto tick = RecorderTick {
            .elapsedSeconds = toSeconds(_clock.now() - segment.startedAt),
            .activity = _tracker.snapshot(),
        };
        tick.decision =
            evaluateTick(_config, tick.elapsedSeconds, tick.activity, segment.targetDurationSeconds);
        tick.targetDurationSeconds = segment.targetDurationSeconds;

        log::trace("Recording state - speaking: {}, elapsed: {:.1f}s, since last speech: {:.1f}s, target: {:.1f}s",
                   tick.activity.speaking,
                   tick.elapsedSeconds,
                   tick.activity.secondsSinceLastSpeech,
                   tick.targetDurationSeconds);

        if (_tickObserver)
            _tickObserver(tick);

        segment.elapsedSeconds = tick.elapsedSeconds;
        if (tick.decision == SegmentDecision::Stop)
            break;

        _clock.sleepFor(_config.tickInterval);
    }

    auto files = _provider.stopCapture();
    if (!files)
        return std::unexpected(files.error());

    segment.files = std::move(*files);
    log::info("Stopped segment {} after {:.1f}s ({} file(s){})",
              segment.sequence,
              segment.elapsedSeconds,
              segment.files.size(),
              segment.interrupted ? ", session ended" : "");
    return segment;
}

void SegmentRecorder::run()
{
    log::info("Segment recorder started (base {:.1f}s, grace {:.1f}s, silence hold {:.1f}s)",
              _config.baseDurationSeconds,
              _config.graceSeconds,
              _config.silenceHoldSeconds);

    while (_context.isActive())
    {
        auto segment = runCycle();
        if (!segment)
        {
            ++_failedCycles;
            log::error("Error in recording cycle: {}", segment.error().message);
            _clock.sleepFor(_config.retryBackoff);
            continue;
        }
        ++_completedSegments;
    }

    log::info("Segment recorder stopped");
}

void SegmentRecorder::setTickObserver(TickObserver observer)
{
    _tickObserver = std::move(observer);
}

auto SegmentRecorder::completedSegments() const -> std::uint64_t
{
    return _completedSegments.load();
}

auto SegmentRecorder::failedCycles() const -> std::uint64_t
{
    return _failedCycles.load();
}

} // namespace voicescribe
