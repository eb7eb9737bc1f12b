// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionSweeper.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace voicescribe
{

TranscriptionSweeper::TranscriptionSweeper(SweeperConfig config,
                                           DecodingOptions decoding,
                                           SessionContext& context,
                                           const StagingArea& staging,
                                           const VoiceActivityTracker& tracker,
                                           TranscriptionEngine& engine,
                                           CachingNameResolver& names,
                                           TranscriptSink& sink,
                                           Clock& clock):
    _config(config),
    _decoding(std::move(decoding)),
    _context(context),
    _staging(staging),
    _tracker(tracker),
    _engine(engine),
    _names(names),
    _sink(sink),
    _clock(clock)
{
}

auto TranscriptionSweeper::sweepOnce() -> SweepStats
{
    auto stats = SweepStats {};

    auto files = _staging.list();
    if (!files)
    {
        log::error("Error listing staged segments: {}", files.error().message);
        return stats;
    }

    std::erase_if(_undeletable, [&](auto const& path) {
        return std::ranges::none_of(*files, [&](auto const& file) { return file.path == path; });
    });

    for (auto const& file: *files)
    {
        ++stats.observed;

        if (_undeletable.contains(file.path))
        {
            removeFile(file, stats);
            continue;
        }

        // Either heuristic suggests the recorder may still be writing.
        if (file.age <= _config.settleThreshold || _tracker.isSpeaking())
        {
            ++stats.deferred;
            continue;
        }

        process(file, stats);
    }

    if (stats.observed > stats.deferred)
        log::debug("Sweep: {} observed, {} deferred, {} transcribed, {} emitted, {} deleted",
                   stats.observed,
                   stats.deferred,
                   stats.transcribed,
                   stats.emitted,
                   stats.deleted);

    auto lock = std::lock_guard(_totalsMutex);
    _totals.observed += stats.observed;
    _totals.deferred += stats.deferred;
    _totals.undersized += stats.undersized;
    _totals.transcribed += stats.transcribed;
    _totals.failed += stats.failed;
    _totals.emitted += stats.emitted;
    _totals.deleted += stats.deleted;
    _totals.undeletable += stats.undeletable;
    return stats;
}

void TranscriptionSweeper::process(const StagingFile& file, SweepStats& stats)
{
    if (file.sizeBytes > _config.minimumBytes)
    {
        log::info("Processing file {} (age: {:.2f}s, size: {})",
                  file.path.filename().string(),
                  file.age.count(),
                  file.sizeBytes);

        auto text = _engine.transcribe(file.path, _decoding, _config.transcriptionTimeout);
        if (!text)
        {
            ++stats.failed;
            log::error("Error processing file {}: {}", file.path.filename().string(), text.error().message);
        }
        else
        {
            ++stats.transcribed;
            auto transcription = trimWhitespace(*text);
            if (!transcription.empty())
            {
                auto event = TranscriptEvent {
                    .participantId = file.participantId,
                    .displayName = _names.displayName(file.participantId, _context.sessionId),
                    .text = std::move(transcription),
                    .timestamp = std::chrono::system_clock::now(),
                };
                _sink.emit(event);
                ++stats.emitted;
            }
        }
    }
    else
    {
        ++stats.undersized;
        log::debug("Discarding {} ({} bytes, likely silence)", file.path.filename().string(), file.sizeBytes);
    }

    // Delete regardless of the outcome; a failed segment is not retried.
    removeFile(file, stats);
}

void TranscriptionSweeper::removeFile(const StagingFile& file, SweepStats& stats)
{
    auto removed = _staging.remove(file);
    if (!removed)
    {
        if (_undeletable.insert(file.path).second)
            log::warning("{}", removed.error().message);
        ++stats.undeletable;
        return;
    }
    _undeletable.erase(file.path);
    ++stats.deleted;
}

void TranscriptionSweeper::run()
{
    log::info("Starting continuous processing of {}", _staging.directory().string());

    while (_context.isActive())
    {
        (void) sweepOnce();
        _clock.sleepFor(_config.tickInterval);
    }

    log::info("Continuous processing stopped");
}

auto TranscriptionSweeper::totals() const -> SweepStats
{
    auto lock = std::lock_guard(_totalsMutex);
    return _totals;
}

} // namespace voicescribe
