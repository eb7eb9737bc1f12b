// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <pipeline/NameResolver.hpp>
#include <pipeline/SessionContext.hpp>
#include <pipeline/StagingArea.hpp>
#include <pipeline/TranscriptSink.hpp>
#include <pipeline/TranscriptionEngine.hpp>
#include <pipeline/VoiceActivityTracker.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>

namespace voicescribe
{

/// @brief Consumer-side thresholds. The settle threshold and byte floor are tunable heuristics.
struct SweeperConfig
{
    std::chrono::milliseconds tickInterval { 500 };

    /// @brief A file is only read once its last modification is older than this.
    std::chrono::milliseconds settleThreshold { 750 };

    /// @brief Files of this size or smaller are deleted without transcription.
    std::uintmax_t minimumBytes = 1024;

    /// @brief Bound on a single engine call.
    std::chrono::milliseconds transcriptionTimeout { 60'000 };
};

/// @brief What one sweep did with the files it observed.
struct SweepStats
{
    size_t observed = 0;
    size_t deferred = 0;
    size_t undersized = 0;
    size_t transcribed = 0;
    size_t failed = 0;
    size_t emitted = 0;
    size_t deleted = 0;

    /// @brief Files whose deletion failed; only the deletion is retried on later sweeps.
    size_t undeletable = 0;
};

/// @brief Consumer loop: picks up settled segment files, transcribes them, emits attributed
/// text and deletes every file it processed.
class TranscriptionSweeper
{
  public:
    TranscriptionSweeper(SweeperConfig config,
                         DecodingOptions decoding,
                         SessionContext& context,
                         const StagingArea& staging,
                         const VoiceActivityTracker& tracker,
                         TranscriptionEngine& engine,
                         CachingNameResolver& names,
                         TranscriptSink& sink,
                         Clock& clock);

    TranscriptionSweeper(const TranscriptionSweeper&) = delete;
    TranscriptionSweeper& operator=(const TranscriptionSweeper&) = delete;

    /// @brief Performs one pass over the staging area.
    ///
    /// Files younger than the settle threshold, and all files while someone is speaking, are
    /// left for a later sweep. Every other file is processed and then deleted, whatever the
    /// outcome of the transcription. A file whose deletion failed is not transcribed again;
    /// later sweeps only retry the deletion.
    [[nodiscard]] auto sweepOnce() -> SweepStats;

    /// @brief Sweeps on every tick until the session becomes inactive.
    void run();

    [[nodiscard]] auto totals() const -> SweepStats;

    [[nodiscard]] auto config() const -> const SweeperConfig& { return _config; }

  private:
    void process(const StagingFile& file, SweepStats& stats);
    void removeFile(const StagingFile& file, SweepStats& stats);

    SweeperConfig _config;
    DecodingOptions _decoding;
    SessionContext& _context;
    const StagingArea& _staging;
    const VoiceActivityTracker& _tracker;
    TranscriptionEngine& _engine;
    CachingNameResolver& _names;
    TranscriptSink& _sink;
    Clock& _clock;
    mutable std::mutex _totalsMutex;
    SweepStats _totals;

    // Files already processed whose deletion failed. Entries leave once the file is gone.
    std::set<std::filesystem::path> _undeletable;
};

} // namespace voicescribe
