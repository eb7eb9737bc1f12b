// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace voicescribe
{

/// @brief The parsed parts of a staging file name: `<segmentTag>_<participantId>.<extension>`.
struct StagingName
{
    std::string segmentTag;
    ParticipantId participantId;
    CaptureEncoding encoding = CaptureEncoding::Wav;
};

/// @brief Returns true if the id is non-empty and consists only of ASCII letters, digits and '-'.
[[nodiscard]] auto isValidParticipantId(std::string_view participantId) -> bool;

/// @brief Builds a staging file name.
/// @param segmentTag Identifies the segment; must be non-empty and may itself contain '_'.
/// @param participantId Must satisfy isValidParticipantId().
/// @param encoding Determines the extension.
/// @return The file name or an InvalidArgument error.
[[nodiscard]] auto formatStagingFileName(std::string_view segmentTag,
                                         std::string_view participantId,
                                         CaptureEncoding encoding) -> Result<std::string>;

/// @brief Parses a staging file name. The participant id is the text after the last '_' of the stem.
/// @return The parsed name or an InvalidArgument error for any name not produced by formatStagingFileName().
[[nodiscard]] auto parseStagingFileName(std::string_view fileName) -> Result<StagingName>;

/// @brief A finalized segment file as observed by one sweep.
struct StagingFile
{
    std::filesystem::path path;
    ParticipantId participantId;
    std::uintmax_t sizeBytes = 0;

    /// @brief Time since the file was last modified.
    Seconds age { 0.0 };
};

/// @brief The shared directory through which finished segments pass from recorder to sweeper.
class StagingArea
{
  public:
    StagingArea(std::filesystem::path directory, CaptureEncoding encoding);
    virtual ~StagingArea() = default;

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    /// @brief Creates the directory if needed and deletes partial files a crashed writer left.
    /// @param staleAfter Partial (`.part`) files last modified longer ago than this are deleted.
    /// @return Success or a ConfigError.
    [[nodiscard]] auto ensureExists(std::chrono::milliseconds staleAfter = std::chrono::milliseconds { 750 }) const
        -> VoidResult;

    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return _directory; }

    [[nodiscard]] auto encoding() const -> CaptureEncoding { return _encoding; }

    /// @brief Lists staged files of this area's encoding whose names parse.
    ///
    /// Files that disappear while being listed are skipped. Foreign files are not reported.
    /// @return The files, oldest first, or an IoError if the directory cannot be read.
    [[nodiscard]] auto list() const -> Result<std::vector<StagingFile>>;

    /// @brief Deletes a staged file. Deleting a file that is already gone succeeds.
    /// @return Success or an IoError.
    [[nodiscard]] virtual auto remove(const StagingFile& file) const -> VoidResult;

  private:
    [[nodiscard]] auto removeStalePartials(std::chrono::milliseconds staleAfter) const -> size_t;

    std::filesystem::path _directory;
    CaptureEncoding _encoding;
};

} // namespace voicescribe
