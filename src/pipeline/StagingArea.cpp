// SPDX-License-Identifier: Apache-2.0
#include "StagingArea.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace voicescribe
{

namespace
{
    constexpr auto PartialExtension = std::string_view { ".part" };
} // namespace

auto isValidParticipantId(std::string_view participantId) -> bool
{
    if (participantId.empty())
        return false;

    return std::ranges::all_of(participantId, [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
    });
}

auto formatStagingFileName(std::string_view segmentTag, std::string_view participantId, CaptureEncoding encoding)
    -> Result<std::string>
{
    if (segmentTag.empty() || segmentTag.find_first_of("/\\.") != std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid segment tag: '{}'", segmentTag));

    if (!isValidParticipantId(participantId))
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid participant id: '{}'", participantId));

    return std::format("{}_{}.{}", segmentTag, participantId, encodingToString(encoding));
}

auto parseStagingFileName(std::string_view fileName) -> Result<StagingName>
{
    auto const dot = fileName.rfind('.');
    if (dot == std::string_view::npos)
        return makeError(ErrorCode::InvalidArgument, std::format("Missing extension: '{}'", fileName));

    auto const encoding = encodingFromString(fileName.substr(dot + 1));
    if (!encoding)
        return makeError(ErrorCode::InvalidArgument, std::format("Unsupported extension: '{}'", fileName));

    auto const stem = fileName.substr(0, dot);
    auto const separator = stem.rfind('_');
    if (separator == std::string_view::npos || separator == 0)
        return makeError(ErrorCode::InvalidArgument, std::format("Missing participant separator: '{}'", fileName));

    auto const segmentTag = stem.substr(0, separator);
    auto const participantId = stem.substr(separator + 1);
    if (segmentTag.find('.') != std::string_view::npos || !isValidParticipantId(participantId))
        return makeError(ErrorCode::InvalidArgument, std::format("Malformed staging file name: '{}'", fileName));

    return StagingName {
        .segmentTag = std::string(segmentTag),
        .participantId = std::string(participantId),
        .encoding = *encoding,
    };
}

StagingArea::StagingArea(std::filesystem::path directory, CaptureEncoding encoding):
    _directory(std::move(directory)), _encoding(encoding)
{
}

auto StagingArea::ensureExists(std::chrono::milliseconds staleAfter) const -> VoidResult
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(
            ErrorCode::ConfigError,
            std::format("Failed to create staging directory '{}': {}", _directory.string(), ec.message()));

    if (auto const removed = removeStalePartials(staleAfter); removed > 0)
        log::info("Removed {} abandoned partial segment(s) from {}", removed, _directory.string());
    return {};
}

auto StagingArea::removeStalePartials(std::chrono::milliseconds staleAfter) const -> size_t
{
    auto const now = std::filesystem::file_time_type::clock::now();
    auto removed = size_t { 0 };
    auto scanError = std::error_code {};

    for (auto iterator = std::filesystem::directory_iterator(_directory, scanError);
         !scanError && iterator != std::filesystem::directory_iterator {};
         iterator.increment(scanError))
    {
        auto const& path = iterator->path();
        if (path.extension().string() != PartialExtension)
            continue;

        auto ec = std::error_code {};
        if (!iterator->is_regular_file(ec) || ec)
            continue;

        auto const modified = std::filesystem::last_write_time(path, ec);
        if (ec || now - modified <= staleAfter)
            continue;

        if (std::filesystem::remove(path, ec); ec)
        {
            log::warning("Failed to delete partial segment '{}': {}", path.string(), ec.message());
            continue;
        }
        ++removed;
    }

    if (scanError)
        log::warning("Cannot scan staging directory '{}' for partial segments: {}",
                     _directory.string(),
                     scanError.message());
    return removed;
}

auto StagingArea::list() const -> Result<std::vector<StagingFile>>
{
    auto const now = std::filesystem::file_time_type::clock::now();
    auto files = std::vector<StagingFile> {};
    auto scanError = std::error_code {};

    for (auto iterator = std::filesystem::directory_iterator(_directory, scanError);
         !scanError && iterator != std::filesystem::directory_iterator {};
         iterator.increment(scanError))
    {
        auto const& entry = *iterator;
        auto ec = std::error_code {};
        auto const fileName = entry.path().filename().string();
        auto name = parseStagingFileName(fileName);
        if (!name || name->encoding != _encoding)
            continue;

        if (!entry.is_regular_file(ec) || ec)
            continue;

        // The sweeper may race a rename or a delete; a vanished file is simply not listed.
        auto const size = std::filesystem::file_size(entry.path(), ec);
        if (ec)
        {
            log::debug("Skipping staging file {}: {}", fileName, ec.message());
            continue;
        }
        auto const modified = std::filesystem::last_write_time(entry.path(), ec);
        if (ec)
        {
            log::debug("Skipping staging file {}: {}", fileName, ec.message());
            continue;
        }

        files.push_back(StagingFile {
            .path = entry.path(),
            .participantId = std::move(name->participantId),
            .sizeBytes = size,
            .age = std::chrono::duration_cast<Seconds>(now - modified),
        });
    }

    if (scanError)
        return makeError(
            ErrorCode::IoError,
            std::format("Cannot read staging directory '{}': {}", _directory.string(), scanError.message()));

    std::ranges::sort(files, [](auto const& a, auto const& b) { return a.age > b.age; });
    return files;
}

auto StagingArea::remove(const StagingFile& file) const -> VoidResult
{
    auto ec = std::error_code {};
    std::filesystem::remove(file.path, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to delete '{}': {}", file.path.string(), ec.message()));
    return {};
}

} // namespace voicescribe
