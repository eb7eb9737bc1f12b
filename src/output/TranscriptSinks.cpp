// SPDX-License-Identifier: Apache-2.0
#include "TranscriptSinks.hpp"

#include <core/Log.hpp>

#include <chrono>
#include <format>
#include <print>

namespace voicescribe
{

auto formatTranscriptLine(const TranscriptEvent& event) -> std::string
{
    return std::format("{}: {}", event.displayName, event.text);
}

auto transcriptToJson(const TranscriptEvent& event) -> nlohmann::json
{
    auto const timestamp = std::chrono::floor<std::chrono::milliseconds>(event.timestamp);
    return nlohmann::json {
        { "participantId", event.participantId },
        { "name", event.displayName },
        { "text", event.text },
        { "timestamp", std::format("{:%FT%TZ}", timestamp) },
    };
}

ConsoleSink::ConsoleSink(std::FILE* stream): _stream(stream)
{
}

void ConsoleSink::emit(const TranscriptEvent& event)
{
    auto lock = std::lock_guard(_mutex);
    std::println(_stream, "{}", formatTranscriptLine(event));
    std::fflush(_stream);
}

auto JsonLinesSink::open(const std::filesystem::path& path) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    auto const dir = path.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create transcript log directory '{}': {}",
                                         dir.string(),
                                         ec.message()));
    }

    _file = std::ofstream(path, std::ios::app);
    if (!_file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open transcript log: {}", path.string()));

    _path = path;
    log::info("Appending transcripts to {}", path.string());
    return {};
}

void JsonLinesSink::emit(const TranscriptEvent& event)
{
    auto lock = std::lock_guard(_mutex);
    if (!_file.is_open())
        return;

    // Engine output is not guaranteed to be valid UTF-8; replace rather than throw.
    _file << transcriptToJson(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    _file.flush();
    if (!_file)
    {
        log::warning("Failed to write transcript log {}, disabling it", _path.string());
        _file.close();
    }
}

auto JsonLinesSink::isOpen() const -> bool
{
    return _file.is_open();
}

void FanOutSink::add(TranscriptSink& sink)
{
    _sinks.push_back(&sink);
}

void FanOutSink::emit(const TranscriptEvent& event)
{
    for (auto* sink: _sinks)
        sink->emit(event);
}

} // namespace voicescribe
