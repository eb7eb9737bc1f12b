// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/TranscriptSink.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voicescribe
{

/// @brief Formats an event the way it is posted to a text channel: "<name>: <text>".
[[nodiscard]] auto formatTranscriptLine(const TranscriptEvent& event) -> std::string;

/// @brief Serializes an event to a JSON object {participantId, name, text, timestamp}.
///
/// The timestamp is ISO-8601 UTC with millisecond precision.
[[nodiscard]] auto transcriptToJson(const TranscriptEvent& event) -> nlohmann::json;

/// @brief Prints transcript lines to a stdio stream (stdout by default).
class ConsoleSink final: public TranscriptSink
{
  public:
    explicit ConsoleSink(std::FILE* stream = stdout);

    void emit(const TranscriptEvent& event) override;

  private:
    std::FILE* _stream;
    std::mutex _mutex;
};

/// @brief Appends every transcript as one JSON line to a log file.
class JsonLinesSink final: public TranscriptSink
{
  public:
    JsonLinesSink() = default;

    /// @brief Opens (creating parent directories) the log file for appending.
    /// @return Success or an IoError.
    [[nodiscard]] auto open(const std::filesystem::path& path) -> VoidResult;

    void emit(const TranscriptEvent& event) override;

    [[nodiscard]] auto isOpen() const -> bool;

  private:
    std::filesystem::path _path;
    std::ofstream _file;
    std::mutex _mutex;
};

/// @brief Forwards each event to several sinks in order. Does not own them.
class FanOutSink final: public TranscriptSink
{
  public:
    void add(TranscriptSink& sink);

    void emit(const TranscriptEvent& event) override;

    [[nodiscard]] auto size() const -> size_t { return _sinks.size(); }

  private:
    std::vector<TranscriptSink*> _sinks;
};

} // namespace voicescribe
