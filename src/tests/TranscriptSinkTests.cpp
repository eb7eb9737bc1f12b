// SPDX-License-Identifier: Apache-2.0
#include <output/TranscriptSinks.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>

#include "TestDoubles.hpp"

using namespace voicescribe;
using namespace voicescribe::testing;

namespace
{
    auto sampleEvent(std::string text) -> TranscriptEvent
    {
        // 2024-03-01T12:34:56.789Z
        auto const timestamp = std::chrono::sys_days { std::chrono::year { 2024 } / 3 / 1 } + std::chrono::hours { 12 }
                               + std::chrono::minutes { 34 } + std::chrono::seconds { 56 }
                               + std::chrono::milliseconds { 789 };
        return TranscriptEvent {
            .participantId = "42",
            .displayName = "Alice",
            .text = std::move(text),
            .timestamp = std::chrono::system_clock::time_point(timestamp),
        };
    }

    auto readLines(const std::filesystem::path& path) -> std::vector<std::string>
    {
        auto file = std::ifstream(path);
        auto lines = std::vector<std::string> {};
        for (auto line = std::string {}; std::getline(file, line);)
            lines.push_back(line);
        return lines;
    }
} // namespace

TEST_CASE("formatTranscriptLine prefixes the display name", "[sinks]")
{
    CHECK(formatTranscriptLine(sampleEvent("hello there")) == "Alice: hello there");
}

TEST_CASE("transcriptToJson carries participant, name, text and UTC timestamp", "[sinks]")
{
    auto const json = transcriptToJson(sampleEvent("hello"));
    CHECK(json["participantId"] == "42");
    CHECK(json["name"] == "Alice");
    CHECK(json["text"] == "hello");
    CHECK(json["timestamp"] == "2024-03-01T12:34:56.789Z");
}

TEST_CASE("JsonLinesSink appends one line per transcript", "[sinks]")
{
    auto const dir = TempDirectory("voicescribe-sinks");
    auto const path = dir.path() / "logs" / "transcripts.jsonl";

    {
        auto sink = JsonLinesSink {};
        REQUIRE(sink.open(path).has_value());
        CHECK(sink.isOpen());
        sink.emit(sampleEvent("first"));
        sink.emit(sampleEvent("second"));
    }
    {
        auto sink = JsonLinesSink {};
        REQUIRE(sink.open(path).has_value());
        sink.emit(sampleEvent("third"));
    }

    auto const lines = readLines(path);
    REQUIRE(lines.size() == 3);
    CHECK(nlohmann::json::parse(lines[0])["text"] == "first");
    CHECK(nlohmann::json::parse(lines[2])["text"] == "third");
}

TEST_CASE("JsonLinesSink ignores events until opened", "[sinks]")
{
    auto sink = JsonLinesSink {};
    CHECK(!sink.isOpen());
    sink.emit(sampleEvent("dropped"));
    CHECK(!sink.isOpen());
}

TEST_CASE("FanOutSink forwards to every sink in order", "[sinks]")
{
    auto first = RecordingSink {};
    auto second = RecordingSink {};
    auto fanOut = FanOutSink {};
    fanOut.add(first);
    fanOut.add(second);
    CHECK(fanOut.size() == 2);

    fanOut.emit(sampleEvent("hi"));
    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);
    CHECK(second.events()[0].text == "hi");
}
