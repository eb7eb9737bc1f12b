// SPDX-License-Identifier: Apache-2.0
#include <pipeline/StagingArea.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"

using namespace voicescribe;
using namespace voicescribe::testing;
using namespace std::chrono_literals;

TEST_CASE("formatStagingFileName joins tag, participant and extension", "[staging]")
{
    auto name = formatStagingFileName("segment-1700000000000-3", "123456789", CaptureEncoding::Wav);
    REQUIRE(name.has_value());
    CHECK(*name == "segment-1700000000000-3_123456789.wav");
}

TEST_CASE("formatStagingFileName rejects ambiguous components", "[staging]")
{
    CHECK(!formatStagingFileName("", "42", CaptureEncoding::Wav).has_value());
    CHECK(!formatStagingFileName("a/b", "42", CaptureEncoding::Wav).has_value());
    CHECK(!formatStagingFileName("seg.1", "42", CaptureEncoding::Wav).has_value());
    CHECK(!formatStagingFileName("seg", "", CaptureEncoding::Wav).has_value());
    CHECK(!formatStagingFileName("seg", "4_2", CaptureEncoding::Wav).has_value());
    CHECK(!formatStagingFileName("seg", "bob smith", CaptureEncoding::Wav).has_value());

    auto const rejected = formatStagingFileName("seg", "x.y", CaptureEncoding::Wav);
    REQUIRE(!rejected.has_value());
    CHECK(rejected.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("parseStagingFileName takes the participant after the last underscore", "[staging]")
{
    auto parsed = parseStagingFileName("2024_05_01_seg_42.wav");
    REQUIRE(parsed.has_value());
    CHECK(parsed->segmentTag == "2024_05_01_seg");
    CHECK(parsed->participantId == "42");
    CHECK(parsed->encoding == CaptureEncoding::Wav);

    auto const formatted = formatStagingFileName("tag_with_parts", "user-9", CaptureEncoding::Wav);
    REQUIRE(formatted.has_value());
    auto reparsed = parseStagingFileName(*formatted);
    REQUIRE(reparsed.has_value());
    CHECK(reparsed->segmentTag == "tag_with_parts");
    CHECK(reparsed->participantId == "user-9");
}

TEST_CASE("parseStagingFileName rejects foreign names", "[staging]")
{
    CHECK(!parseStagingFileName("notes.txt").has_value());
    CHECK(!parseStagingFileName("recording.wav").has_value());
    CHECK(!parseStagingFileName("_42.wav").has_value());
    CHECK(!parseStagingFileName("seg_.wav").has_value());
    CHECK(!parseStagingFileName("seg_42.wav.part").has_value());
    CHECK(!parseStagingFileName("seg_4 2.wav").has_value());
    CHECK(!parseStagingFileName("seg_42").has_value());
}

TEST_CASE("StagingArea lists staged files oldest first with their age", "[staging]")
{
    auto const dir = TempDirectory("voicescribe-staging");
    auto const staging = StagingArea(dir.path(), CaptureEncoding::Wav);

    writeAgedFile(dir.path() / "b_2.wav", 10, 1s);
    writeAgedFile(dir.path() / "a_1.wav", 2000, 5s);
    writeAgedFile(dir.path() / "c_3.wav.part", 10, 5s);
    writeAgedFile(dir.path() / "readme.txt", 10, 5s);

    auto files = staging.list();
    REQUIRE(files.has_value());
    REQUIRE(files->size() == 2);

    auto const& oldest = files->at(0);
    CHECK(oldest.path.filename().string() == "a_1.wav");
    CHECK(oldest.participantId == "1");
    CHECK(oldest.sizeBytes == 2000);
    CHECK(oldest.age >= 4500ms);

    auto const& newest = files->at(1);
    CHECK(newest.participantId == "2");
    CHECK(newest.age >= 900ms);
    CHECK(newest.age < 5s);
}

TEST_CASE("StagingArea creates its directory and reports unreadable ones", "[staging]")
{
    auto const dir = TempDirectory("voicescribe-staging");
    auto const staging = StagingArea(dir.path() / "nested" / "recordings", CaptureEncoding::Wav);

    auto missing = staging.list();
    REQUIRE(!missing.has_value());
    CHECK(missing.error().code == ErrorCode::IoError);

    REQUIRE(staging.ensureExists().has_value());
    auto empty = staging.list();
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("StagingArea remove tolerates files that are already gone", "[staging]")
{
    auto const dir = TempDirectory("voicescribe-staging");
    auto const staging = StagingArea(dir.path(), CaptureEncoding::Wav);
    writeAgedFile(dir.path() / "seg_5.wav", 10, 0ms);

    auto files = staging.list();
    REQUIRE(files.has_value());
    REQUIRE(files->size() == 1);

    CHECK(staging.remove(files->front()).has_value());
    CHECK(!std::filesystem::exists(files->front().path));
    CHECK(staging.remove(files->front()).has_value());
}

TEST_CASE("StagingArea list reports a staging path that is not a directory", "[staging]")
{
    auto const dir = TempDirectory("voicescribe-staging");
    writeAgedFile(dir.path() / "recordings", 10, 0ms);
    auto const staging = StagingArea(dir.path() / "recordings", CaptureEncoding::Wav);

    auto files = staging.list();
    REQUIRE(!files.has_value());
    CHECK(files.error().code == ErrorCode::IoError);
}

TEST_CASE("StagingArea ensureExists deletes abandoned partial segments", "[staging]")
{
    auto const dir = TempDirectory("voicescribe-staging");
    auto const staging = StagingArea(dir.path(), CaptureEncoding::Wav);

    writeAgedFile(dir.path() / "seg-1_7.wav.part", 4096, 10s);
    writeAgedFile(dir.path() / "seg-2_7.wav.part", 4096, 0ms);
    writeAgedFile(dir.path() / "seg-3_7.wav", 4096, 10s);
    writeAgedFile(dir.path() / "notes.txt", 10, 10s);

    REQUIRE(staging.ensureExists(750ms).has_value());

    CHECK(!std::filesystem::exists(dir.path() / "seg-1_7.wav.part"));
    CHECK(std::filesystem::exists(dir.path() / "seg-2_7.wav.part"));
    CHECK(std::filesystem::exists(dir.path() / "seg-3_7.wav"));
    CHECK(std::filesystem::exists(dir.path() / "notes.txt"));
    CHECK(dir.fileCount() == 3);
}
