// SPDX-License-Identifier: Apache-2.0
#include <audio/CaptureBuffer.hpp>
#include <audio/VoiceActivityDetector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace voicescribe;

namespace
{
    // 10 ms blocks at 16 kHz, fed through the detector the way the audio callback does.
    void feed(CaptureBuffer& buffer, VoiceActivityDetector& vad, float level, int blocks)
    {
        auto const block = std::vector<float>(160, level);
        for (auto i = 0; i < blocks; ++i)
            buffer.append(block, vad.update(block));
    }
} // namespace

TEST_CASE("CaptureBuffer yields nothing for a segment of silence", "[capture]")
{
    auto vad = VoiceActivityDetector {};
    auto buffer = CaptureBuffer {};

    buffer.begin();
    feed(buffer, vad, 0.0f, 2000);
    feed(buffer, vad, 0.001f, 100);
    CHECK(!buffer.heardSpeech());

    auto const samples = buffer.finish();
    REQUIRE(samples.has_value());
    CHECK(samples->empty());
    CHECK(!buffer.isCapturing());
}

TEST_CASE("CaptureBuffer keeps the whole segment once speech was heard", "[capture]")
{
    auto vad = VoiceActivityDetector {};
    auto buffer = CaptureBuffer {};

    buffer.begin();
    feed(buffer, vad, 0.0f, 50);
    feed(buffer, vad, 0.3f, 20);
    feed(buffer, vad, 0.0f, 50);
    CHECK(buffer.heardSpeech());

    auto const samples = buffer.finish();
    REQUIRE(samples.has_value());
    CHECK(samples->size() == 120 * 160);
}

TEST_CASE("CaptureBuffer ignores audio outside a segment", "[capture]")
{
    auto vad = VoiceActivityDetector {};
    auto buffer = CaptureBuffer {};

    feed(buffer, vad, 0.3f, 10);
    CHECK(!buffer.isCapturing());
    CHECK(!buffer.heardSpeech());
    CHECK(!buffer.finish().has_value());
}

TEST_CASE("CaptureBuffer starts every segment without speech", "[capture]")
{
    auto vad = VoiceActivityDetector {};
    auto buffer = CaptureBuffer {};

    buffer.begin();
    feed(buffer, vad, 0.3f, 10);
    REQUIRE(!buffer.finish()->empty());

    // The detector's hangover ends inside the next segment; trailing silence is not speech.
    buffer.begin();
    feed(buffer, vad, 0.0f, 100);
    CHECK(!vad.isSpeaking());
    CHECK(buffer.finish()->empty());

    buffer.begin();
    feed(buffer, vad, 0.3f, 5);
    buffer.discard();
    CHECK(!buffer.isCapturing());
    CHECK(!buffer.finish().has_value());
}
