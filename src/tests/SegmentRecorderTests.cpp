// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <pipeline/SegmentRecorder.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <random>
#include <string>
#include <vector>

#include "ManualClock.hpp"
#include "TestDoubles.hpp"

using namespace voicescribe;
using namespace voicescribe::testing;
using namespace std::chrono_literals;

/// @brief Wires a recorder to a virtual clock and a fake voice session.
struct RecorderFixture
{
    TempDirectory staging { "voicescribe-recorder" };
    ManualClock clock;
    VoiceActivityTracker tracker { clock };
    SessionContext context;
    FakeVoiceSession provider;
    RecorderConfig config;

    RecorderFixture()
    {
        context.sessionId = "test";
        context.stagingDirectory = staging.path();
        context.setActive(true);
    }

    auto makeRecorder() -> SegmentRecorder { return SegmentRecorder(config, context, provider, tracker, clock); }
};

TEST_CASE("evaluateTick extends the target while speaking", "[recorder]")
{
    auto const config = RecorderConfig {};
    auto target = 20.0;

    auto const decision =
        SegmentRecorder::evaluateTick(config, 19.5, ActivitySnapshot { .speaking = true }, target);
    CHECK(decision == SegmentDecision::Continue);
    CHECK(target == Catch::Approx(21.5));

    // Never shrinks
    (void) SegmentRecorder::evaluateTick(config, 5.0, ActivitySnapshot { .speaking = true }, target);
    CHECK(target == Catch::Approx(21.5));
}

TEST_CASE("evaluateTick requires both the silence hold and the target", "[recorder]")
{
    auto const config = RecorderConfig {};
    auto target = 20.0;

    auto const quiet = ActivitySnapshot { .speaking = false, .secondsSinceLastSpeech = 5.0 };
    auto const justStopped = ActivitySnapshot { .speaking = false, .secondsSinceLastSpeech = 0.5 };

    CHECK(SegmentRecorder::evaluateTick(config, 19.9, quiet, target) == SegmentDecision::Continue);
    CHECK(SegmentRecorder::evaluateTick(config, 20.0, justStopped, target) == SegmentDecision::Continue);
    CHECK(SegmentRecorder::evaluateTick(config, 20.0, quiet, target) == SegmentDecision::Stop);
    CHECK(target == Catch::Approx(20.0));
}

TEST_CASE("SegmentRecorder stops a quiet segment at the base duration", "[recorder]")
{
    auto fixture = RecorderFixture {};
    auto recorder = fixture.makeRecorder();

    fixture.clock.at(0s, [&] { fixture.tracker.onActivity(true); });
    fixture.clock.at(3s, [&] { fixture.tracker.onActivity(false); });

    auto segment = recorder.runCycle();
    REQUIRE(segment.has_value());
    CHECK(!segment->interrupted);
    CHECK(segment->targetDurationSeconds == Catch::Approx(20.0));
    CHECK(segment->elapsedSeconds == Catch::Approx(20.0));
    CHECK(fixture.clock.elapsed() == Catch::Approx(20.0));
    CHECK(fixture.provider.startCalls == 1);
    CHECK(fixture.provider.stopCalls == 1);
    REQUIRE(segment->files.size() == 1);
    CHECK(std::filesystem::exists(segment->files.front()));
}

TEST_CASE("SegmentRecorder stretches a segment until speech ends", "[recorder]")
{
    auto fixture = RecorderFixture {};
    auto recorder = fixture.makeRecorder();

    // A provider repeats speaking signals while audio keeps arriving.
    for (auto t = 0ms; t <= 25'000ms; t += 500ms)
        fixture.clock.at(t, [&] { fixture.tracker.onActivity(true); });
    fixture.clock.at(25'050ms, [&] { fixture.tracker.onActivity(false); });

    auto segment = recorder.runCycle();
    REQUIRE(segment.has_value());
    CHECK(segment->targetDurationSeconds >= 27.0 - 1e-9);
    CHECK(segment->elapsedSeconds >= 27.0 - 1e-9);
    CHECK(segment->elapsedSeconds == Catch::Approx(27.0));
}

TEST_CASE("SegmentRecorder never stops before the base duration", "[recorder]")
{
    auto fixture = RecorderFixture {};
    fixture.config.baseDurationSeconds = 5.0;
    auto recorder = fixture.makeRecorder();

    // Silent from the very beginning.
    auto segment = recorder.runCycle();
    REQUIRE(segment.has_value());
    CHECK(segment->elapsedSeconds == Catch::Approx(5.0));
}

TEST_CASE("SegmentRecorder ticks honour the segmentation rules under random activity", "[recorder]")
{
    auto fixture = RecorderFixture {};
    fixture.config.baseDurationSeconds = 4.0;
    auto recorder = fixture.makeRecorder();

    auto rng = std::mt19937 { 4711 };
    auto toggle = std::uniform_int_distribution<int>(0, 3);
    auto speaking = false;
    for (auto t = 0ms; t < 120'000ms; t += 250ms)
    {
        if (toggle(rng) == 0)
            speaking = !speaking;
        fixture.clock.at(t, [&tracker = fixture.tracker, speaking] { tracker.onActivity(speaking); });
    }
    fixture.clock.at(120s, [&] { fixture.tracker.onActivity(false); });

    auto const grace = fixture.config.graceSeconds;
    auto ticks = std::vector<RecorderTick> {};
    recorder.setTickObserver([&](const RecorderTick& tick) { ticks.push_back(tick); });

    auto segments = 0;
    while (fixture.clock.elapsed() < 100.0)
    {
        ticks.clear();
        auto segment = recorder.runCycle();
        REQUIRE(segment.has_value());
        ++segments;

        REQUIRE(!ticks.empty());
        for (auto const& tick: ticks)
        {
            if (tick.activity.speaking)
            {
                CHECK(tick.targetDurationSeconds >= tick.elapsedSeconds + grace - 1e-9);
                CHECK(tick.decision == SegmentDecision::Continue);
            }
        }

        auto const& last = ticks.back();
        CHECK(last.decision == SegmentDecision::Stop);
        CHECK(!last.activity.speaking);
        CHECK(last.elapsedSeconds >= fixture.config.baseDurationSeconds - 1e-9);
        CHECK(last.activity.secondsSinceLastSpeech >= fixture.config.silenceHoldSeconds - 1e-9);
    }
    CHECK(segments > 1);
}

TEST_CASE("SegmentRecorder finalizes the capture when the session ends mid-segment", "[recorder]")
{
    auto fixture = RecorderFixture {};
    auto recorder = fixture.makeRecorder();

    fixture.clock.at(0s, [&] { fixture.tracker.onActivity(true); });
    fixture.clock.at(5s, [&] { fixture.context.setActive(false); });

    auto segment = recorder.runCycle();
    REQUIRE(segment.has_value());
    CHECK(segment->interrupted);
    CHECK(segment->elapsedSeconds < 5.0);
    CHECK(fixture.provider.stopCalls == 1);
    CHECK(segment->files.size() == 1);
}

TEST_CASE("SegmentRecorder reports a segment without files when nothing was heard", "[recorder]")
{
    auto fixture = RecorderFixture {};
    fixture.config.baseDurationSeconds = 1.0;
    fixture.provider.segmentBytes = 0;
    auto recorder = fixture.makeRecorder();

    auto segment = recorder.runCycle();
    REQUIRE(segment.has_value());
    CHECK(segment->files.empty());
    CHECK(fixture.staging.fileCount() == 0);
}

TEST_CASE("SegmentRecorder retries failed cycles after a backoff", "[recorder]")
{
    auto fixture = RecorderFixture {};
    fixture.provider.startFailures = 2;
    auto recorder = fixture.makeRecorder();

    auto errors = std::vector<std::string> {};
    log::setCallback([&](log::Level level, std::string_view message) {
        if (level == log::Level::Error)
            errors.emplace_back(message);
    });

    // Two failures cost 1s of backoff, the first segment ends at 21s and the second is cut short.
    fixture.clock.at(25s, [&] { fixture.context.setActive(false); });
    recorder.run();
    log::setCallback({});

    CHECK(recorder.failedCycles() == 2);
    CHECK(recorder.completedSegments() == 2);
    CHECK(fixture.provider.startCalls == 4);
    CHECK(fixture.provider.stopCalls == 2);
    CHECK(fixture.clock.elapsed() == Catch::Approx(25.0));

    REQUIRE(errors.size() == 2);
    CHECK(errors[0].find("Error in recording cycle") != std::string::npos);
    CHECK(errors[0].find("Capture device busy") != std::string::npos);
}

TEST_CASE("SegmentRecorder survives a failed flush", "[recorder]")
{
    auto fixture = RecorderFixture {};
    fixture.config.baseDurationSeconds = 2.0;
    fixture.provider.stopFailures = 1;
    auto recorder = fixture.makeRecorder();

    auto first = recorder.runCycle();
    REQUIRE(!first.has_value());
    CHECK(first.error().code == ErrorCode::CaptureError);

    // The provider is no longer capturing, so the next cycle starts cleanly.
    auto second = recorder.runCycle();
    REQUIRE(second.has_value());
    CHECK(fixture.provider.overlappingCaptures == 0);
    CHECK(second->sequence == 2);
}
