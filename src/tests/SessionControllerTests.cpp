// SPDX-License-Identifier: Apache-2.0
#include <pipeline/SessionController.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include "TestDoubles.hpp"

using namespace voicescribe;
using namespace voicescribe::testing;
using namespace std::chrono_literals;

namespace
{
    template <typename Predicate>
    auto waitUntil(Predicate predicate, std::chrono::milliseconds timeout = 5000ms) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate())
        {
            if (std::chrono::steady_clock::now() > deadline)
                return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }
} // namespace

/// @brief Real threads and a real clock, scaled down to milliseconds.
struct SessionFixture
{
    TempDirectory dir { "voicescribe-session" };
    SteadyClock clock;
    FakeVoiceSession provider;
    FakeTranscriptionEngine engine;
    FakeParticipantDirectory directory;
    CachingNameResolver names { directory };
    RecordingSink sink;

    SessionFixture() { directory.names = { { "7", "Alice" } }; }

    [[nodiscard]] auto stagingDirectory() const -> std::filesystem::path { return dir.path() / "recordings"; }

    auto makeController() -> SessionController
    {
        return SessionController(
            SessionConfig {
                .stagingDirectory = stagingDirectory(),
                .sessionId = "guild-1",
                .selfParticipantId = "99",
                .settlePeriod = 50ms,
            },
            RecorderConfig {
                .baseDurationSeconds = 0.05,
                .graceSeconds = 0.02,
                .silenceHoldSeconds = 0.01,
                .tickInterval = 5ms,
                .retryBackoff = 10ms,
            },
            SweeperConfig {
                .tickInterval = 10ms,
                .settleThreshold = 20ms,
                .minimumBytes = 1024,
                .transcriptionTimeout = 1000ms,
            },
            DecodingOptions {},
            SessionCollaborators {
                .provider = provider,
                .engine = engine,
                .names = names,
                .sink = sink,
                .clock = clock,
            });
    }
};

TEST_CASE("SessionController records and transcribes until stopped", "[session]")
{
    auto fixture = SessionFixture {};
    auto controller = fixture.makeController();

    auto started = controller.start();
    REQUIRE(started.has_value());
    CHECK(controller.isActive());
    CHECK(fixture.provider.isConnected());
    CHECK(std::filesystem::is_directory(fixture.stagingDirectory()));

    REQUIRE(waitUntil([&] { return fixture.sink.size() >= 2; }));
    controller.stop();

    CHECK(!controller.isActive());
    CHECK(!fixture.provider.isConnected());
    CHECK(fixture.provider.disconnectCalls == 1);
    CHECK(!fixture.provider.hasActivityHandler());
    CHECK(fixture.provider.overlappingCaptures == 0);
    CHECK(controller.recorder().completedSegments() >= 2);

    for (auto const& event: fixture.sink.events())
    {
        CHECK(event.participantId == "7");
        CHECK(event.displayName == "Alice");
        CHECK(event.text == "hello world");
    }

    // The final sweep picked up the segment that was cut short by stop().
    auto remaining = size_t { 0 };
    for ([[maybe_unused]] auto const& entry: std::filesystem::directory_iterator(fixture.stagingDirectory()))
        ++remaining;
    CHECK(remaining == 0);
    CHECK(fixture.engine.calls().size() == fixture.provider.published().size());
}

TEST_CASE("SessionController aborts start when the voice session cannot connect", "[session]")
{
    auto fixture = SessionFixture {};
    fixture.provider.failConnect = true;
    auto controller = fixture.makeController();

    auto started = controller.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::AudioError);
    CHECK(!controller.isActive());
    CHECK(fixture.provider.startCalls == 0);

    controller.stop();
    CHECK(fixture.provider.disconnectCalls == 0);
}

TEST_CASE("SessionController restart never runs two recorders at once", "[session]")
{
    auto fixture = SessionFixture {};
    auto controller = fixture.makeController();

    REQUIRE(controller.start().has_value());
    REQUIRE(waitUntil([&] { return fixture.provider.startCalls >= 2; }));

    REQUIRE(controller.start().has_value());
    auto const callsAfterRestart = fixture.provider.startCalls.load();
    REQUIRE(waitUntil([&] { return fixture.provider.startCalls > callsAfterRestart + 1; }));
    CHECK(controller.isActive());

    controller.stop();
    CHECK(fixture.provider.overlappingCaptures == 0);
    CHECK(fixture.provider.connectCalls == 1);
    CHECK(fixture.provider.startCalls.load() == fixture.provider.stopCalls.load());
}

TEST_CASE("SessionController ignores its own voice activity", "[session]")
{
    auto fixture = SessionFixture {};
    auto controller = fixture.makeController();

    controller.onVoiceActivity(VoiceActivityEvent { .participantId = "99", .speaking = true });
    CHECK(!controller.tracker().isSpeaking());

    controller.onVoiceActivity(VoiceActivityEvent { .participantId = "7", .speaking = true });
    CHECK(controller.tracker().isSpeaking());

    controller.onVoiceActivity(VoiceActivityEvent { .participantId = "7", .speaking = false });
    CHECK(!controller.tracker().isSpeaking());
}

TEST_CASE("SessionController routes provider activity into the tracker", "[session]")
{
    auto fixture = SessionFixture {};
    auto controller = fixture.makeController();
    REQUIRE(controller.start().has_value());

    fixture.provider.emitActivity(VoiceActivityEvent { .participantId = "7", .speaking = true });
    CHECK(controller.tracker().isSpeaking());

    fixture.provider.emitActivity(VoiceActivityEvent { .participantId = "99", .speaking = false });
    CHECK(controller.tracker().isSpeaking());

    controller.stop();
    CHECK(!controller.tracker().isSpeaking());
}

TEST_CASE("SessionController stops on destruction", "[session]")
{
    auto fixture = SessionFixture {};
    {
        auto controller = fixture.makeController();
        REQUIRE(controller.start().has_value());
        REQUIRE(waitUntil([&] { return fixture.provider.startCalls >= 1; }));
    }
    CHECK(!fixture.provider.isConnected());
    CHECK(fixture.provider.disconnectCalls == 1);
    CHECK(fixture.provider.startCalls.load() == fixture.provider.stopCalls.load());
}
