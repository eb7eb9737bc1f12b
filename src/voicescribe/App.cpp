// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/MicrophoneVoiceSession.hpp>
#include <audio/WhisperEngine.hpp>
#include <core/Clock.hpp>
#include <core/Log.hpp>
#include <output/TranscriptSinks.hpp>
#include <pipeline/NameResolver.hpp>
#include <pipeline/SessionController.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <optional>
#include <print>

namespace voicescribe
{

namespace
{
    auto interruptRequested = std::atomic<bool> { false };

    static_assert(std::atomic<bool>::is_always_lock_free);

    void handleInterrupt(int /*signal*/)
    {
        interruptRequested.store(true);
    }
} // namespace

struct App::Impl
{
    AppConfig config;

    SteadyClock clock;
    MicrophoneVoiceSession microphone;
    WhisperEngine engine;
    StaticParticipantDirectory directory;
    CachingNameResolver names;
    ConsoleSink console;
    JsonLinesSink transcriptLog;
    FanOutSink sinks;
    std::optional<SessionController> session;

    explicit Impl(AppConfig cfg):
        config(std::move(cfg)), microphone(config.capture), directory(config.participants), names(directory)
    {
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto& impl = *_impl;

    if (auto valid = validateConfig(impl.config); !valid)
        return valid;

    auto loaded = impl.engine.initialize(impl.config.engine.whisper);
    if (!loaded)
        return loaded;

    impl.sinks.add(impl.console);
    if (!impl.config.output.transcriptLogPath.empty())
    {
        auto opened = impl.transcriptLog.open(impl.config.output.transcriptLogPath);
        if (!opened)
            return opened;
        impl.sinks.add(impl.transcriptLog);
    }

    impl.session.emplace(impl.config.session,
                         impl.config.recorder,
                         impl.config.sweeper,
                         impl.config.engine.decoding,
                         SessionCollaborators {
                             .provider = impl.microphone,
                             .engine = impl.engine,
                             .names = impl.names,
                             .sink = impl.sinks,
                             .clock = impl.clock,
                         });
    return {};
}

auto App::run() -> int
{
    if (!_impl->session)
    {
        log::error("App::run() called before initialize()");
        return 1;
    }

    auto& session = *_impl->session;

    auto started = session.start();
    if (!started)
    {
        std::println(stderr, "Failed to start transcription session: {}", started.error().message);
        return 1;
    }

    std::println(stderr, "Transcribing into {} - press Ctrl+C to stop.",
                 _impl->config.session.stagingDirectory.string());

    interruptRequested = false;
    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    while (!interruptRequested.load())
        _impl->clock.sleepFor(std::chrono::milliseconds(200));

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    log::info("Interrupted, stopping session");
    session.stop();
    return 0;
}

} // namespace voicescribe
