// SPDX-License-Identifier: Apache-2.0
#include "SessionController.hpp"

#include <core/Log.hpp>
#include <pipeline/SessionContext.hpp>
#include <pipeline/StagingArea.hpp>

#include <thread>

namespace voicescribe
{

struct SessionController::Impl
{
    SessionConfig config;
    SessionCollaborators collaborators;

    SessionContext context;
    VoiceActivityTracker tracker;
    StagingArea staging;
    SegmentRecorder recorder;
    TranscriptionSweeper sweeper;

    std::jthread recorderThread;
    std::jthread sweeperThread;

    Impl(SessionConfig sessionConfig,
         RecorderConfig recorderConfig,
         SweeperConfig sweeperConfig,
         DecodingOptions decoding,
         SessionCollaborators deps):
        config(std::move(sessionConfig)),
        collaborators(deps),
        tracker(deps.clock),
        staging(config.stagingDirectory, config.encoding),
        recorder(recorderConfig, context, deps.provider, tracker, deps.clock),
        sweeper(sweeperConfig,
                std::move(decoding),
                context,
                staging,
                tracker,
                deps.engine,
                deps.names,
                deps.sink,
                deps.clock)
    {
        context.sessionId = config.sessionId;
        context.stagingDirectory = config.stagingDirectory;
        context.encoding = config.encoding;
    }

    [[nodiscard]] auto loopsRunning() const -> bool
    {
        return recorderThread.joinable() || sweeperThread.joinable();
    }

    /// @brief Deactivates the session and waits for both loops to exit.
    void haltLoops()
    {
        context.setActive(false);
        collaborators.clock.sleepFor(config.settlePeriod);

        // The settle period normally suffices; joining covers a cycle that is still flushing.
        if (recorderThread.joinable())
            recorderThread.join();
        if (sweeperThread.joinable())
            sweeperThread.join();
    }
};

SessionController::SessionController(SessionConfig session,
                                     RecorderConfig recorder,
                                     SweeperConfig sweeper,
                                     DecodingOptions decoding,
                                     SessionCollaborators collaborators):
    _impl(std::make_unique<Impl>(
        std::move(session), recorder, sweeper, std::move(decoding), collaborators))
{
}

SessionController::~SessionController()
{
    stop();
}

auto SessionController::start() -> VoidResult
{
    if (_impl->loopsRunning())
    {
        log::info("Session already active, restarting");
        _impl->haltLoops();
    }

    if (auto ensured = _impl->staging.ensureExists(_impl->sweeper.config().settleThreshold); !ensured)
        return ensured;

    auto& provider = _impl->collaborators.provider;
    if (!provider.isConnected())
    {
        provider.setActivityHandler([this](const VoiceActivityEvent& event) { onVoiceActivity(event); });

        auto connected = provider.connect();
        if (!connected)
        {
            log::error("Failed to join voice session: {}", connected.error().message);
            return connected;
        }
    }

    _impl->tracker.reset();
    _impl->context.setActive(true);

    _impl->recorderThread = std::jthread([this] { _impl->recorder.run(); });
    _impl->sweeperThread = std::jthread([this] { _impl->sweeper.run(); });

    log::info("Session '{}' started, staging segments in {}",
              _impl->config.sessionId,
              _impl->config.stagingDirectory.string());
    return {};
}

void SessionController::stop()
{
    if (!_impl->loopsRunning() && !_impl->collaborators.provider.isConnected())
        return;

    _impl->haltLoops();
    _impl->tracker.reset();

    auto const drained = _impl->sweeper.sweepOnce();
    if (drained.observed > 0)
        log::info("Final sweep: {} transcribed, {} left in staging", drained.transcribed, drained.deferred);

    _impl->collaborators.provider.disconnect();
    _impl->collaborators.provider.setActivityHandler({});
    log::info("Session '{}' stopped", _impl->config.sessionId);
}

auto SessionController::isActive() const -> bool
{
    return _impl->context.isActive();
}

void SessionController::onVoiceActivity(const VoiceActivityEvent& event)
{
    if (!_impl->config.selfParticipantId.empty() && event.participantId == _impl->config.selfParticipantId)
        return;

    _impl->tracker.onActivity(event.speaking);
    log::trace("Participant {} {} speaking", event.participantId, event.speaking ? "started" : "stopped");
}

auto SessionController::tracker() const -> const VoiceActivityTracker&
{
    return _impl->tracker;
}

auto SessionController::recorder() -> SegmentRecorder&
{
    return _impl->recorder;
}

auto SessionController::sweeper() -> TranscriptionSweeper&
{
    return _impl->sweeper;
}

} // namespace voicescribe
