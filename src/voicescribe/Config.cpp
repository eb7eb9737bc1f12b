// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <pipeline/StagingArea.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace voicescribe
{

namespace
{

    auto millisecondsOr(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds defaultValue)
        -> std::chrono::milliseconds
    {
        auto const value = json::getUInt64Or(obj, key, static_cast<std::uint64_t>(defaultValue.count()));
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
    }

    auto floatOr(const nlohmann::json& obj, std::string_view key, float defaultValue) -> float
    {
        return static_cast<float>(json::getDoubleOr(obj, key, defaultValue));
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voicescribe";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voicescribe";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/voicescribe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voicescribe";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const fail = [](std::string_view field, std::string_view why) {
        return makeError(ErrorCode::ConfigError, std::format("Invalid {}: {}", field, why));
    };

    if (config.recorder.baseDurationSeconds <= 0.0)
        return fail("recorder.baseDurationSeconds", "must be positive");
    if (config.recorder.graceSeconds < 0.0)
        return fail("recorder.graceSeconds", "must not be negative");
    if (config.recorder.silenceHoldSeconds < 0.0)
        return fail("recorder.silenceHoldSeconds", "must not be negative");
    if (config.recorder.tickInterval.count() <= 0)
        return fail("recorder.tickIntervalMs", "must be positive");
    if (config.sweeper.tickInterval.count() <= 0)
        return fail("sweeper.tickIntervalMs", "must be positive");
    if (config.sweeper.transcriptionTimeout.count() <= 0)
        return fail("sweeper.transcriptionTimeoutMs", "must be positive");
    if (config.session.stagingDirectory.empty())
        return fail("session.stagingDirectory", "must not be empty");
    if (!isValidParticipantId(config.capture.participantId))
        return fail("capture.participantId", "only letters, digits and '-' are allowed");
    if (config.engine.decoding.threads <= 0)
        return fail("whisper.threads", "must be positive");
    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};

    // Recorder section
    {
        auto const recorder = json::section(root, "recorder");
        auto& r = config.recorder;
        r.baseDurationSeconds = json::getDoubleOr(recorder, "baseDurationSeconds", r.baseDurationSeconds);
        r.graceSeconds = json::getDoubleOr(recorder, "graceSeconds", r.graceSeconds);
        r.silenceHoldSeconds = json::getDoubleOr(recorder, "silenceHoldSeconds", r.silenceHoldSeconds);
        r.tickInterval = millisecondsOr(recorder, "tickIntervalMs", r.tickInterval);
        r.retryBackoff = millisecondsOr(recorder, "retryBackoffMs", r.retryBackoff);

        auto const encodingName = json::getStringOr(recorder, "encoding", "wav");
        auto const encoding = encodingFromString(encodingName);
        if (!encoding)
            return makeError(ErrorCode::ConfigError, std::format("Unsupported recorder.encoding: {}", encodingName));
        config.session.encoding = *encoding;
    }

    // Sweeper section
    {
        auto const sweeper = json::section(root, "sweeper");
        auto& s = config.sweeper;
        s.tickInterval = millisecondsOr(sweeper, "tickIntervalMs", s.tickInterval);
        s.settleThreshold = millisecondsOr(sweeper, "settleThresholdMs", s.settleThreshold);
        s.minimumBytes = json::getUInt64Or(sweeper, "minimumBytes", s.minimumBytes);
        s.transcriptionTimeout = millisecondsOr(sweeper, "transcriptionTimeoutMs", s.transcriptionTimeout);
    }

    // Session section
    {
        auto const session = json::section(root, "session");
        auto& s = config.session;
        s.stagingDirectory = json::getStringOr(session, "stagingDirectory", s.stagingDirectory.string());
        s.settlePeriod = millisecondsOr(session, "settlePeriodMs", s.settlePeriod);
        s.sessionId = json::getStringOr(session, "sessionId", s.sessionId);
        s.selfParticipantId = json::getStringOr(session, "selfParticipantId", s.selfParticipantId);
    }

    // Whisper section
    {
        auto const whisper = json::section(root, "whisper");
        auto& w = config.engine.whisper;
        auto& d = config.engine.decoding;
        w.modelPath = json::getStringOr(whisper, "modelPath", "");
        w.useGpu = json::getBoolOr(whisper, "useGpu", w.useGpu);
        d.language = json::getStringOr(whisper, "language", d.language);
        d.translate = json::getBoolOr(whisper, "translate", d.translate);
        d.threads = json::getIntOr(whisper, "threads", d.threads);
        d.initialPrompt = json::getStringOr(whisper, "initialPrompt", d.initialPrompt);
        d.temperature = floatOr(whisper, "temperature", d.temperature);
        d.temperatureIncrement = floatOr(whisper, "temperatureIncrement", d.temperatureIncrement);
        d.entropyThreshold = floatOr(whisper, "entropyThreshold", d.entropyThreshold);
        d.logprobThreshold = floatOr(whisper, "logprobThreshold", d.logprobThreshold);
        d.noSpeechThreshold = floatOr(whisper, "noSpeechThreshold", d.noSpeechThreshold);
    }

    // Capture section
    {
        auto const capture = json::section(root, "capture");
        auto& c = config.capture;
        c.deviceName = json::getStringOr(capture, "deviceName", "");
        c.participantId = json::getStringOr(capture, "participantId", c.participantId);
        c.vad.speechThreshold = floatOr(capture, "vadThreshold", c.vad.speechThreshold);
        c.vad.energyThreshold = floatOr(capture, "energyThreshold", c.vad.energyThreshold);
        c.vad.releaseMs = static_cast<unsigned>(json::getUInt64Or(capture, "releaseMs", c.vad.releaseMs));
    }

    config.participants = json::getStringMap(root, "participants");

    // Output section
    config.output.transcriptLogPath = json::getStringOr(json::section(root, "output"), "transcriptLogPath", "");

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    root["recorder"] = {
        { "baseDurationSeconds", config.recorder.baseDurationSeconds },
        { "graceSeconds", config.recorder.graceSeconds },
        { "silenceHoldSeconds", config.recorder.silenceHoldSeconds },
        { "tickIntervalMs", config.recorder.tickInterval.count() },
        { "retryBackoffMs", config.recorder.retryBackoff.count() },
        { "encoding", std::string(encodingToString(config.session.encoding)) },
    };

    root["sweeper"] = {
        { "tickIntervalMs", config.sweeper.tickInterval.count() },
        { "settleThresholdMs", config.sweeper.settleThreshold.count() },
        { "minimumBytes", config.sweeper.minimumBytes },
        { "transcriptionTimeoutMs", config.sweeper.transcriptionTimeout.count() },
    };

    root["session"] = {
        { "stagingDirectory", config.session.stagingDirectory.string() },
        { "settlePeriodMs", config.session.settlePeriod.count() },
        { "sessionId", config.session.sessionId },
        { "selfParticipantId", config.session.selfParticipantId },
    };

    auto const& decoding = config.engine.decoding;
    root["whisper"] = {
        { "modelPath", config.engine.whisper.modelPath },
        { "useGpu", config.engine.whisper.useGpu },
        { "language", decoding.language },
        { "translate", decoding.translate },
        { "threads", decoding.threads },
        { "initialPrompt", decoding.initialPrompt },
        { "temperature", decoding.temperature },
        { "temperatureIncrement", decoding.temperatureIncrement },
        { "entropyThreshold", decoding.entropyThreshold },
        { "logprobThreshold", decoding.logprobThreshold },
        { "noSpeechThreshold", decoding.noSpeechThreshold },
    };

    auto capture = nlohmann::json::object();
    if (!config.capture.deviceName.empty())
        capture["deviceName"] = config.capture.deviceName;
    capture["participantId"] = config.capture.participantId;
    capture["vadThreshold"] = config.capture.vad.speechThreshold;
    capture["energyThreshold"] = config.capture.vad.energyThreshold;
    capture["releaseMs"] = config.capture.vad.releaseMs;
    root["capture"] = std::move(capture);

    auto participants = nlohmann::json::object();
    for (auto const& [id, name]: config.participants)
        participants[id] = name;
    root["participants"] = std::move(participants);

    auto output = nlohmann::json::object();
    if (!config.output.transcriptLogPath.empty())
        output["transcriptLogPath"] = config.output.transcriptLogPath;
    root["output"] = std::move(output);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace voicescribe
