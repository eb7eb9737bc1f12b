// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <voicescribe/App.hpp>
#include <voicescribe/Config.hpp>

#include <CLI/CLI.hpp>

#include <filesystem>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "voicescribe - segments live speech and transcribes it with whisper.cpp" };

    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto stagingDir = std::string {};
    auto deviceName = std::string {};
    auto participantId = std::string {};
    auto transcriptLog = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;
    auto initConfig = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--model", modelPath, "Path to whisper.cpp model file");
    app.add_option("-d,--staging-dir", stagingDir, "Directory for finished segment files");
    app.add_option("--device", deviceName, "Capture device name filter (case-insensitive substring)");
    app.add_option("--participant", participantId, "Participant id local audio is attributed to");
    app.add_option("--transcript-log", transcriptLog, "Append transcripts as JSON lines to this file");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--init-config", initConfig, "Write a config template and exit");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        voicescribe::log::setLevel(voicescribe::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = voicescribe::log::levelFromString(logLevel);
        if (!level)
        {
            voicescribe::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        voicescribe::log::setLevel(*level);
    }

    if (initConfig)
    {
        auto const path = configPath.empty() ? voicescribe::defaultConfigPath() : configPath;
        if (std::filesystem::exists(path))
        {
            voicescribe::log::error("Refusing to overwrite existing config file {}", path);
            return 1;
        }
        auto saved = voicescribe::saveConfigToFile(path, voicescribe::AppConfig {});
        if (!saved)
        {
            voicescribe::log::error("Failed to write config template: {}", saved.error().message);
            return 1;
        }
        std::println("Created config template at {}. Set whisper.modelPath before running.", path);
        return 0;
    }

    // Load config
    auto configResult =
        configPath.empty() ? voicescribe::loadConfig() : voicescribe::loadConfigFromFile(configPath);

    if (!configResult)
    {
        voicescribe::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!modelPath.empty())
        config.engine.whisper.modelPath = modelPath;
    if (!stagingDir.empty())
        config.session.stagingDirectory = stagingDir;
    if (!deviceName.empty())
        config.capture.deviceName = deviceName;
    if (!participantId.empty())
        config.capture.participantId = participantId;
    if (!transcriptLog.empty())
        config.output.transcriptLogPath = transcriptLog;

    auto application = voicescribe::App(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        voicescribe::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run();
}
