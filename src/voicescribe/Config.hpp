// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/MicrophoneVoiceSession.hpp>
#include <audio/WhisperEngine.hpp>
#include <core/Error.hpp>
#include <pipeline/SegmentRecorder.hpp>
#include <pipeline/SessionController.hpp>
#include <pipeline/TranscriptionEngine.hpp>
#include <pipeline/TranscriptionSweeper.hpp>

#include <map>
#include <string>
#include <string_view>

namespace voicescribe
{

/// @brief Transcription engine section: model settings plus the per-segment decoding options.
struct EngineConfig
{
    WhisperConfig whisper;
    DecodingOptions decoding;
};

/// @brief Where transcripts go besides the console.
struct OutputConfig
{
    /// @brief JSON-lines transcript log; empty disables it.
    std::string transcriptLogPath;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    RecorderConfig recorder;
    SweeperConfig sweeper;
    SessionConfig session;
    EngineConfig engine;
    MicrophoneConfig capture;

    /// @brief Display names by participant id.
    std::map<ParticipantId, std::string> participants;

    OutputConfig output;
};

/// @brief Checks the configuration for values the pipeline cannot run with.
/// @return Success or a ConfigError naming the first offending field.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Loads the application configuration from the default config path.
///
/// A missing file yields the defaults.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating parent directories.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace voicescribe
