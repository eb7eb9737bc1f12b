// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/TranscriptionEngine.hpp>

#include <memory>
#include <string>

namespace voicescribe
{

/// @brief Model-level settings of the whisper.cpp engine.
struct WhisperConfig
{
    std::string modelPath;

    /// @brief Run on the GPU (half precision) when whisper.cpp was built with GPU support.
    bool useGpu = true;
};

/// @brief Speech-to-text on segment files using whisper.cpp.
class WhisperEngine final: public TranscriptionEngine
{
  public:
    WhisperEngine();
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    /// @brief Loads the whisper model.
    /// @param config Engine configuration.
    /// @return Success or a ModelLoadError.
    [[nodiscard]] auto initialize(const WhisperConfig& config) -> VoidResult;

    /// @brief Decodes the file to 16 kHz mono and transcribes it.
    ///
    /// The decode is aborted once @p timeout has passed. Non-speech markers such as
    /// "[BLANK_AUDIO]" come back as empty text.
    [[nodiscard]] auto transcribe(const std::filesystem::path& file,
                                  const DecodingOptions& options,
                                  std::chrono::milliseconds timeout) -> Result<std::string> override;

    /// @brief Returns true if the model is loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicescribe
