// SPDX-License-Identifier: Apache-2.0
#include "WhisperEngine.hpp"

#include <audio/WavFile.hpp>
#include <core/Log.hpp>

#include <whisper.h>

#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace voicescribe
{

namespace
{

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};

    /// @brief Maps ggml_log_level to voicescribe::log::Level.
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            // whisper.cpp is chatty at info level; keep it out of the session log.
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp log output to voicescribe::log, one complete line at a time.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = trimWhitespace(std::string_view(whisperLineBuffer).substr(0, nlPos));
            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), std::format("whisper: {}", line));

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    struct AbortDeadline
    {
        std::chrono::steady_clock::time_point deadline;
        bool expired = false;
    };

    auto abortWhenExpired(void* userData) -> bool
    {
        auto* state = static_cast<AbortDeadline*>(userData);
        if (std::chrono::steady_clock::now() >= state->deadline)
            state->expired = true;
        return state->expired;
    }

} // namespace

struct WhisperEngine::Impl
{
    whisper_context* ctx = nullptr;
    WhisperConfig config;
    std::mutex mutex;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperEngine::WhisperEngine(): _impl(std::make_unique<Impl>())
{
}

WhisperEngine::~WhisperEngine() = default;

auto WhisperEngine::initialize(const WhisperConfig& config) -> VoidResult
{
    if (config.modelPath.empty())
        return makeError(ErrorCode::ModelLoadError, "No whisper model configured (whisper.modelPath)");

    auto lock = std::lock_guard(_impl->mutex);
    _impl->config = config;

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    params.use_gpu = config.useGpu;
    _impl->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to load whisper model: {}", config.modelPath));

    log::info("Whisper model loaded: {} (gpu: {})", config.modelPath, config.useGpu);
    return {};
}

auto WhisperEngine::transcribe(const std::filesystem::path& file,
                               const DecodingOptions& options,
                               std::chrono::milliseconds timeout) -> Result<std::string>
{
    auto samples = readSpeechSamples(file);
    if (!samples)
        return makeError(ErrorCode::TranscriptionError, samples.error().message);
    if (samples->empty())
        return std::string {};

    auto lock = std::lock_guard(_impl->mutex);
    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");

    auto abort = AbortDeadline { .deadline = std::chrono::steady_clock::now() + timeout };

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = options.language.c_str();
    params.translate = options.translate;
    params.n_threads = options.threads;
    params.no_context = !options.conditionOnPreviousText;
    params.initial_prompt = options.initialPrompt.empty() ? nullptr : options.initialPrompt.c_str();
    params.temperature = options.temperature;
    params.temperature_inc = options.temperatureIncrement;
    params.entropy_thold = options.entropyThreshold;
    params.logprob_thold = options.logprobThreshold;
    params.no_speech_thold = options.noSpeechThreshold;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.abort_callback = abortWhenExpired;
    params.abort_callback_user_data = &abort;

    auto const result = whisper_full(_impl->ctx, params, samples->data(), static_cast<int>(samples->size()));

    if (abort.expired)
        return makeError(ErrorCode::TimeoutError,
                         std::format("Transcription of {} exceeded {} ms", file.filename().string(), timeout.count()));
    if (result != 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));

    auto const nSegments = whisper_full_n_segments(_impl->ctx);
    auto text = std::string {};
    for (auto i = 0; i < nSegments; ++i)
    {
        auto const* segmentText = whisper_full_get_segment_text(_impl->ctx, i);
        if (segmentText)
            text += segmentText;
    }

    text = trimWhitespace(text);
    if (isNonSpeechMarker(text))
        return std::string {};
    return text;
}

auto WhisperEngine::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

} // namespace voicescribe
