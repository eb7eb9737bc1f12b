// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <voicescribe/Config.hpp>

#include <memory>

namespace voicescribe
{

/// @brief Wires the microphone session, whisper engine, name resolution and sinks into a
/// SessionController and runs it until interrupted.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the model and opens the transcript log.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Starts the session and blocks until SIGINT/SIGTERM, then stops it.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicescribe
