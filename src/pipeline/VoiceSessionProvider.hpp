// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <functional>
#include <vector>

namespace voicescribe
{

/// @brief Callback receiving voice-activity signals. Invoked on the provider's event thread;
/// it must return quickly and never wait on the pipeline loops.
using ActivityHandler = std::function<void(const VoiceActivityEvent& event)>;

/// @brief Abstract voice session: connection, segment capture and voice-activity events.
///
/// Finished segment files are named with formatStagingFileName() and published atomically
/// (written under a temporary name, then renamed), so a consumer never sees a partial file
/// under its final name.
class VoiceSessionProvider
{
  public:
    virtual ~VoiceSessionProvider() = default;

    /// @brief Installs the activity handler. Must be called before connect().
    virtual void setActivityHandler(ActivityHandler handler) = 0;

    /// @brief Connects to the voice session.
    /// @return Success, or an error if required setup (e.g. a capture device) is missing.
    [[nodiscard]] virtual auto connect() -> VoidResult = 0;

    /// @brief Disconnects; any capture in progress is discarded.
    virtual void disconnect() = 0;

    /// @brief Returns true while connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Begins capturing a new segment into the given directory.
    /// @param directory The staging directory the finished files go to.
    /// @param encoding The container format of the finished files.
    /// @return Success or a CaptureError.
    [[nodiscard]] virtual auto startCapture(const std::filesystem::path& directory, CaptureEncoding encoding)
        -> VoidResult = 0;

    /// @brief Ends the current capture and flushes it to the staging directory.
    ///
    /// Returns only once the files are durably written.
    /// @return The finished files (possibly none, if nothing was heard) or a CaptureError.
    [[nodiscard]] virtual auto stopCapture() -> Result<std::vector<std::filesystem::path>> = 0;
};

} // namespace voicescribe
