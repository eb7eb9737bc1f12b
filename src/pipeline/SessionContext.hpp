// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <atomic>
#include <filesystem>
#include <string>

namespace voicescribe
{

/// @brief State shared by the recorder and sweeper loops of one session.
///
/// Only SessionController writes `active`; both loops read it every tick. Clearing it is
/// the sole way to stop them.
struct SessionContext
{
    std::string sessionId;
    std::filesystem::path stagingDirectory;
    CaptureEncoding encoding = CaptureEncoding::Wav;
    std::atomic<bool> active = false;

    [[nodiscard]] auto isActive() const -> bool { return active.load(std::memory_order_acquire); }

    void setActive(bool value) { active.store(value, std::memory_order_release); }
};

} // namespace voicescribe
