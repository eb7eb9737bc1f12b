// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>

namespace voicescribe
{

/// @brief Monotonic time source and sleeper shared by the pipeline loops.
///
/// Loops never read std::chrono directly; tests substitute a virtual clock whose
/// sleepFor() advances time instantly.
class Clock
{
  public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    /// @brief Returns the current monotonic time.
    [[nodiscard]] virtual auto now() const -> TimePoint = 0;

    /// @brief Suspends the calling loop for the given duration.
    virtual void sleepFor(Duration duration) = 0;
};

/// @brief Clock backed by std::chrono::steady_clock and std::this_thread::sleep_for.
class SteadyClock final: public Clock
{
  public:
    [[nodiscard]] auto now() const -> TimePoint override;
    void sleepFor(Duration duration) override;
};

/// @brief Floating point seconds, the unit the recorder thresholds are expressed in.
using Seconds = std::chrono::duration<double>;

/// @brief Converts a clock duration to floating point seconds.
[[nodiscard]] inline auto toSeconds(Clock::Duration duration) -> double
{
    return std::chrono::duration_cast<Seconds>(duration).count();
}

} // namespace voicescribe
