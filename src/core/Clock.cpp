// SPDX-License-Identifier: Apache-2.0
#include "Clock.hpp"

#include <thread>

namespace voicescribe
{

auto SteadyClock::now() const -> TimePoint
{
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepFor(Duration duration)
{
    if (duration > Duration::zero())
        std::this_thread::sleep_for(duration);
}

} // namespace voicescribe
