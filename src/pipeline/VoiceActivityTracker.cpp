// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityTracker.hpp"

#include <algorithm>

namespace voicescribe
{

namespace
{
    // Bit 63 holds the speaking flag, bits 0..62 the last speech time in clock ticks.
    constexpr auto SpeakingBit = std::uint64_t { 1 } << 63;
    constexpr auto TimestampMask = SpeakingBit - 1;

    auto decodeTimestamp(std::uint64_t state) -> Clock::TimePoint
    {
        return Clock::TimePoint(Clock::Duration(static_cast<Clock::Duration::rep>(state & TimestampMask)));
    }
} // namespace

VoiceActivityTracker::VoiceActivityTracker(const Clock& clock): _clock(clock), _state(encode(false, clock.now()))
{
}

auto VoiceActivityTracker::encode(bool speaking, Clock::TimePoint lastSpeech) const -> std::uint64_t
{
    auto const ticks = std::max<Clock::Duration::rep>(0, lastSpeech.time_since_epoch().count());
    return (static_cast<std::uint64_t>(ticks) & TimestampMask) | (speaking ? SpeakingBit : 0);
}

void VoiceActivityTracker::onActivity(bool speaking)
{
    if (speaking)
    {
        _state.store(encode(true, _clock.now()), std::memory_order_release);
        return;
    }

    // Clear the flag while keeping the timestamp of the last speaking signal.
    _state.fetch_and(TimestampMask, std::memory_order_acq_rel);
}

auto VoiceActivityTracker::snapshot() const -> ActivitySnapshot
{
    auto const state = _state.load(std::memory_order_acquire);
    auto const since = _clock.now() - decodeTimestamp(state);
    return ActivitySnapshot {
        .speaking = (state & SpeakingBit) != 0,
        .secondsSinceLastSpeech = std::max(0.0, toSeconds(since)),
    };
}

auto VoiceActivityTracker::isSpeaking() const -> bool
{
    return (_state.load(std::memory_order_acquire) & SpeakingBit) != 0;
}

void VoiceActivityTracker::reset()
{
    _state.store(encode(false, _clock.now()), std::memory_order_release);
}

} // namespace voicescribe
