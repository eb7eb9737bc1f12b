// SPDX-License-Identifier: Apache-2.0
#include "NameResolver.hpp"

#include <core/Log.hpp>

#include <format>

namespace voicescribe
{

StaticParticipantDirectory::StaticParticipantDirectory(std::map<ParticipantId, std::string> names):
    _names(std::move(names))
{
}

auto StaticParticipantDirectory::resolve(const ParticipantId& participantId, std::string_view /*sessionId*/)
    -> Result<std::string>
{
    auto const it = _names.find(participantId);
    if (it == _names.end() || it->second.empty())
        return makeError(ErrorCode::LookupError, std::format("Unknown participant: {}", participantId));
    return it->second;
}

CachingNameResolver::CachingNameResolver(ParticipantDirectory& directory): _directory(directory)
{
}

auto CachingNameResolver::displayName(const ParticipantId& participantId, std::string_view sessionId)
    -> std::string
{
    auto const key = std::format("{}_{}", participantId, sessionId);

    {
        auto lock = std::lock_guard(_mutex);
        if (auto const it = _cache.find(key); it != _cache.end())
            return it->second;
    }

    // The directory may call out; do not hold the lock across it.
    auto result = _directory.resolve(participantId, sessionId);
    if (!result)
    {
        log::warning("Error fetching display name for {}: {}", participantId, result.error().message);
        return fallbackName(participantId);
    }

    auto lock = std::lock_guard(_mutex);
    _cache[key] = *result;
    return std::move(*result);
}

auto CachingNameResolver::fallbackName(const ParticipantId& participantId) -> std::string
{
    return std::format("User_{}", participantId);
}

auto CachingNameResolver::cacheSize() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _cache.size();
}

void CachingNameResolver::clear()
{
    auto lock = std::lock_guard(_mutex);
    _cache.clear();
}

} // namespace voicescribe
