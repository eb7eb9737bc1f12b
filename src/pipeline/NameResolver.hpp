// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace voicescribe
{

/// @brief External lookup from participant id to display name.
class ParticipantDirectory
{
  public:
    virtual ~ParticipantDirectory() = default;

    /// @brief Resolves a participant's display name within a session.
    /// @param participantId The participant identifier.
    /// @param sessionId The session (server/guild) the participant was heard in.
    /// @return The display name or a LookupError.
    [[nodiscard]] virtual auto resolve(const ParticipantId& participantId, std::string_view sessionId)
        -> Result<std::string> = 0;
};

/// @brief Directory backed by a fixed id-to-name table (the "participants" config section).
class StaticParticipantDirectory final: public ParticipantDirectory
{
  public:
    explicit StaticParticipantDirectory(std::map<ParticipantId, std::string> names);

    [[nodiscard]] auto resolve(const ParticipantId& participantId, std::string_view sessionId)
        -> Result<std::string> override;

  private:
    std::map<ParticipantId, std::string> _names;
};

/// @brief Caches directory lookups and never fails.
///
/// Successful lookups are cached per (participant, session); a failed lookup yields
/// fallbackName() and is retried on the next call.
class CachingNameResolver
{
  public:
    explicit CachingNameResolver(ParticipantDirectory& directory);

    /// @brief Returns the display name, consulting the cache before the directory.
    [[nodiscard]] auto displayName(const ParticipantId& participantId, std::string_view sessionId) -> std::string;

    /// @brief The placeholder used when a lookup fails, e.g. "User_42".
    [[nodiscard]] static auto fallbackName(const ParticipantId& participantId) -> std::string;

    /// @brief Returns the number of cached names.
    [[nodiscard]] auto cacheSize() const -> size_t;

    /// @brief Drops all cached names.
    void clear();

  private:
    ParticipantDirectory& _directory;
    mutable std::mutex _mutex;
    std::map<std::string, std::string> _cache; // "<participantId>_<sessionId>" → name
};

} // namespace voicescribe
