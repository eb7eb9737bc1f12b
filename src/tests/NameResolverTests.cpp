// SPDX-License-Identifier: Apache-2.0
#include <pipeline/NameResolver.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"

using namespace voicescribe;
using namespace voicescribe::testing;

TEST_CASE("CachingNameResolver caches successful lookups per session", "[names]")
{
    auto directory = FakeParticipantDirectory {};
    directory.names = { { "42", "Alice" } };
    auto resolver = CachingNameResolver(directory);

    CHECK(resolver.displayName("42", "guild-1") == "Alice");
    CHECK(resolver.displayName("42", "guild-1") == "Alice");
    CHECK(directory.lookups == 1);
    CHECK(resolver.cacheSize() == 1);

    // A different session is a different cache entry.
    CHECK(resolver.displayName("42", "guild-2") == "Alice");
    CHECK(directory.lookups == 2);
    CHECK(resolver.cacheSize() == 2);
}

TEST_CASE("CachingNameResolver falls back to a placeholder name", "[names]")
{
    auto directory = FakeParticipantDirectory {};
    auto resolver = CachingNameResolver(directory);

    CHECK(resolver.displayName("42", "guild-1") == "User_42");
    CHECK(resolver.cacheSize() == 0);

    // Failures are not cached, so a later lookup can still succeed.
    directory.names["42"] = "Alice";
    CHECK(resolver.displayName("42", "guild-1") == "Alice");
    CHECK(directory.lookups == 2);
}

TEST_CASE("CachingNameResolver clear forces a new lookup", "[names]")
{
    auto directory = FakeParticipantDirectory {};
    directory.names = { { "7", "Bob" } };
    auto resolver = CachingNameResolver(directory);

    (void) resolver.displayName("7", "local");
    resolver.clear();
    CHECK(resolver.cacheSize() == 0);
    CHECK(resolver.displayName("7", "local") == "Bob");
    CHECK(directory.lookups == 2);
}

TEST_CASE("StaticParticipantDirectory resolves configured names", "[names]")
{
    auto directory = StaticParticipantDirectory({ { "1", "Carol" }, { "2", "" } });

    auto known = directory.resolve("1", "local");
    REQUIRE(known.has_value());
    CHECK(*known == "Carol");

    auto blank = directory.resolve("2", "local");
    REQUIRE(!blank.has_value());
    CHECK(blank.error().code == ErrorCode::LookupError);

    auto unknown = directory.resolve("3", "local");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().message.find("3") != std::string::npos);
}
