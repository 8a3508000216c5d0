/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>
#include "baton/layout.hpp"
#include "baton/types.hpp"

using namespace baton;
using namespace std::chrono;

TEST_CASE("RFC 3339 timestamps", "[types][time]") {
    SECTION("Formats UTC with microseconds and explicit offset") {
        Timestamp tp = system_clock::time_point(seconds(1735732800)) + microseconds(42);
        REQUIRE(toRfc3339(tp) == "2025-01-01T12:00:00.000042+00:00");
        REQUIRE(utcDate(tp) == "2025-01-01");
    }

    SECTION("Parses what it formats") {
        Timestamp tp = time_point_cast<microseconds>(system_clock::now());
        auto parsed = parseRfc3339(toRfc3339(tp));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == tp);
    }

    SECTION("Accepts Z and non-zero offsets") {
        auto zulu = parseRfc3339("2025-01-01T12:00:00Z");
        auto shifted = parseRfc3339("2025-01-01T14:00:00+02:00");
        REQUIRE(zulu.has_value());
        REQUIRE(shifted.has_value());
        REQUIRE(*zulu == *shifted);
    }

    SECTION("Rejects malformed input") {
        REQUIRE_FALSE(parseRfc3339("").has_value());
        REQUIRE_FALSE(parseRfc3339("yesterday").has_value());
        REQUIRE_FALSE(parseRfc3339("2025-01-01T12:00:00").has_value());
    }
}

TEST_CASE("Status and priority names", "[types]") {
    REQUIRE(parseStatus("claimed") == TaskStatus::Claimed);
    REQUIRE(parseStatus("review") == TaskStatus::Review);
    REQUIRE_FALSE(parseStatus("archived").has_value());

    REQUIRE(parsePriority("urgent") == Priority::Urgent);
    REQUIRE(parsePriority("low") == Priority::Low);
    REQUIRE_FALSE(parsePriority("whenever").has_value());

    REQUIRE(std::string(toString(TaskStatus::Done)) == "done");
    REQUIRE(std::string(toString(CoordError::NotInReview)) == "not_in_review");
}

TEST_CASE("Lock keys map to file names", "[types][layout]") {
    Layout layout("/tmp/root");
    LockKey key{"feature.auth", "a1"};

    REQUIRE(key.str() == "feature.auth.a1");
    REQUIRE(layout.lockPath(key).filename().string() == "feature.auth.a1.lock");

    auto recovered = Layout::keyFromFileName(layout.lockPath(key));
    REQUIRE(recovered.has_value());
    REQUIRE(*recovered == key);

    REQUIRE_FALSE(Layout::keyFromFileName("/tmp/root/agent_locks/nodot.lock").has_value());
    REQUIRE_FALSE(Layout::keyFromFileName("/tmp/root/agent_locks/t1.a1.json").has_value());
}

TEST_CASE("Ids usable as file names", "[types]") {
    CHECK(isValidAgentId("worker-1"));
    CHECK(isValidAgentId("3f9a0c11d2e4b5a6"));
    CHECK_FALSE(isValidAgentId(""));
    CHECK_FALSE(isValidAgentId("team/a1"));
    CHECK_FALSE(isValidAgentId("a.1"));
    CHECK_FALSE(isValidAgentId(std::string("a\0b", 3)));

    CHECK(isValidTaskId("feature.auth"));
    CHECK(isValidTaskId("T-12"));
    CHECK_FALSE(isValidTaskId(""));
    CHECK_FALSE(isValidTaskId("."));
    CHECK_FALSE(isValidTaskId(".."));
    CHECK_FALSE(isValidTaskId("feature/login"));
}
