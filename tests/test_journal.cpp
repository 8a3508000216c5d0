/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>
#include "baton/journal.hpp"
#include "test_support.hpp"

using namespace baton;
using namespace std::chrono_literals;

TEST_CASE("Coordination log lines", "[journal]") {
    Timestamp when = std::chrono::system_clock::time_point(std::chrono::seconds(1735732800));
    CHECK(Journal::formatLine(when, "a1", "picked up api-1") ==
          "[2025-01-01T12:00:00.000000+00:00] a1 ▶ picked up api-1");
}

TEST_CASE("Append and tail", "[journal]") {
    test::TempRoot root;
    Journal journal(root.layout(), test::fastLocks());

    SECTION("Empty log tails to nothing") {
        auto tail = journal.tail(5);
        REQUIRE(tail);
        CHECK(tail.lines.empty());
    }

    SECTION("Tail returns the last lines in order") {
        for (int i = 0; i < 5; ++i) {
            REQUIRE(journal.append("a1", "message " + std::to_string(i)));
        }
        auto tail = journal.tail(2);
        REQUIRE(tail);
        REQUIRE(tail.lines.size() == 2);
        CHECK(tail.lines[0].find("a1 ▶ message 3") != std::string::npos);
        CHECK(tail.lines[1].find("a1 ▶ message 4") != std::string::npos);

        CHECK(journal.tail(50).lines.size() == 5);
        CHECK(journal.tail(0).lines.empty());
    }
}

TEST_CASE("Log rotation", "[journal][rotate]") {
    test::TempRoot root;
    Journal journal(root.layout(), test::fastLocks());
    const auto now = std::chrono::system_clock::now();

    SECTION("Nothing to rotate") {
        auto rotated = journal.rotate(now);
        REQUIRE(rotated);
        CHECK_FALSE(rotated.rotated);
    }

    SECTION("Rotate archives under today's date") {
        REQUIRE(journal.append("a1", "hello"));
        auto rotated = journal.rotate(now);
        REQUIRE(rotated);
        REQUIRE(rotated.rotated);
        CHECK(rotated.archive.string() == root.layout().archivePath(utcDate(now)).string());
        CHECK(std::filesystem::exists(rotated.archive));
        CHECK_FALSE(std::filesystem::exists(root.layout().logPath()));
    }

    SECTION("Rotating onto an existing archive appends") {
        test::TempRoot::writeFile(root.layout().archivePath(utcDate(now)), "earlier line\n");
        REQUIRE(journal.append("a1", "later line"));

        auto rotated = journal.rotate(now);
        REQUIRE(rotated);
        REQUIRE(rotated.rotated);

        auto content = test::TempRoot::readFile(rotated.archive);
        CHECK(content.find("earlier line\n") == 0);
        CHECK(content.find("a1 ▶ later line") != std::string::npos);
    }

    SECTION("Rotate if due leaves today's log alone") {
        REQUIRE(journal.append("a1", "fresh"));
        auto rotated = journal.rotateIfDue(now);
        REQUIRE(rotated);
        CHECK_FALSE(rotated.rotated);
        CHECK(std::filesystem::exists(root.layout().logPath()));
    }

    SECTION("Rotate if due archives an old log under its own day") {
        REQUIRE(journal.append("a1", "old news"));
        std::filesystem::last_write_time(root.layout().logPath(),
                                         std::filesystem::file_time_type::clock::now() - 72h);

        auto rotated = journal.rotateIfDue(now);
        REQUIRE(rotated);
        REQUIRE(rotated.rotated);
        CHECK(rotated.archive.string() != root.layout().archivePath(utcDate(now)).string());
        CHECK(std::filesystem::exists(rotated.archive));
        CHECK_FALSE(std::filesystem::exists(root.layout().logPath()));

        REQUIRE(journal.append("a1", "new day"));
        CHECK(journal.tail(10).lines.size() == 1);
    }
}
