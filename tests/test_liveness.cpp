/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>
#include "baton/claim.hpp"
#include "baton/liveness.hpp"
#include "test_support.hpp"
#include <thread>

using namespace baton;
using json = nlohmann::json;
using namespace std::chrono_literals;

TEST_CASE("Heartbeat touch and read", "[liveness][heartbeat]") {
    test::TempRoot root;
    Heartbeat heartbeat(root.layout());

    SECTION("No beat before the first touch") {
        CHECK_FALSE(heartbeat.lastBeat("a1").has_value());
    }

    SECTION("Touch creates the file and moves its mtime forward") {
        const auto before = std::chrono::system_clock::now() - 2s;
        REQUIRE(heartbeat.touch("a1"));
        CHECK(std::filesystem::exists(root.layout().heartbeatPath("a1")));

        auto beat = heartbeat.lastBeat("a1");
        REQUIRE(beat.has_value());
        CHECK(*beat > before);

        std::filesystem::last_write_time(root.layout().heartbeatPath("a1"),
                                         std::filesystem::file_time_type::clock::now() - 1h);
        auto old = heartbeat.lastBeat("a1");
        REQUIRE(old.has_value());
        CHECK(*old < before);

        REQUIRE(heartbeat.touch("a1"));
        CHECK(*heartbeat.lastBeat("a1") > before);
    }

    SECTION("Agent ids that cannot name a file are rejected") {
        for (const AgentId agent : {"", "team/a1", "a.1"}) {
            auto touched = heartbeat.touch(agent);
            CAPTURE(agent);
            REQUIRE_FALSE(touched);
            CHECK(touched.error == CoordError::InvalidArgument);
        }
        CHECK_FALSE(std::filesystem::exists(root.layout().heartbeatDir() / "team"));
    }
}

TEST_CASE("Silent agents lose their claims", "[liveness][reaper]") {
    test::TempRoot root;
    root.writeRegistry(json{{"tasks", json::array({test::task("t1", "urgent"), test::task("t2", "low")})}});

    ClaimEngine engine(root.layout(), test::fastLocks());
    Heartbeat heartbeat(root.layout());
    Reaper reaper(root.layout(), test::fastLocks());

    REQUIRE(heartbeat.touch("a1"));
    auto claimed = engine.claim("a1");
    REQUIRE(claimed);
    REQUIRE(claimed.task);
    REQUIRE(claimed.task->id == "t1");

    std::this_thread::sleep_for(2s);

    auto reaped = reaper.cleanStaleLocks(1s);
    REQUIRE(reaped);
    REQUIRE(reaped.reclaimed.size() == 1);
    CHECK(reaped.reclaimed[0].str() == "t1.a1");

    CHECK_FALSE(std::filesystem::exists(root.layout().lockPath(LockKey{"t1", "a1"})));
    auto saved = root.readRegistry();
    CHECK(saved["tasks"][0]["status"].get<std::string>() == "unclaimed");
    CHECK(saved["tasks"][0]["claimed_by"].is_null());
    CHECK(saved["tasks"][0]["claimed_at"].is_null());

    SECTION("A second pass finds nothing and writes nothing") {
        const auto bytes = test::TempRoot::readFile(root.layout().registryPath());
        const auto written = std::filesystem::last_write_time(root.layout().registryPath());
        std::this_thread::sleep_for(20ms);

        auto again = reaper.cleanStaleLocks(1s);
        REQUIRE(again);
        CHECK(again.reclaimed.empty());
        CHECK(test::TempRoot::readFile(root.layout().registryPath()) == bytes);
        CHECK((std::filesystem::last_write_time(root.layout().registryPath()) == written));
    }

    SECTION("The task can be claimed again") {
        REQUIRE(heartbeat.touch("a2"));
        auto reclaimed = engine.claim("a2");
        REQUIRE(reclaimed);
        REQUIRE(reclaimed.task);
        CHECK(reclaimed.task->id == "t1");
    }
}

TEST_CASE("Live agents keep their claims", "[liveness][reaper]") {
    test::TempRoot root;
    root.writeRegistry(json{{"tasks", json::array({test::task("t1", "urgent")})}});

    ClaimEngine engine(root.layout(), test::fastLocks());
    Heartbeat heartbeat(root.layout());
    Reaper reaper(root.layout(), test::fastLocks());

    REQUIRE(heartbeat.touch("a1"));
    REQUIRE(engine.claim("a1").task);

    const auto bytes = test::TempRoot::readFile(root.layout().registryPath());
    const auto written = std::filesystem::last_write_time(root.layout().registryPath());
    std::this_thread::sleep_for(20ms);

    auto reaped = reaper.cleanStaleLocks(60s);
    REQUIRE(reaped);
    CHECK(reaped.reclaimed.empty());
    CHECK(test::TempRoot::readFile(root.layout().registryPath()) == bytes);
    CHECK((std::filesystem::last_write_time(root.layout().registryPath()) == written));
    CHECK(std::filesystem::exists(root.layout().lockPath(LockKey{"t1", "a1"})));
    CHECK(root.readRegistry()["tasks"][0]["status"].get<std::string>() == "claimed");
}

TEST_CASE("Locks without any heartbeat are stale", "[liveness][reaper]") {
    test::TempRoot root;
    root.writeRegistry(json{{"tasks", json::array({test::task("t1", "urgent")})}});

    ClaimEngine engine(root.layout(), test::fastLocks());
    Reaper reaper(root.layout(), test::fastLocks());
    REQUIRE(engine.claim("ghost").task);

    auto reaped = reaper.cleanStaleLocks(900s);
    REQUIRE(reaped);
    REQUIRE(reaped.reclaimed.size() == 1);
    CHECK(reaped.reclaimed[0] == (LockKey{"t1", "ghost"}));
    CHECK(root.readRegistry()["tasks"][0]["status"].get<std::string>() == "unclaimed");
}

TEST_CASE("Reaping never rewrites finished work", "[liveness][reaper]") {
    test::TempRoot root;
    auto done = test::task("t1", "urgent", "done");
    done["claimed_by"] = "ghost";
    root.writeRegistry(json{{"tasks", json::array({done})}});
    test::TempRoot::writeFile(root.layout().lockPath(LockKey{"t1", "ghost"}),
        json{{"holder", "ghost"}, {"since", "2025-01-01T00:00:00.000000+00:00"}, {"task_id", "t1"}}.dump());

    Reaper reaper(root.layout(), test::fastLocks());
    auto reaped = reaper.cleanStaleLocks(1s);
    REQUIRE(reaped);
    CHECK(reaped.reclaimed.size() == 1);
    CHECK(root.readRegistry()["tasks"][0]["status"].get<std::string>() == "done");
}

TEST_CASE("Lock records are keyed from their body", "[liveness][scan]") {
    test::TempRoot root;
    const auto dir = root.layout().lockDir();

    // Dotted task id: the body names the split.
    test::TempRoot::writeFile(dir / "feature.v2.a1.lock",
        json{{"holder", "a1"}, {"since", "2025-01-01T00:00:00.000000+00:00"}, {"task_id", "feature.v2"}}.dump());
    // Holder only: the key is recovered by stripping the holder suffix.
    test::TempRoot::writeFile(dir / "release.1.bot.lock",
        json{{"holder", "bot"}, {"since", "2025-01-01T00:00:00.000000+00:00"}}.dump());
    // Unreadable body: last-dot split.
    test::TempRoot::writeFile(dir / "t9.a9.lock", "");

    auto entries = Reaper(root.layout(), test::fastLocks()).scan();
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].key == (LockKey{"feature.v2", "a1"}));
    CHECK(entries[0].since.has_value());
    CHECK(entries[1].key == (LockKey{"release.1", "bot"}));
    CHECK(entries[2].key == (LockKey{"t9", "a9"}));
    CHECK_FALSE(entries[2].since.has_value());
}
