/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>
#include "commands.hpp"
#include "test_support.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace baton;
using json = nlohmann::json;

namespace {
struct Invocation {
    int code;
    std::string out;
    std::string err;
};

Invocation invoke(const test::TempRoot& root, const std::string& agent, std::vector<std::string> command,
                  bool jsonMode = true) {
    std::vector<std::string> argv;
    if (jsonMode) argv.push_back("--json");
    argv.insert(argv.end(), {"--root", root.path().string(), "--agent-id", agent});
    argv.insert(argv.end(), command.begin(), command.end());

    std::ostringstream out;
    std::ostringstream err;
    const int code = cli::run(argv, out, err);
    return {code, out.str(), err.str()};
}
}

TEST_CASE("Claim output", "[cli][claim]") {
    test::TempRoot root;

    SECTION("Empty backlog is a successful no-op") {
        auto result = invoke(root, "a1", {"claim"});
        CHECK(result.code == 0);
        auto j = json::parse(result.out);
        CHECK(j["status"].get<std::string>() == "no_eligible_task");
    }

    SECTION("Human mode says so in words") {
        auto result = invoke(root, "a1", {"claim"}, false);
        CHECK(result.code == 0);
        CHECK(result.out.find("No eligible task") != std::string::npos);
    }

    SECTION("A claimed task is printed as one JSON line") {
        root.writeRegistry(json{{"tasks", json::array({test::task("t1", "high")})}});
        auto result = invoke(root, "a1", {"claim"});
        CHECK(result.code == 0);
        REQUIRE(result.out.find('\n') == result.out.size() - 1);
        auto j = json::parse(result.out);
        CHECK(j["id"].get<std::string>() == "t1");
        CHECK(j["status"].get<std::string>() == "claimed");
        CHECK(j["claimed_by"].get<std::string>() == "a1");
    }

    SECTION("Unknown claim flags fail") {
        auto result = invoke(root, "a1", {"claim", "--fast"});
        CHECK(result.code == 1);
        CHECK(json::parse(result.out)["error"].get<std::string>() == "invalid_argument");
    }
}

TEST_CASE("Error output", "[cli][errors]") {
    test::TempRoot root;

    SECTION("JSON errors carry a kind and a message") {
        auto result = invoke(root, "a1", {"release", "nope"});
        CHECK(result.code == 1);
        auto j = json::parse(result.out);
        CHECK(j["status"].get<std::string>() == "error");
        CHECK(j["error"].get<std::string>() == "not_found");
        CHECK_FALSE(j["message"].get<std::string>().empty());
        CHECK(result.err.empty());
    }

    SECTION("Human errors go to the error stream") {
        auto result = invoke(root, "a1", {"release", "nope"}, false);
        CHECK(result.code == 1);
        CHECK(result.out.empty());
        CHECK(result.err.rfind("Error: ", 0) == 0);
    }

    SECTION("Agent ids that cannot name a file are refused") {
        auto result = invoke(root, "team/a1", {"beat"});
        CHECK(result.code == 1);
        CHECK(json::parse(result.out)["error"].get<std::string>() == "invalid_argument");
        CHECK_FALSE(std::filesystem::exists(root.layout().heartbeatDir() / "team"));
    }

    SECTION("Unknown commands print usage") {
        auto result = invoke(root, "a1", {"frobnicate"});
        CHECK(result.code == 1);
        CHECK(result.err.find("Unknown command: frobnicate") != std::string::npos);
        CHECK(result.err.find("Usage:") != std::string::npos);
    }

    SECTION("No command prints usage and fails") {
        std::ostringstream out;
        std::ostringstream err;
        const std::vector<std::string> argv{"--json"};
        CHECK(cli::run(argv, out, err) == 1);
        CHECK(out.str().find("Usage:") != std::string::npos);
    }
}

TEST_CASE("Release, clean-stale and quota output", "[cli]") {
    test::TempRoot root;
    root.writeRegistry(json{{"tasks", json::array({test::task("t1", "urgent")})}});
    REQUIRE(invoke(root, "a1", {"claim"}).code == 0);

    SECTION("Release reports the task") {
        auto result = invoke(root, "a1", {"release", "t1"});
        CHECK(result.code == 0);
        auto j = json::parse(result.out);
        CHECK(j["status"].get<std::string>() == "success");
        CHECK(j["action"].get<std::string>() == "release");
        CHECK(j["task_id"].get<std::string>() == "t1");
        CHECK(root.readRegistry()["tasks"][0]["status"].get<std::string>() == "done");
    }

    SECTION("Someone else's release is refused") {
        auto result = invoke(root, "a2", {"release", "t1"});
        CHECK(result.code == 1);
        CHECK(json::parse(result.out)["error"].get<std::string>() == "not_owned");
    }

    SECTION("Clean-stale lists what it reclaimed") {
        auto result = invoke(root, "a2", {"clean-stale"});
        CHECK(result.code == 0);
        auto j = json::parse(result.out);
        CHECK(j["action"].get<std::string>() == "clean_stale");
        REQUIRE(j["cleaned"].is_array());
        CHECK(j["cleaned"].empty());
    }

    SECTION("Quota add returns the new counters") {
        auto result = invoke(root, "a1", {"quota", "--add", "42"});
        CHECK(result.code == 0);
        auto j = json::parse(result.out);
        CHECK(j["action"].get<std::string>() == "quota");
        CHECK(j["quota"].is_object());

        auto bad = invoke(root, "a1", {"quota", "--add", "-3"});
        CHECK(bad.code == 1);
        CHECK(json::parse(bad.out)["error"].get<std::string>() == "invalid_argument");
    }
}
