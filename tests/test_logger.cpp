/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>
#include "baton/logger.hpp"
#include <cstdlib>
#include <optional>
#include <string>

using namespace baton;

namespace {
// Restores BATON_LOG_LEVEL and the process level on scope exit.
class LevelGuard {
public:
    LevelGuard() : saved_(Logger::level()) {
        if (const char* value = std::getenv("BATON_LOG_LEVEL")) env_ = value;
    }
    ~LevelGuard() {
        if (env_) {
            ::setenv("BATON_LOG_LEVEL", env_->c_str(), 1);
        } else {
            ::unsetenv("BATON_LOG_LEVEL");
        }
        Logger::setLevel(saved_);
    }

private:
    LogLevel saved_;
    std::optional<std::string> env_;
};

LogLevel levelFor(const char* value) {
    if (value) {
        ::setenv("BATON_LOG_LEVEL", value, 1);
    } else {
        ::unsetenv("BATON_LOG_LEVEL");
    }
    Logger::initFromEnv();
    return Logger::level();
}
}

TEST_CASE("Log level from the environment", "[logger]") {
    LevelGuard guard;

    CHECK(levelFor("debug") == LogLevel::DEBUG);
    CHECK(levelFor("ERROR") == LogLevel::ERROR);
    CHECK(levelFor("Warning") == LogLevel::WARN);
    CHECK(levelFor("warn") == LogLevel::WARN);
    CHECK(levelFor("trace") == LogLevel::TRACE);

    SECTION("Unknown names fall back to info") {
        CHECK(levelFor("bogus") == LogLevel::INFO);
        CHECK(levelFor("") == LogLevel::INFO);
    }

    SECTION("Unset falls back to info") {
        CHECK(levelFor(nullptr) == LogLevel::INFO);
    }
}

TEST_CASE("Explicit level wins until the next init", "[logger]") {
    LevelGuard guard;
    ::setenv("BATON_LOG_LEVEL", "trace", 1);

    Logger::setLevel(LogLevel::ERROR);
    CHECK(Logger::level() == LogLevel::ERROR);

    Logger::initFromEnv();
    CHECK(Logger::level() == LogLevel::TRACE);

    // Filtered and emitted messages never throw
    Logger::setLevel(LogLevel::ERROR);
    Logger::debug("dropped");
    Logger::error("kept");
}
