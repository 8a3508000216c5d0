/*
 * baton - Warden daemon (batond)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/config.hpp"
#include "baton/logger.hpp"
#include "baton/warden.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace baton;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "baton Warden Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--root <dir>] [--agent-id <id>] [--beat SECS] [--reap SECS]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Keeps this agent's heartbeat fresh, reclaims tasks from silent agents\n";
    std::cout << "and rotates the coordination log once per day.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --root <dir>       Coordination root (default " << kDefaultRoot << ")\n";
    std::cout << "  --agent-id <id>    Agent whose heartbeat is kept\n";
    std::cout << "  --beat SECS        Heartbeat interval (default 30)\n";
    std::cout << "  --reap SECS        Reap interval (default 60)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  BATON_ROOT, BATON_AGENT_ID, BATON_LOCK_TIMEOUT, BATON_STALE_TIMEOUT,\n";
    std::cout << "  BATON_BEAT_INTERVAL, BATON_REAP_INTERVAL, BATON_LOG_LEVEL\n";
}

std::optional<std::chrono::seconds> parseSeconds(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        auto secs = std::stoll(value);
        if (secs <= 0) return std::nullopt;
        return std::chrono::seconds(secs);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();
    setThreadName("Main");

    Config config = Config::fromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--root") {
            config.root = value;
        } else if (arg == "--agent-id") {
            config.agentId = value;
            config.agentIdGenerated = false;
        } else if (arg == "--beat" || arg == "--reap") {
            auto secs = parseSeconds(value);
            if (!secs) {
                std::cerr << "Error: Invalid interval for " << arg << ": " << value << "\n";
                return 1;
            }
            (arg == "--beat" ? config.beatInterval : config.reapInterval) = *secs;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (config.agentIdGenerated) {
        LOG_WARN("No agent id configured, using generated id " + config.agentId);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        WardenOptions options;
        options.agent = config.agentId;
        options.beatInterval = config.beatInterval;
        options.reapInterval = config.reapInterval;
        options.staleTimeout = config.staleTimeout;

        Warden warden(Layout(config.root), LockOptions{config.lockTimeout}, options);
        if (!warden.start()) {
            LOG_ERROR("Failed to start warden");
            return 1;
        }

        LOG_INFO("batond " + std::string(VERSION) + " running - agent: " + config.agentId +
                 ", root: " + config.root.string() +
                 ", beat: " + std::to_string(config.beatInterval.count()) + "s" +
                 ", reap: " + std::to_string(config.reapInterval.count()) + "s");

        while (!g_shutdown_requested && warden.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_DEBUG("Shutdown requested, stopping warden...");
        warden.shutdown();

        LOG_INFO("Warden stopped after " + std::to_string(warden.beats()) + " beat(s), " +
                 std::to_string(warden.reaps()) + " reap pass(es), " +
                 std::to_string(warden.reclaimed()) + " reclaimed");

    } catch (const std::exception& e) {
        LOG_ERROR("Warden error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
