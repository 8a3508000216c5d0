/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/config.hpp"
#include "baton/logger.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>

namespace baton {

std::size_t envSize(const char* name, std::size_t defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t parsed = static_cast<std::size_t>(std::stoull(val));
        return parsed == 0 ? defv : parsed;
    } catch (const std::invalid_argument&) {
        return defv;
    } catch (const std::out_of_range&) {
        return defv;
    }
}

AgentId generateAgentId() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dist(rng)));
    return AgentId(buf);
}

Config Config::fromEnv() {
    Config config;

    if (const char* root = std::getenv("BATON_ROOT"); root && *root) {
        config.root = root;
    }

    if (const char* agent = std::getenv("BATON_AGENT_ID"); agent && *agent) {
        config.agentId = agent;
    } else {
        config.agentId = generateAgentId();
        config.agentIdGenerated = true;
    }

    config.lockTimeout = std::chrono::seconds(envSize("BATON_LOCK_TIMEOUT", 30));
    config.staleTimeout = std::chrono::seconds(envSize("BATON_STALE_TIMEOUT", 900));
    config.beatInterval = std::chrono::seconds(envSize("BATON_BEAT_INTERVAL", 30));
    config.reapInterval = std::chrono::seconds(envSize("BATON_REAP_INTERVAL", 60));

    LOG_DEBUG("Config: root=" + config.root.string() + " agent=" + config.agentId +
              " lockTimeout=" + std::to_string(config.lockTimeout.count()) + "s");
    return config;
}

}
