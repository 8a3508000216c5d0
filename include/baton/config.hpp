/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "baton/types.hpp"

namespace baton {

constexpr const char* kDefaultRoot = ".baton/coordination";

// Process configuration, read from BATON_* environment variables.
// CLI flags override individual fields after construction.
struct Config {
    std::filesystem::path root = kDefaultRoot;
    AgentId agentId;
    bool agentIdGenerated = false;

    std::chrono::seconds lockTimeout{30};
    std::chrono::seconds staleTimeout{900};
    std::chrono::seconds beatInterval{30};
    std::chrono::seconds reapInterval{60};

    [[nodiscard]] static Config fromEnv();
};

// Random 16 hex digit identity for agents that did not name themselves.
[[nodiscard]] AgentId generateAgentId();

// Positive integer from the environment; unset, empty, unparsable or zero yields defv.
[[nodiscard]] std::size_t envSize(const char* name, std::size_t defv) noexcept;

}
