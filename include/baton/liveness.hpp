/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "baton/file_lock.hpp"
#include "baton/journal.hpp"
#include "baton/layout.hpp"
#include "baton/registry.hpp"
#include "baton/types.hpp"

namespace baton {

// heartbeat/<agent>.beat; only its mtime carries meaning. Each agent writes
// only its own file, so no lock is taken.
class Heartbeat final {
public:
    explicit Heartbeat(const Layout& layout) noexcept;

    [[nodiscard]] OpResult touch(const AgentId& agent) const noexcept;
    [[nodiscard]] std::optional<Timestamp> lastBeat(const AgentId& agent) const noexcept;

private:
    Layout layout_;
};

struct LockEntry {
    LockKey key;
    std::filesystem::path path;
    std::optional<Timestamp> since;
};

struct ReapResult {
    bool ok = false;
    std::vector<LockKey> reclaimed;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Releases claims held by agents whose heartbeat has gone silent.
class Reaper final {
public:
    Reaper(const Layout& layout, const LockOptions& lockOptions) noexcept;

    Reaper(const Reaper&) = delete;
    Reaper& operator=(const Reaper&) = delete;

    // Every LockRecord under agent_locks/, sorted by file name.
    [[nodiscard]] std::vector<LockEntry> scan() const noexcept;

    // Deletes each LockRecord whose holder's heartbeat is missing or older
    // than timeout, and returns that holder's Claimed tasks to Unclaimed.
    // Runs under the registry guard. A second pass with no new staleness
    // reclaims nothing and writes nothing.
    [[nodiscard]] ReapResult cleanStaleLocks(std::chrono::seconds timeout) const noexcept;

private:
    [[nodiscard]] std::optional<LockEntry> readEntry(const std::filesystem::path& file) const noexcept;

    Layout layout_;
    LockOptions lockOptions_;
    Heartbeat heartbeat_;
    RegistryStore store_;
    Journal journal_;
};

}
