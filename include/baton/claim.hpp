/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "baton/file_lock.hpp"
#include "baton/journal.hpp"
#include "baton/layout.hpp"
#include "baton/records.hpp"
#include "baton/registry.hpp"
#include "baton/types.hpp"

namespace baton {

struct ClaimFilter {
    std::optional<std::string> capability;
    std::optional<std::string> skillLevel;
    bool any = false; // keep registry order instead of priority order
};

struct ClaimResult {
    bool ok = false;
    std::optional<WorkItem> task; // empty with ok == true: no eligible task
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

enum class LockCreate : std::uint8_t {
    Created,
    Exists,
    Unusable, // this key cannot name a file; other candidates are unaffected
    Failed
};

// Selects and assigns work. Every registry mutation runs inside one
// acquisition of the registry guard; a claim is won by creating the task's
// LockRecord with O_CREAT|O_EXCL.
class ClaimEngine final {
public:
    ClaimEngine(const Layout& layout, const LockOptions& lockOptions) noexcept;

    ClaimEngine(const ClaimEngine&) = delete;
    ClaimEngine& operator=(const ClaimEngine&) = delete;
    ClaimEngine(ClaimEngine&&) noexcept = default;
    ClaimEngine& operator=(ClaimEngine&&) noexcept = default;

    [[nodiscard]] ClaimResult claim(const AgentId& agent, const ClaimFilter& filter = {}) const noexcept;
    [[nodiscard]] OpResult release(const TaskId& task, const AgentId& agent) const noexcept;
    [[nodiscard]] OpResult approve(const TaskId& task, const AgentId& reviewer) const noexcept;

    // Registry and dependency map read together under the registry guard.
    [[nodiscard]] RegistryRead snapshot() const noexcept;
    [[nodiscard]] DependencyRead dependencies() const noexcept;

    // Indices into snapshot.tasks in the order candidates are tried: stable
    // priority order (Urgent first), or stored order when any is set.
    [[nodiscard]] static std::vector<std::size_t> claimOrder(const RegistrySnapshot& snapshot, bool any);
    [[nodiscard]] static bool matchesFilter(const WorkItem& task, const ClaimFilter& filter);

private:
    [[nodiscard]] LockCreate createLockRecord(const LockKey& key, std::string& error) const noexcept;
    void removeLockRecord(const LockKey& key) const noexcept;
    void audit(const AgentId& agent, const std::string& message) const noexcept;

    Layout layout_;
    LockOptions lockOptions_;
    RegistryStore store_;
    Journal journal_;
};

}
