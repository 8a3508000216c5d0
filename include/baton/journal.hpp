/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "baton/file_lock.hpp"
#include "baton/layout.hpp"
#include "baton/types.hpp"

namespace baton {

struct RotateResult {
    bool ok = false;
    bool rotated = false;
    std::filesystem::path archive;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct TailResult {
    bool ok = false;
    std::vector<std::string> lines;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Append-only coordination log shared by all agents, guarded by .lock/coordination.lock.
class Journal final {
public:
    Journal(const Layout& layout, const LockOptions& lockOptions) noexcept;

    [[nodiscard]] OpResult append(const AgentId& agent, const std::string& message) const noexcept;

    // Archives the active log as coordination-<UTC date of now>.log. An
    // existing archive for that date is appended to, never replaced.
    [[nodiscard]] RotateResult rotate(Timestamp now) const noexcept;

    // Rotates only if the active log was last written on an earlier UTC day,
    // archiving under that day.
    [[nodiscard]] RotateResult rotateIfDue(Timestamp now) const noexcept;

    [[nodiscard]] TailResult tail(std::size_t count) const noexcept;

    // [<rfc3339>] <agent> ▶ <message>
    [[nodiscard]] static std::string formatLine(Timestamp when, const AgentId& agent, const std::string& message);

private:
    [[nodiscard]] RotateResult archiveLocked(const std::string& date) const;

    Layout layout_;
    LockOptions lockOptions_;
};

}
