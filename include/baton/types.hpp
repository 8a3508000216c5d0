/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace baton {

// Forward-moving work item lifecycle. Blocked is set and cleared externally.
enum class TaskStatus : std::uint8_t { Unclaimed, Claimed, Blocked, Review, Done };

// Claim ordering only; lower rank is claimed first.
enum class Priority : std::uint8_t { Urgent = 0, High = 1, Medium = 2, Low = 3 };

enum class CoordError : std::uint8_t {
    None = 0,
    LockTimeout,
    NotFound,
    NotOwned,
    NotInReview,
    IoError,
    InvalidArgument
};

using TaskId = std::string;
using AgentId = std::string;
using Timestamp = std::chrono::system_clock::time_point;

// Identity of one LockRecord: the claimed task and the agent holding it.
struct LockKey {
    TaskId task;
    AgentId agent;

    // "<task>.<agent>", the file stem under agent_locks/.
    [[nodiscard]] std::string str() const { return task + "." + agent; }

    bool operator==(const LockKey& other) const noexcept {
        return task == other.task && agent == other.agent;
    }
    bool operator!=(const LockKey& other) const noexcept { return !(*this == other); }
};

// Result of an operation with no payload.
struct OpResult {
    bool ok = false;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static OpResult success() { return {true, CoordError::None, ""}; }
    static OpResult failure(CoordError error, std::string message) {
        return {false, error, std::move(message)};
    }
};

[[nodiscard]] const char* toString(TaskStatus status) noexcept;
[[nodiscard]] const char* toString(Priority priority) noexcept;
[[nodiscard]] const char* toString(CoordError error) noexcept;

[[nodiscard]] std::optional<TaskStatus> parseStatus(const std::string& value);
[[nodiscard]] std::optional<Priority> parsePriority(const std::string& value);

// Agent ids name heartbeat files and end every lock file name, so they carry
// no '/', no '.' and no NUL.
[[nodiscard]] bool isValidAgentId(const AgentId& id) noexcept;

// Task ids become one file name component under agent_locks/.
[[nodiscard]] bool isValidTaskId(const TaskId& id) noexcept;

// RFC 3339 in UTC with microseconds, e.g. 2025-01-01T12:00:00.000000+00:00.
[[nodiscard]] std::string toRfc3339(Timestamp tp);
[[nodiscard]] std::optional<Timestamp> parseRfc3339(const std::string& value) noexcept;

// UTC calendar date, YYYY-MM-DD.
[[nodiscard]] std::string utcDate(Timestamp tp);

} // namespace baton
