/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "baton/types.hpp"

namespace baton {

struct WorkItem {
    TaskId id;
    std::string title;
    TaskStatus status = TaskStatus::Unclaimed;
    Priority priority = Priority::Medium;
    std::optional<AgentId> claimedBy;
    std::optional<Timestamp> claimedAt;
    std::optional<Timestamp> completedAt;
    std::optional<std::string> blockedReason;
    std::optional<AgentId> reviewerId;
    std::optional<std::string> capability;
    std::optional<std::string> skillLevel;
};

// Point-in-time copy of the whole registry, in stored order.
struct RegistrySnapshot {
    std::vector<WorkItem> tasks;

    [[nodiscard]] WorkItem* find(const TaskId& id) noexcept;
    [[nodiscard]] const WorkItem* find(const TaskId& id) const noexcept;
};

// Task id -> prerequisite ids, in the order they were listed.
using DependencyMap = std::unordered_map<TaskId, std::vector<TaskId>>;

// Body of agent_locks/<task>.<agent>.lock. The file's existence is the proof
// of ownership; the body is diagnostic and carries the key as data.
struct LockRecord {
    AgentId holder;
    Timestamp since;
    TaskId taskId;
};

struct QuotaRecord {
    std::uint64_t tokensUsed = 0;
    Timestamp lastReset;
    std::uint64_t requests = 0;
};

void to_json(nlohmann::json& j, const WorkItem& item);
void from_json(const nlohmann::json& j, WorkItem& item);

void to_json(nlohmann::json& j, const RegistrySnapshot& snapshot);
// Accepts {"tasks": [...]} or a bare array.
void from_json(const nlohmann::json& j, RegistrySnapshot& snapshot);

void to_json(nlohmann::json& j, const LockRecord& record);
void from_json(const nlohmann::json& j, LockRecord& record);

void to_json(nlohmann::json& j, const QuotaRecord& record);
void from_json(const nlohmann::json& j, QuotaRecord& record);

}
