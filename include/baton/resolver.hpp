/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <unordered_map>

#include "baton/records.hpp"
#include "baton/types.hpp"

namespace baton {

using StatusIndex = std::unordered_map<TaskId, TaskStatus>;

// Status of every task in snapshot, copied so later mutations of the same
// snapshot do not change eligibility answers.
[[nodiscard]] StatusIndex indexStatuses(const RegistrySnapshot& snapshot);

// Unclaimed, and every prerequisite listed for task.id is Done in statuses.
// A prerequisite id absent from statuses counts as not Done.
[[nodiscard]] bool isEligible(const WorkItem& task, const StatusIndex& statuses,
                              const DependencyMap& dependencies) noexcept;

// Prerequisites of task that are not yet Done, in listed order.
[[nodiscard]] std::vector<TaskId> pendingPrerequisites(const WorkItem& task, const StatusIndex& statuses,
                                                       const DependencyMap& dependencies);

}
