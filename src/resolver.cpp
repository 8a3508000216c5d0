/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/resolver.hpp"
#include <algorithm>

namespace baton {

namespace {
bool isDone(const TaskId& id, const StatusIndex& statuses) noexcept {
    auto it = statuses.find(id);
    return it != statuses.end() && it->second == TaskStatus::Done;
}
}

StatusIndex indexStatuses(const RegistrySnapshot& snapshot) {
    StatusIndex statuses;
    statuses.reserve(snapshot.tasks.size());
    for (const auto& task : snapshot.tasks) {
        statuses.emplace(task.id, task.status);
    }
    return statuses;
}

bool isEligible(const WorkItem& task, const StatusIndex& statuses,
                const DependencyMap& dependencies) noexcept {
    if (task.status != TaskStatus::Unclaimed) {
        return false;
    }
    auto it = dependencies.find(task.id);
    if (it == dependencies.end()) {
        return true;
    }
    return std::all_of(it->second.begin(), it->second.end(),
        [&](const TaskId& prerequisite) { return isDone(prerequisite, statuses); });
}

std::vector<TaskId> pendingPrerequisites(const WorkItem& task, const StatusIndex& statuses,
                                         const DependencyMap& dependencies) {
    std::vector<TaskId> pending;
    auto it = dependencies.find(task.id);
    if (it == dependencies.end()) {
        return pending;
    }
    for (const auto& prerequisite : it->second) {
        if (!isDone(prerequisite, statuses)) {
            pending.push_back(prerequisite);
        }
    }
    return pending;
}

}
