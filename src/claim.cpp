/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/claim.hpp"
#include "baton/logger.hpp"
#include "baton/resolver.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <numeric>
#include <fcntl.h>
#include <unistd.h>

namespace baton {

namespace {
std::optional<int> skillRank(const std::string& level) {
    if (level == "entry") return 0;
    if (level == "intermediate") return 1;
    if (level == "expert") return 2;
    return std::nullopt;
}

bool writeAll(int fd, const std::string& data) noexcept {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}
}

ClaimEngine::ClaimEngine(const Layout& layout, const LockOptions& lockOptions) noexcept
    : layout_(layout), lockOptions_(lockOptions), store_(layout), journal_(layout, lockOptions) {
    LOG_DEBUG("ClaimEngine created for root: " + layout_.root().string());
}

std::vector<std::size_t> ClaimEngine::claimOrder(const RegistrySnapshot& snapshot, bool any) {
    std::vector<std::size_t> order(snapshot.tasks.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (!any) {
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return static_cast<int>(snapshot.tasks[a].priority) < static_cast<int>(snapshot.tasks[b].priority);
        });
    }
    return order;
}

bool ClaimEngine::matchesFilter(const WorkItem& task, const ClaimFilter& filter) {
    if (filter.capability && task.capability != filter.capability) {
        return false;
    }
    if (filter.skillLevel && task.skillLevel) {
        auto wanted = skillRank(*filter.skillLevel);
        auto required = skillRank(*task.skillLevel);
        if (wanted && required) {
            return *required <= *wanted;
        }
        return *task.skillLevel == *filter.skillLevel;
    }
    return true;
}

ClaimResult ClaimEngine::claim(const AgentId& agent, const ClaimFilter& filter) const noexcept {
    ClaimResult result;
    if (!isValidAgentId(agent)) {
        result.error = CoordError::InvalidArgument;
        result.message = "Invalid agent id: '" + agent + "'";
        return result;
    }

    auto locked = withLock(layout_.guardPath(kRegistryGuard), lockOptions_, [&]() {
        auto registry = store_.load();
        if (!registry) {
            return OpResult::failure(registry.error, registry.message);
        }
        auto deps = store_.loadDependencies();
        if (!deps) {
            return OpResult::failure(deps.error, deps.message);
        }

        RegistrySnapshot& snapshot = registry.snapshot;
        const StatusIndex statuses = indexStatuses(snapshot);

        for (std::size_t index : claimOrder(snapshot, filter.any)) {
            WorkItem& task = snapshot.tasks[index];
            if (task.status != TaskStatus::Unclaimed) continue;
            if (!matchesFilter(task, filter)) continue;
            if (!isValidTaskId(task.id)) {
                LOG_WARN("Skipping task with an id unusable as a lock name: '" + task.id + "'");
                continue;
            }
            if (!isEligible(task, statuses, deps.dependencies)) {
                LOG_TRACE("Task " + task.id + " waiting on prerequisites");
                continue;
            }

            const LockKey key{task.id, agent};
            std::string error;
            switch (createLockRecord(key, error)) {
                case LockCreate::Exists:
                    LOG_DEBUG("Lock record already present, skipping: " + key.str());
                    continue;
                case LockCreate::Unusable:
                    LOG_WARN("Skipping task " + task.id + ": " + error);
                    continue;
                case LockCreate::Failed:
                    return OpResult::failure(CoordError::IoError, error);
                case LockCreate::Created:
                    break;
            }

            task.status = TaskStatus::Claimed;
            task.claimedBy = agent;
            task.claimedAt = std::chrono::system_clock::now();

            auto saved = store_.save(snapshot);
            if (!saved) {
                removeLockRecord(key);
                return saved;
            }

            result.task = task;
            return OpResult::success();
        }

        LOG_DEBUG("No eligible task for agent " + agent);
        return OpResult::success();
    });

    result.ok = locked.ok;
    result.error = locked.error;
    result.message = locked.message;
    if (!result.ok) {
        result.task.reset();
        return result;
    }

    if (result.task) {
        LOG_INFO("Agent " + agent + " claimed task " + result.task->id);
        audit(agent, "claimed task " + result.task->id);
    }
    return result;
}

OpResult ClaimEngine::release(const TaskId& taskId, const AgentId& agent) const noexcept {
    auto released = withLock(layout_.guardPath(kRegistryGuard), lockOptions_, [&]() {
        auto registry = store_.load();
        if (!registry) {
            return OpResult::failure(registry.error, registry.message);
        }

        WorkItem* task = registry.snapshot.find(taskId);
        if (!task) {
            return OpResult::failure(CoordError::NotFound, "Task not found: " + taskId);
        }
        if (task->status != TaskStatus::Claimed || task->claimedBy != agent) {
            return OpResult::failure(CoordError::NotOwned,
                "Task " + taskId + " is not claimed by " + agent + " (status: " + toString(task->status) +
                ", claimed_by: " + task->claimedBy.value_or("none") + ")");
        }

        task->status = TaskStatus::Done;
        task->completedAt = std::chrono::system_clock::now();

        auto saved = store_.save(registry.snapshot);
        if (!saved) {
            return saved;
        }

        removeLockRecord(LockKey{taskId, agent});
        return OpResult::success();
    });

    if (released) {
        LOG_INFO("Agent " + agent + " completed task " + taskId);
        audit(agent, "completed task " + taskId);
    }
    return released;
}

OpResult ClaimEngine::approve(const TaskId& taskId, const AgentId& reviewer) const noexcept {
    auto approved = withLock(layout_.guardPath(kRegistryGuard), lockOptions_, [&]() {
        auto registry = store_.load();
        if (!registry) {
            return OpResult::failure(registry.error, registry.message);
        }

        WorkItem* task = registry.snapshot.find(taskId);
        if (!task) {
            return OpResult::failure(CoordError::NotFound, "Task not found: " + taskId);
        }
        if (task->status != TaskStatus::Review) {
            return OpResult::failure(CoordError::NotInReview,
                "Task " + taskId + " is not in review (status: " + toString(task->status) + ")");
        }

        task->status = TaskStatus::Done;
        task->reviewerId = reviewer;
        task->completedAt = std::chrono::system_clock::now();
        return store_.save(registry.snapshot);
    });

    if (approved) {
        LOG_INFO("Reviewer " + reviewer + " approved task " + taskId);
        audit(reviewer, "approved task " + taskId);
    }
    return approved;
}

RegistryRead ClaimEngine::snapshot() const noexcept {
    RegistryRead result;
    auto locked = withLock(layout_.guardPath(kRegistryGuard), lockOptions_, [&]() {
        result = store_.load();
        return result.ok ? OpResult::success() : OpResult::failure(result.error, result.message);
    });
    if (!locked) {
        result.ok = false;
        result.error = locked.error;
        result.message = locked.message;
    }
    return result;
}

DependencyRead ClaimEngine::dependencies() const noexcept {
    DependencyRead result;
    auto locked = withLock(layout_.guardPath(kRegistryGuard), lockOptions_, [&]() {
        result = store_.loadDependencies();
        return result.ok ? OpResult::success() : OpResult::failure(result.error, result.message);
    });
    if (!locked) {
        result.ok = false;
        result.error = locked.error;
        result.message = locked.message;
    }
    return result;
}

LockCreate ClaimEngine::createLockRecord(const LockKey& key, std::string& error) const noexcept {
    try {
        std::filesystem::create_directories(layout_.lockDir());
        const auto path = layout_.lockPath(key);

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd == -1) {
            if (errno == EEXIST) {
                return LockCreate::Exists;
            }
            if (errno == ENAMETOOLONG || errno == ENOENT || errno == ENOTDIR) {
                error = "No usable lock record name " + path.string() + ": " + std::strerror(errno);
                return LockCreate::Unusable;
            }
            error = "Failed to create lock record " + path.string() + ": " + std::strerror(errno);
            LOG_ERROR(error);
            return LockCreate::Failed;
        }

        nlohmann::json body = LockRecord{key.agent, std::chrono::system_clock::now(), key.task};
        bool ok = writeAll(fd, body.dump());
        int closed = ::close(fd);
        if (!ok || closed != 0) {
            error = "Failed to write lock record " + path.string() + ": " + std::strerror(errno);
            LOG_ERROR(error);
            std::error_code ec;
            std::filesystem::remove(path, ec);
            return LockCreate::Failed;
        }

        LOG_DEBUG("Lock record created: " + key.str());
        return LockCreate::Created;
    } catch (const std::exception& e) {
        error = "Failed to create lock record " + key.str() + ": " + e.what();
        LOG_ERROR(error);
        return LockCreate::Failed;
    }
}

void ClaimEngine::removeLockRecord(const LockKey& key) const noexcept {
    std::error_code ec;
    std::filesystem::remove(layout_.lockPath(key), ec);
    if (ec) {
        LOG_WARN("Failed to remove lock record " + key.str() + ": " + ec.message());
    }
}

void ClaimEngine::audit(const AgentId& agent, const std::string& message) const noexcept {
    auto appended = journal_.append(agent, message);
    if (!appended) {
        LOG_WARN("Coordination log append failed: " + appended.message);
    }
}

}
