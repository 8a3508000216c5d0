/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "baton/types.hpp"

namespace baton {

// Names of the per-resource guard files under .lock/.
constexpr const char* kRegistryGuard = "registry";
constexpr const char* kQuotaGuard = "quota";
constexpr const char* kLogGuard = "coordination";

// Every path below one coordination root.
//
//   active_work_registry.json
//   dependency_map.json
//   agent_locks/<task_id>.<agent_id>.lock
//   heartbeat/<agent_id>.beat
//   quota.json
//   coordination.log, coordination-<YYYY-MM-DD>.log
//   .lock/<resource>.lock
class Layout final {
public:
    explicit Layout(const std::filesystem::path& root) noexcept;

    // Creates the root and its subdirectories. Safe to call repeatedly.
    [[nodiscard]] bool ensure() const noexcept;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    [[nodiscard]] std::filesystem::path registryPath() const { return root_ / "active_work_registry.json"; }
    [[nodiscard]] std::filesystem::path dependencyMapPath() const { return root_ / "dependency_map.json"; }
    [[nodiscard]] std::filesystem::path quotaPath() const { return root_ / "quota.json"; }
    [[nodiscard]] std::filesystem::path logPath() const { return root_ / "coordination.log"; }
    [[nodiscard]] std::filesystem::path archivePath(const std::string& date) const {
        return root_ / ("coordination-" + date + ".log");
    }

    [[nodiscard]] std::filesystem::path lockDir() const { return root_ / "agent_locks"; }
    [[nodiscard]] std::filesystem::path lockPath(const LockKey& key) const {
        return lockDir() / (key.str() + ".lock");
    }

    [[nodiscard]] std::filesystem::path heartbeatDir() const { return root_ / "heartbeat"; }
    [[nodiscard]] std::filesystem::path heartbeatPath(const AgentId& agent) const {
        return heartbeatDir() / (agent + ".beat");
    }

    [[nodiscard]] std::filesystem::path guardPath(const std::string& resource) const {
        return root_ / ".lock" / (resource + ".lock");
    }

    // Only for LockRecords whose body cannot be read: splits the stem at its
    // last '.', since agent ids carry no dots but task ids may.
    [[nodiscard]] static std::optional<LockKey> keyFromFileName(const std::filesystem::path& file);

private:
    std::filesystem::path root_;
};

}
