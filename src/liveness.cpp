/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/liveness.hpp"
#include "baton/io.hpp"
#include "baton/logger.hpp"
#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace baton {

Heartbeat::Heartbeat(const Layout& layout) noexcept
    : layout_(layout) {
}

OpResult Heartbeat::touch(const AgentId& agent) const noexcept {
    if (!isValidAgentId(agent)) {
        return OpResult::failure(CoordError::InvalidArgument, "Invalid agent id: '" + agent + "'");
    }
    try {
        const auto path = layout_.heartbeatPath(agent);
        std::filesystem::create_directories(path.parent_path());
        {
            std::ofstream file(path, std::ios::binary | std::ios::app);
            if (!file) {
                return OpResult::failure(CoordError::IoError, "Failed to open heartbeat " + path.string());
            }
        }
        std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now());
        LOG_TRACE("Heartbeat touched: " + agent);
        return OpResult::success();
    } catch (const std::exception& e) {
        return OpResult::failure(CoordError::IoError, "Failed to touch heartbeat for " + agent + ": " + e.what());
    }
}

std::optional<Timestamp> Heartbeat::lastBeat(const AgentId& agent) const noexcept {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(layout_.heartbeatPath(agent), ec);
    if (ec) {
        return std::nullopt;
    }
    return toSystemTime(mtime);
}

Reaper::Reaper(const Layout& layout, const LockOptions& lockOptions) noexcept
    : layout_(layout), lockOptions_(lockOptions), heartbeat_(layout),
      store_(layout), journal_(layout, lockOptions) {
}

std::optional<LockEntry> Reaper::readEntry(const std::filesystem::path& file) const noexcept {
    try {
        std::string content;
        if (readFile(file, content) && !content.empty()) {
            auto record = nlohmann::json::parse(content).get<LockRecord>();
            if (!record.taskId.empty() && !record.holder.empty()) {
                return LockEntry{LockKey{record.taskId, record.holder}, file, record.since};
            }
            // Older bodies carry only the holder; the stem is <task>.<holder>.
            std::string stem = file.stem().string();
            std::string suffix = "." + record.holder;
            if (stem.size() > suffix.size() &&
                stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return LockEntry{LockKey{stem.substr(0, stem.size() - suffix.size()), record.holder},
                                 file, record.since};
            }
        }
    } catch (const std::exception& e) {
        LOG_DEBUG("Unreadable lock record body " + file.filename().string() + ": " + e.what());
    }

    auto key = Layout::keyFromFileName(file);
    if (!key) {
        LOG_WARN("Ignoring unrecognized lock file: " + file.filename().string());
        return std::nullopt;
    }
    LOG_WARN("Lock record without a usable body, keyed from its name: " + file.filename().string());
    return LockEntry{*key, file, std::nullopt};
}

std::vector<LockEntry> Reaper::scan() const noexcept {
    std::vector<LockEntry> entries;
    try {
        const auto lockDir = layout_.lockDir();
        if (!std::filesystem::exists(lockDir)) {
            LOG_DEBUG("Lock directory does not exist: " + lockDir.string());
            return entries;
        }

        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(lockDir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".lock") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            if (auto entry = readEntry(file)) {
                entries.push_back(std::move(*entry));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Lock scan error: " + std::string(e.what()));
    }
    return entries;
}

ReapResult Reaper::cleanStaleLocks(std::chrono::seconds timeout) const noexcept {
    ReapResult result;

    auto locked = withLock(layout_.guardPath(kRegistryGuard), lockOptions_, [&]() {
        const auto now = std::chrono::system_clock::now();

        std::vector<LockEntry> stale;
        std::unordered_set<AgentId> staleAgents;
        for (auto& entry : scan()) {
            auto beat = heartbeat_.lastBeat(entry.key.agent);
            if (beat && now - *beat <= timeout) {
                continue;
            }
            LOG_DEBUG("Stale lock " + entry.key.str() +
                      (beat ? " (heartbeat " + toRfc3339(*beat) + ")" : " (no heartbeat)"));
            staleAgents.insert(entry.key.agent);
            stale.push_back(std::move(entry));
        }

        if (stale.empty()) {
            return OpResult::success();
        }

        auto registry = store_.load();
        if (!registry) {
            return OpResult::failure(registry.error, registry.message);
        }

        for (const auto& entry : stale) {
            std::error_code ec;
            std::filesystem::remove(entry.path, ec);
            if (ec) {
                return OpResult::failure(CoordError::IoError,
                    "Failed to remove stale lock " + entry.path.string() + ": " + ec.message());
            }
            result.reclaimed.push_back(entry.key);
        }

        bool mutated = false;
        for (auto& task : registry.snapshot.tasks) {
            if (task.status == TaskStatus::Claimed && task.claimedBy &&
                staleAgents.count(*task.claimedBy) > 0) {
                LOG_INFO("Reclaiming task " + task.id + " from silent agent " + *task.claimedBy);
                task.status = TaskStatus::Unclaimed;
                task.claimedBy.reset();
                task.claimedAt.reset();
                mutated = true;
            }
        }

        if (mutated) {
            return store_.save(registry.snapshot);
        }
        return OpResult::success();
    });

    result.ok = locked.ok;
    result.error = locked.error;
    result.message = locked.message;
    if (!result.ok) {
        result.reclaimed.clear();
        return result;
    }

    for (const auto& key : result.reclaimed) {
        auto appended = journal_.append(key.agent, "reclaimed task " + key.task + " from agent " + key.agent);
        if (!appended) {
            LOG_WARN("Coordination log append failed: " + appended.message);
        }
    }
    if (!result.reclaimed.empty()) {
        LOG_INFO("Reclaimed " + std::to_string(result.reclaimed.size()) + " stale lock(s)");
    }
    return result;
}

}
