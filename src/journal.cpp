/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/journal.hpp"
#include "baton/io.hpp"
#include "baton/logger.hpp"
#include <deque>
#include <fstream>

namespace baton {

Journal::Journal(const Layout& layout, const LockOptions& lockOptions) noexcept
    : layout_(layout), lockOptions_(lockOptions) {
}

std::string Journal::formatLine(Timestamp when, const AgentId& agent, const std::string& message) {
    return "[" + toRfc3339(when) + "] " + agent + " ▶ " + message;
}

OpResult Journal::append(const AgentId& agent, const std::string& message) const noexcept {
    return withLock(layout_.guardPath(kLogGuard), lockOptions_, [&]() {
        return appendLine(layout_.logPath(),
                          formatLine(std::chrono::system_clock::now(), agent, message));
    });
}

RotateResult Journal::archiveLocked(const std::string& date) const {
    RotateResult result;
    const auto active = layout_.logPath();
    const auto archive = layout_.archivePath(date);
    result.archive = archive;

    if (!std::filesystem::exists(active)) {
        result.ok = true;
        return result;
    }

    if (!std::filesystem::exists(archive)) {
        std::filesystem::rename(active, archive);
    } else {
        std::string content;
        auto read = readFile(active, content);
        if (!read) {
            result.error = read.error;
            result.message = read.message;
            return result;
        }
        std::ofstream out(archive, std::ios::binary | std::ios::app);
        out << content;
        out.flush();
        if (!out.good()) {
            result.error = CoordError::IoError;
            result.message = "Failed to append to archive " + archive.string();
            return result;
        }
        std::filesystem::remove(active);
    }

    LOG_INFO("Rotated coordination log to " + archive.filename().string());
    result.ok = true;
    result.rotated = true;
    return result;
}

RotateResult Journal::rotate(Timestamp now) const noexcept {
    RotateResult result;
    auto locked = withLock(layout_.guardPath(kLogGuard), lockOptions_, [&]() {
        result = archiveLocked(utcDate(now));
        return result.ok ? OpResult::success() : OpResult::failure(result.error, result.message);
    });
    if (!locked) {
        result.ok = false;
        result.rotated = false;
        result.error = locked.error;
        result.message = locked.message;
    }
    return result;
}

RotateResult Journal::rotateIfDue(Timestamp now) const noexcept {
    RotateResult result;
    auto locked = withLock(layout_.guardPath(kLogGuard), lockOptions_, [&]() {
        const auto active = layout_.logPath();
        if (!std::filesystem::exists(active)) {
            result.ok = true;
            return OpResult::success();
        }

        auto lastWrite = toSystemTime(std::filesystem::last_write_time(active));
        std::string logDay = utcDate(lastWrite);
        if (logDay >= utcDate(now)) {
            result.ok = true;
            return OpResult::success();
        }

        result = archiveLocked(logDay);
        return result.ok ? OpResult::success() : OpResult::failure(result.error, result.message);
    });
    if (!locked) {
        result.ok = false;
        result.rotated = false;
        result.error = locked.error;
        result.message = locked.message;
    }
    return result;
}

TailResult Journal::tail(std::size_t count) const noexcept {
    TailResult result;
    auto locked = withLock(layout_.guardPath(kLogGuard), lockOptions_, [&]() {
        const auto active = layout_.logPath();
        if (!std::filesystem::exists(active)) {
            return OpResult::success();
        }

        std::ifstream file(active);
        if (!file) {
            return OpResult::failure(CoordError::IoError, "Failed to open " + active.string());
        }
        std::deque<std::string> window;
        std::string line;
        while (std::getline(file, line)) {
            if (count == 0) continue;
            window.push_back(line);
            if (window.size() > count) {
                window.pop_front();
            }
        }
        result.lines.assign(window.begin(), window.end());
        return OpResult::success();
    });

    result.ok = locked.ok;
    result.error = locked.error;
    result.message = locked.message;
    return result;
}

}
