/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>

#include "baton/logger.hpp"
#include "baton/types.hpp"

namespace baton {

struct LockOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds pollInterval{250};
};

// Advisory exclusive flock() on a guard file, held for the object's lifetime.
// Acquisition polls with LOCK_NB every pollInterval and gives up with
// LockTimeout once the wait exceeds timeout. Mutual exclusion holds only among
// processes (or open file descriptions) sharing the same filesystem.
class FileLock final {
public:
    FileLock(const std::filesystem::path& lockPath, const LockOptions& options) noexcept;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&&) = delete;
    FileLock& operator=(FileLock&&) = delete;

    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const OpResult& status() const noexcept { return status_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    void release() noexcept;

private:
    void acquire(const LockOptions& options) noexcept;

    std::filesystem::path path_;
    int fd_ = -1;
    OpResult status_;
};

// Runs fn with the lock on lockPath held and releases it on every exit path.
// fn returns an OpResult; exceptions it throws become IoError.
template <typename Fn>
OpResult withLock(const std::filesystem::path& lockPath, const LockOptions& options, Fn&& fn) {
    FileLock lock(lockPath, options);
    if (!lock.held()) {
        return lock.status();
    }
    try {
        return std::forward<Fn>(fn)();
    } catch (const std::exception& e) {
        LOG_ERROR("Critical section on " + lockPath.string() + " failed: " + e.what());
        return OpResult::failure(CoordError::IoError, e.what());
    }
}

}
