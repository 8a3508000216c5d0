/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/file_lock.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace baton {

FileLock::FileLock(const std::filesystem::path& lockPath, const LockOptions& options) noexcept
    : path_(lockPath) {
    acquire(options);
}

FileLock::~FileLock() {
    release();
}

void FileLock::acquire(const LockOptions& options) noexcept {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            status_ = OpResult::failure(CoordError::IoError,
                "Failed to create lock directory " + path_.parent_path().string() + ": " + ec.message());
            LOG_ERROR(status_.message);
            return;
        }
    }

    int fd = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666);
    if (fd == -1) {
        status_ = OpResult::failure(CoordError::IoError,
            "Failed to open lock file " + path_.string() + ": " + std::strerror(errno));
        LOG_ERROR(status_.message);
        return;
    }

    const auto start = std::chrono::steady_clock::now();
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            fd_ = fd;
            status_ = OpResult::success();
            LOG_TRACE("Lock acquired: " + path_.string());
            return;
        }

        if (errno != EWOULDBLOCK && errno != EAGAIN && errno != EINTR) {
            status_ = OpResult::failure(CoordError::IoError,
                "flock failed on " + path_.string() + ": " + std::strerror(errno));
            LOG_ERROR(status_.message);
            ::close(fd);
            return;
        }

        if (std::chrono::steady_clock::now() - start > options.timeout) {
            status_ = OpResult::failure(CoordError::LockTimeout,
                "Timed out after " + std::to_string(options.timeout.count()) + "ms waiting for " + path_.string());
            LOG_WARN(status_.message);
            ::close(fd);
            return;
        }

        std::this_thread::sleep_for(options.pollInterval);
    }
}

void FileLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    LOG_TRACE("Lock released: " + path_.string());
}

}
