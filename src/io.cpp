/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/io.hpp"
#include "baton/logger.hpp"
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace baton {

OpResult readFile(const std::filesystem::path& path, std::string& content) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return OpResult::failure(CoordError::IoError, "Failed to open " + path.string());
        }
        content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            return OpResult::failure(CoordError::IoError, "Failed to read " + path.string());
        }
        return OpResult::success();
    } catch (const std::exception& e) {
        return OpResult::failure(CoordError::IoError, "Failed to read " + path.string() + ": " + e.what());
    }
}

OpResult writeFileAtomic(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        auto tmpPath = path;
        tmpPath += ".tmp." + std::to_string(::getpid());
        {
            std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                return OpResult::failure(CoordError::IoError, "Failed to open " + tmpPath.string());
            }
            file << content;
            file.flush();
            file.close();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(tmpPath, ec);
                return OpResult::failure(CoordError::IoError, "Failed to write " + tmpPath.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmpPath, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            return OpResult::failure(CoordError::IoError,
                "Failed to publish " + path.string() + ": " + ec.message());
        }
        LOG_TRACE("Wrote " + std::to_string(content.size()) + " bytes to " + path.string());
        return OpResult::success();
    } catch (const std::exception& e) {
        return OpResult::failure(CoordError::IoError, "Failed to write " + path.string() + ": " + e.what());
    }
}

OpResult appendLine(const std::filesystem::path& path, const std::string& line) noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::binary | std::ios::app);
        if (!file) {
            return OpResult::failure(CoordError::IoError, "Failed to open " + path.string());
        }
        file << line << "\n";
        file.flush();
        if (!file.good()) {
            return OpResult::failure(CoordError::IoError, "Failed to append to " + path.string());
        }
        return OpResult::success();
    } catch (const std::exception& e) {
        return OpResult::failure(CoordError::IoError, "Failed to append to " + path.string() + ": " + e.what());
    }
}

Timestamp toSystemTime(std::filesystem::file_time_type fileTime) noexcept {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fileTime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

}
