/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "baton/types.hpp"

namespace baton {

[[nodiscard]] OpResult readFile(const std::filesystem::path& path, std::string& content) noexcept;

// Writes to a sibling temp file, then rename()s it over path.
[[nodiscard]] OpResult writeFileAtomic(const std::filesystem::path& path, const std::string& content) noexcept;

// Maps a file's last-write time onto the system clock.
[[nodiscard]] Timestamp toSystemTime(std::filesystem::file_time_type fileTime) noexcept;

// Appends one line, creating the file if needed.
[[nodiscard]] OpResult appendLine(const std::filesystem::path& path, const std::string& line) noexcept;

}
