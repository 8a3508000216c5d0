/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/layout.hpp"
#include "baton/logger.hpp"

namespace baton {

Layout::Layout(const std::filesystem::path& root) noexcept
    : root_(root) {
}

bool Layout::ensure() const noexcept {
    try {
        std::filesystem::create_directories(root_);
        std::filesystem::create_directories(lockDir());
        std::filesystem::create_directories(heartbeatDir());
        std::filesystem::create_directories(root_ / ".lock");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create coordination root " + root_.string() + ": " + e.what());
        return false;
    }
}

std::optional<LockKey> Layout::keyFromFileName(const std::filesystem::path& file) {
    if (file.extension() != ".lock") {
        return std::nullopt;
    }
    std::string stem = file.stem().string();
    auto dot = stem.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == stem.size()) {
        return std::nullopt;
    }
    return LockKey{stem.substr(0, dot), stem.substr(dot + 1)};
}

}
