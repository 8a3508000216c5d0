/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/registry.hpp"
#include "baton/io.hpp"
#include "baton/logger.hpp"

using json = nlohmann::json;

namespace baton {

RegistryStore::RegistryStore(const Layout& layout) noexcept
    : layout_(layout) {
}

RegistryRead RegistryStore::load() const noexcept {
    RegistryRead result;
    const auto path = layout_.registryPath();
    try {
        if (!std::filesystem::exists(path)) {
            LOG_DEBUG("Registry not found, treating as empty: " + path.string());
            result.ok = true;
            return result;
        }

        std::string content;
        auto read = readFile(path, content);
        if (!read) {
            result.error = read.error;
            result.message = read.message;
            return result;
        }

        result.snapshot = json::parse(content).get<RegistrySnapshot>();
        result.ok = true;
        LOG_TRACE("Loaded " + std::to_string(result.snapshot.tasks.size()) + " tasks from registry");
    } catch (const std::exception& e) {
        result.error = CoordError::IoError;
        result.message = "Failed to load registry " + path.string() + ": " + e.what();
        LOG_ERROR(result.message);
    }
    return result;
}

OpResult RegistryStore::save(const RegistrySnapshot& snapshot) const noexcept {
    try {
        json j = snapshot;
        auto written = writeFileAtomic(layout_.registryPath(), j.dump(2) + "\n");
        if (!written) {
            LOG_ERROR(written.message);
        }
        return written;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to serialize registry: " + std::string(e.what()));
        return OpResult::failure(CoordError::IoError, e.what());
    }
}

DependencyRead RegistryStore::loadDependencies() const noexcept {
    DependencyRead result;
    const auto path = layout_.dependencyMapPath();
    try {
        if (!std::filesystem::exists(path)) {
            result.ok = true;
            return result;
        }

        std::string content;
        auto read = readFile(path, content);
        if (!read) {
            result.error = read.error;
            result.message = read.message;
            return result;
        }

        result.dependencies = json::parse(content).get<DependencyMap>();
        result.ok = true;
    } catch (const std::exception& e) {
        result.error = CoordError::IoError;
        result.message = "Failed to load dependency map " + path.string() + ": " + e.what();
        LOG_ERROR(result.message);
    }
    return result;
}

}
