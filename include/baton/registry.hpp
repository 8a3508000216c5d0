/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "baton/layout.hpp"
#include "baton/records.hpp"
#include "baton/types.hpp"

namespace baton {

struct RegistryRead {
    bool ok = false;
    RegistrySnapshot snapshot;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct DependencyRead {
    bool ok = false;
    DependencyMap dependencies;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// On-disk registry and dependency map. Holds no lock of its own: callers wrap
// every load-mutate-save sequence in withLock on the registry guard.
class RegistryStore final {
public:
    explicit RegistryStore(const Layout& layout) noexcept;

    // A missing registry file reads as an empty registry.
    [[nodiscard]] RegistryRead load() const noexcept;
    [[nodiscard]] OpResult save(const RegistrySnapshot& snapshot) const noexcept;

    // A missing dependency map reads as an empty map.
    [[nodiscard]] DependencyRead loadDependencies() const noexcept;

private:
    Layout layout_;
};

}
