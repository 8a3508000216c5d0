/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "baton/file_lock.hpp"
#include "baton/layout.hpp"
#include "baton/records.hpp"
#include "baton/types.hpp"

namespace baton {

struct QuotaResult {
    bool ok = false;
    QuotaRecord quota;
    CoordError error = CoordError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Shared usage counters in quota.json, guarded by .lock/quota.lock.
// Independent of task state and of the registry guard.
class QuotaTracker final {
public:
    QuotaTracker(const Layout& layout, const LockOptions& lockOptions) noexcept;

    [[nodiscard]] QuotaResult read() const noexcept;
    [[nodiscard]] QuotaResult add(std::uint64_t tokens) const noexcept;
    [[nodiscard]] QuotaResult reset() const noexcept;

private:
    template <typename Mutate>
    [[nodiscard]] QuotaResult update(Mutate&& mutate, bool persist) const noexcept;

    Layout layout_;
    LockOptions lockOptions_;
};

}
