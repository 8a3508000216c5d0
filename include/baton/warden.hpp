/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>

#include "baton/file_lock.hpp"
#include "baton/layout.hpp"
#include "baton/types.hpp"

namespace baton {

class Heartbeat;
class Reaper;
class Journal;

struct WardenOptions {
    AgentId agent;
    std::chrono::milliseconds beatInterval{30000};
    std::chrono::milliseconds reapInterval{60000};
    std::chrono::seconds staleTimeout{900};
};

// Background upkeep for one agent: keeps its heartbeat fresh, reaps stale
// claims of other agents and rotates the coordination log once per day.
class Warden final {
public:
    Warden(const Layout& layout, const LockOptions& lockOptions, const WardenOptions& options);
    ~Warden();

    Warden(const Warden&) = delete;
    Warden& operator=(const Warden&) = delete;
    Warden(Warden&&) = delete;
    Warden& operator=(Warden&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] std::size_t beats() const noexcept { return beats_.load(); }
    [[nodiscard]] std::size_t reaps() const noexcept { return reaps_.load(); }
    [[nodiscard]] std::size_t reclaimed() const noexcept { return reclaimed_.load(); }

private:
    void loop();
    void beat();
    void reap();

    Layout layout_;
    LockOptions lockOptions_;
    WardenOptions options_;

    std::unique_ptr<Heartbeat> heartbeat_;
    std::unique_ptr<Reaper> reaper_;
    std::unique_ptr<Journal> journal_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<std::size_t> beats_{0};
    std::atomic<std::size_t> reaps_{0};
    std::atomic<std::size_t> reclaimed_{0};

    std::thread thread_;
};

}
