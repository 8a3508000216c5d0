/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/warden.hpp"
#include "baton/journal.hpp"
#include "baton/liveness.hpp"
#include "baton/logger.hpp"
#include <algorithm>
#include <string>

namespace baton {

// Note: signal handling is done by the CLI (batond.cpp), not by Warden

Warden::Warden(const Layout& layout, const LockOptions& lockOptions, const WardenOptions& options)
    : layout_(layout), lockOptions_(lockOptions), options_(options) {
    LOG_DEBUG("Warden created - agent: " + options_.agent + ", root: " + layout_.root().string() +
              ", stale timeout: " + std::to_string(options_.staleTimeout.count()) + "s");
}

Warden::~Warden() {
    shutdown();
}

bool Warden::start() {
    if (running_.load()) {
        LOG_WARN("Warden already running");
        return false;
    }
    if (!isValidAgentId(options_.agent)) {
        LOG_ERROR("Warden needs a valid agent id, got '" + options_.agent + "'");
        return false;
    }

    if (!layout_.ensure()) {
        LOG_ERROR("Failed to prepare coordination root");
        return false;
    }

    try {
        heartbeat_ = std::make_unique<Heartbeat>(layout_);
        reaper_ = std::make_unique<Reaper>(layout_, lockOptions_);
        journal_ = std::make_unique<Journal>(layout_, lockOptions_);

        shutdown_.store(false);
        running_.store(true);
        thread_ = std::thread(&Warden::loop, this);

        LOG_INFO("Warden started for agent " + options_.agent);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start warden: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Warden::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down warden...");

    shutdown_.store(true);
    running_.store(false);

    if (thread_.joinable()) {
        thread_.join();
    }

    journal_.reset();
    reaper_.reset();
    heartbeat_.reset();

    LOG_INFO("Warden shutdown complete");
}

void Warden::beat() {
    auto touched = heartbeat_->touch(options_.agent);
    if (!touched) {
        LOG_ERROR("Heartbeat failed: " + touched.message);
        return;
    }
    beats_.fetch_add(1);
}

void Warden::reap() {
    auto rotated = journal_->rotateIfDue(std::chrono::system_clock::now());
    if (!rotated) {
        LOG_WARN("Log rotation failed: " + rotated.message);
    }

    auto result = reaper_->cleanStaleLocks(options_.staleTimeout);
    if (!result) {
        LOG_WARN("Reap pass failed (" + std::string(toString(result.error)) + "): " + result.message);
        return;
    }
    reaps_.fetch_add(1);
    reclaimed_.fetch_add(result.reclaimed.size());
    for (const auto& key : result.reclaimed) {
        LOG_INFO("Reclaimed " + key.str());
    }
}

void Warden::loop() {
    setThreadName("Warden");
    LOG_DEBUG("Warden loop started");

    auto nextBeat = std::chrono::steady_clock::now();
    auto nextReap = nextBeat;

    while (!shutdown_.load()) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (now >= nextBeat) {
                beat();
                nextBeat = now + options_.beatInterval;
            }
            if (now >= nextReap && !shutdown_.load()) {
                reap();
                nextReap = std::chrono::steady_clock::now() + options_.reapInterval;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Warden loop error: " + std::string(e.what()));
        }

        auto sleepEnd = std::min(nextBeat, nextReap);
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    LOG_DEBUG("Warden loop stopped");
}

}
