/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <catch2/catch.hpp>
#include "baton/file_lock.hpp"
#include "test_support.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace baton;
using namespace std::chrono_literals;

TEST_CASE("FileLock excludes other holders", "[file_lock]") {
    test::TempRoot root;
    const auto guard = root.layout().guardPath(kRegistryGuard);

    SECTION("Second acquirer times out while the first holds") {
        FileLock first(guard, test::fastLocks());
        REQUIRE(first.held());

        LockOptions shortWait;
        shortWait.timeout = 100ms;
        shortWait.pollInterval = 10ms;
        FileLock second(guard, shortWait);
        REQUIRE_FALSE(second.held());
        REQUIRE(second.status().error == CoordError::LockTimeout);
    }

    SECTION("Release lets the next acquirer in") {
        {
            FileLock first(guard, test::fastLocks());
            REQUIRE(first.held());
        }
        FileLock second(guard, test::fastLocks());
        REQUIRE(second.held());
    }

    SECTION("Different resources do not contend") {
        FileLock registry(guard, test::fastLocks());
        FileLock quota(root.layout().guardPath(kQuotaGuard), test::fastLocks());
        REQUIRE(registry.held());
        REQUIRE(quota.held());
    }
}

TEST_CASE("withLock serializes critical sections", "[file_lock][concurrency]") {
    test::TempRoot root;
    const auto guard = root.layout().guardPath(kRegistryGuard);

    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::atomic<int> completed{0};

    std::vector<std::thread> racers;
    for (int i = 0; i < 8; ++i) {
        racers.emplace_back([&]() {
            for (int round = 0; round < 5; ++round) {
                auto result = withLock(guard, test::fastLocks(), [&]() {
                    int now = ++inside;
                    int seen = maxInside.load();
                    while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {}
                    std::this_thread::sleep_for(1ms);
                    --inside;
                    return OpResult::success();
                });
                if (result) ++completed;
            }
        });
    }
    for (auto& t : racers) t.join();

    REQUIRE(completed == 40);
    REQUIRE(maxInside == 1);
}

TEST_CASE("withLock turns exceptions into IoError and releases", "[file_lock]") {
    test::TempRoot root;
    const auto guard = root.layout().guardPath(kRegistryGuard);

    auto failed = withLock(guard, test::fastLocks(), []() -> OpResult {
        throw std::runtime_error("disk on fire");
    });
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error == CoordError::IoError);
    REQUIRE(failed.message == "disk on fire");

    FileLock after(guard, test::fastLocks());
    REQUIRE(after.held());
}
