/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/quota.hpp"
#include "baton/io.hpp"
#include "baton/logger.hpp"

using json = nlohmann::json;

namespace baton {

QuotaTracker::QuotaTracker(const Layout& layout, const LockOptions& lockOptions) noexcept
    : layout_(layout), lockOptions_(lockOptions) {
}

template <typename Mutate>
QuotaResult QuotaTracker::update(Mutate&& mutate, bool persist) const noexcept {
    QuotaResult result;
    auto locked = withLock(layout_.guardPath(kQuotaGuard), lockOptions_, [&]() {
        const auto path = layout_.quotaPath();
        QuotaRecord quota;
        if (std::filesystem::exists(path)) {
            std::string content;
            auto read = readFile(path, content);
            if (!read) {
                return read;
            }
            quota = json::parse(content).get<QuotaRecord>();
        } else {
            quota.lastReset = std::chrono::system_clock::now();
        }

        mutate(quota);

        if (persist) {
            json j = quota;
            auto written = writeFileAtomic(path, j.dump(2) + "\n");
            if (!written) {
                return written;
            }
        }
        result.quota = quota;
        return OpResult::success();
    });

    result.ok = locked.ok;
    result.error = locked.error;
    result.message = locked.message;
    return result;
}

QuotaResult QuotaTracker::read() const noexcept {
    return update([](QuotaRecord&) {}, false);
}

QuotaResult QuotaTracker::add(std::uint64_t tokens) const noexcept {
    auto result = update([tokens](QuotaRecord& quota) {
        quota.tokensUsed += tokens;
        quota.requests += 1;
    }, true);
    if (result) {
        LOG_DEBUG("Quota now " + std::to_string(result.quota.tokensUsed) + " tokens over " +
                  std::to_string(result.quota.requests) + " requests");
    }
    return result;
}

QuotaResult QuotaTracker::reset() const noexcept {
    auto result = update([](QuotaRecord& quota) {
        quota.tokensUsed = 0;
        quota.requests = 0;
        quota.lastReset = std::chrono::system_clock::now();
    }, true);
    if (result) {
        LOG_INFO("Quota counters reset");
    }
    return result;
}

}
