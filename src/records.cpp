/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/records.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace baton {

namespace {
template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json optionalTimeToJson(const std::optional<Timestamp>& value) {
    return value ? json(toRfc3339(*value)) : json(nullptr);
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

Timestamp requireTime(const std::string& value, const char* field) {
    auto parsed = parseRfc3339(value);
    if (!parsed) {
        throw std::invalid_argument(std::string("Invalid timestamp in ") + field + ": " + value);
    }
    return *parsed;
}

std::optional<Timestamp> optionalTime(const json& j, const char* key) {
    auto value = optionalString(j, key);
    if (!value) {
        return std::nullopt;
    }
    return requireTime(*value, key);
}
}

WorkItem* RegistrySnapshot::find(const TaskId& id) noexcept {
    for (auto& task : tasks) {
        if (task.id == id) return &task;
    }
    return nullptr;
}

const WorkItem* RegistrySnapshot::find(const TaskId& id) const noexcept {
    for (const auto& task : tasks) {
        if (task.id == id) return &task;
    }
    return nullptr;
}

void to_json(json& j, const WorkItem& item) {
    j = json{
        {"id", item.id},
        {"title", item.title},
        {"status", toString(item.status)},
        {"priority", toString(item.priority)},
        {"claimed_by", optionalToJson(item.claimedBy)},
        {"claimed_at", optionalTimeToJson(item.claimedAt)},
        {"completed_at", optionalTimeToJson(item.completedAt)},
        {"blocked_reason", optionalToJson(item.blockedReason)},
        {"reviewer_id", optionalToJson(item.reviewerId)},
        {"capability", optionalToJson(item.capability)},
        {"skill_level", optionalToJson(item.skillLevel)},
    };
}

void from_json(const json& j, WorkItem& item) {
    item.id = j.at("id").get<std::string>();
    item.title = j.value("title", std::string());

    auto status = parseStatus(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("Unknown status for task " + item.id);
    }
    item.status = *status;

    auto priority = parsePriority(j.value("priority", std::string("medium")));
    if (!priority) {
        throw std::invalid_argument("Unknown priority for task " + item.id);
    }
    item.priority = *priority;

    item.claimedBy = optionalString(j, "claimed_by");
    item.claimedAt = optionalTime(j, "claimed_at");
    item.completedAt = optionalTime(j, "completed_at");
    item.blockedReason = optionalString(j, "blocked_reason");
    item.reviewerId = optionalString(j, "reviewer_id");
    item.capability = optionalString(j, "capability");
    item.skillLevel = optionalString(j, "skill_level");
}

void to_json(json& j, const RegistrySnapshot& snapshot) {
    j = json{{"tasks", snapshot.tasks}};
}

void from_json(const json& j, RegistrySnapshot& snapshot) {
    const json& tasks = j.is_array() ? j : j.at("tasks");
    snapshot.tasks = tasks.get<std::vector<WorkItem>>();
}

void to_json(json& j, const LockRecord& record) {
    j = json{
        {"holder", record.holder},
        {"since", toRfc3339(record.since)},
        {"task_id", record.taskId},
    };
}

void from_json(const json& j, LockRecord& record) {
    record.holder = j.at("holder").get<std::string>();
    record.since = requireTime(j.at("since").get<std::string>(), "since");
    record.taskId = j.value("task_id", std::string());
}

void to_json(json& j, const QuotaRecord& record) {
    j = json{
        {"tokens_used", record.tokensUsed},
        {"last_reset", toRfc3339(record.lastReset)},
        {"requests", record.requests},
    };
}

void from_json(const json& j, QuotaRecord& record) {
    record.tokensUsed = j.value("tokens_used", std::uint64_t{0});
    record.requests = j.value("requests", std::uint64_t{0});
    record.lastReset = requireTime(j.at("last_reset").get<std::string>(), "last_reset");
}

}
