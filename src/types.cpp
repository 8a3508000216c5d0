/*
 * baton - Shared Backlog Coordination Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "baton/types.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace baton {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::tm toUtcTm(Timestamp tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return tm;
}
}

const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Unclaimed: return "unclaimed";
        case TaskStatus::Claimed: return "claimed";
        case TaskStatus::Blocked: return "blocked";
        case TaskStatus::Review: return "review";
        case TaskStatus::Done: return "done";
        default: return "unknown";
    }
}

const char* toString(Priority priority) noexcept {
    switch (priority) {
        case Priority::Urgent: return "urgent";
        case Priority::High: return "high";
        case Priority::Medium: return "medium";
        case Priority::Low: return "low";
        default: return "unknown";
    }
}

const char* toString(CoordError error) noexcept {
    switch (error) {
        case CoordError::None: return "none";
        case CoordError::LockTimeout: return "lock_timeout";
        case CoordError::NotFound: return "not_found";
        case CoordError::NotOwned: return "not_owned";
        case CoordError::NotInReview: return "not_in_review";
        case CoordError::IoError: return "io_error";
        case CoordError::InvalidArgument: return "invalid_argument";
        default: return "unknown";
    }
}

std::optional<TaskStatus> parseStatus(const std::string& value) {
    std::string v = toLowerCopy(value);
    if (v == "unclaimed") return TaskStatus::Unclaimed;
    if (v == "claimed") return TaskStatus::Claimed;
    if (v == "blocked") return TaskStatus::Blocked;
    if (v == "review") return TaskStatus::Review;
    if (v == "done") return TaskStatus::Done;
    return std::nullopt;
}

std::optional<Priority> parsePriority(const std::string& value) {
    std::string v = toLowerCopy(value);
    if (v == "urgent") return Priority::Urgent;
    if (v == "high") return Priority::High;
    if (v == "medium") return Priority::Medium;
    if (v == "low") return Priority::Low;
    return std::nullopt;
}

bool isValidAgentId(const AgentId& id) noexcept {
    return !id.empty() && id.find('/') == std::string::npos &&
           id.find('.') == std::string::npos && id.find('\0') == std::string::npos;
}

bool isValidTaskId(const TaskId& id) noexcept {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find('/') == std::string::npos && id.find('\0') == std::string::npos;
}

std::string toRfc3339(Timestamp tp) {
    std::tm tm = toUtcTm(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()) % 1000000;
    if (micros.count() < 0) {
        micros += std::chrono::microseconds(1000000);
    }

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << micros.count() << "+00:00";
    return ss.str();
}

std::optional<Timestamp> parseRfc3339(const std::string& value) noexcept {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(value.c_str(), "%4d-%2d-%2d%*1[Tt ]%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    long long micros = 0;
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (value[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 6; ++i) micros *= 10;
    }

    long offsetSeconds = 0;
    if (pos >= value.size()) {
        return std::nullopt;
    }
    if (value[pos] == 'Z' || value[pos] == 'z') {
        ++pos;
    } else if (value[pos] == '+' || value[pos] == '-') {
        int oh = 0, om = 0;
        if (std::sscanf(value.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
            return std::nullopt;
        }
        offsetSeconds = (oh * 3600L + om * 60L) * (value[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != value.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = ::timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(t - offsetSeconds) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(
               std::chrono::microseconds(micros));
}

std::string utcDate(Timestamp tp) {
    std::tm tm = toUtcTm(tp);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

} // namespace baton
