/*
 * baton - Command tool commands
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "commands.hpp"
#include "baton/claim.hpp"
#include "baton/config.hpp"
#include "baton/journal.hpp"
#include "baton/liveness.hpp"
#include "baton/logger.hpp"
#include "baton/quota.hpp"
#include "baton/resolver.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <ostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace baton::cli {

void printUsage(std::ostream& os, const char* progName) {
    os << "baton Shared Backlog Tool v" << VERSION << "\n\n";
    os << "Usage: " << progName << " [options] <command> [args]\n\n";
    os << "Commands:\n";
    os << "  claim [--capability C] [--skill-level S] [--any]\n";
    os << "                        Claim the next eligible task\n";
    os << "  release <task_id>     Mark a task you hold as done\n";
    os << "  approve <task_id>     Approve a task in review\n";
    os << "  msg <text...>         Append a line to the coordination log\n";
    os << "  beat                  Refresh this agent's heartbeat\n";
    os << "  clean-stale [--timeout SECS]\n";
    os << "                        Reclaim tasks from silent agents\n";
    os << "  quota [--add N | --reset]\n";
    os << "                        Show or update the shared usage counters\n";
    os << "  ls [--verbose]        List the registry\n";
    os << "  log [--tail N]        Show the coordination log\n";
    os << "  rotate-log            Archive the coordination log under today's date\n\n";
    os << "Options:\n";
    os << "  --json, --agent       Single-line JSON output\n";
    os << "  --root <dir>          Coordination root (default " << kDefaultRoot << ")\n";
    os << "  --agent-id <id>       Identity of the calling agent\n";
    os << "  -h, --help            Show this help message\n";
    os << "  -v, --version         Show version\n\n";
    os << "Environment Variables:\n";
    os << "  BATON_ROOT            Coordination root\n";
    os << "  BATON_AGENT_ID        Agent identity (random if unset)\n";
    os << "  BATON_LOCK_TIMEOUT    Lock wait bound in seconds (default 30)\n";
    os << "  BATON_STALE_TIMEOUT   Heartbeat timeout for clean-stale (default 900)\n";
    os << "  BATON_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    os << "Examples:\n";
    os << "  " << progName << " --agent-id worker-1 claim --capability backend\n";
    os << "  " << progName << " --json --agent-id worker-1 release T-12\n";
    os << "  " << progName << " ls --verbose\n";
}

namespace {

struct Output {
    std::ostream& os;
    std::ostream& es;
    bool jsonMode = false;

    int fail(CoordError error, const std::string& message) const {
        if (jsonMode) {
            os << json::object({{"status", "error"}, {"error", toString(error)}, {"message", message}}).dump()
               << std::endl;
        } else {
            es << "Error: " << message << std::endl;
        }
        return 1;
    }

    int success(const std::string& action, json extra, const std::string& text) const {
        if (jsonMode) {
            json out = {{"status", "success"}, {"action", action}};
            for (const auto& item : extra.items()) {
                out[item.key()] = item.value();
            }
            os << out.dump() << std::endl;
        } else if (!text.empty()) {
            os << text << std::endl;
        }
        return 0;
    }
};

std::optional<std::uint64_t> parseCount(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

const char* glyph(TaskStatus status) {
    switch (status) {
        case TaskStatus::Unclaimed: return "[ ]";
        case TaskStatus::Claimed: return "[~]";
        case TaskStatus::Blocked: return "[!]";
        case TaskStatus::Review: return "[?]";
        case TaskStatus::Done: return "[✓]";
        default: return "[ ]";
    }
}

int cmdClaim(const Config& config, const Output& out, const std::vector<std::string>& args) {
    ClaimFilter filter;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--capability" && i + 1 < args.size()) {
            filter.capability = args[++i];
        } else if (arg == "--skill-level" && i + 1 < args.size()) {
            filter.skillLevel = args[++i];
        } else if (arg == "--any") {
            filter.any = true;
        } else {
            return out.fail(CoordError::InvalidArgument, "Unexpected claim argument: " + arg);
        }
    }

    const Layout layout(config.root);
    const LockOptions lockOptions{config.lockTimeout};

    // A claim made without a heartbeat would be reaped at the next pass.
    auto beat = Heartbeat(layout).touch(config.agentId);
    if (!beat) {
        return out.fail(beat.error, beat.message);
    }

    auto result = ClaimEngine(layout, lockOptions).claim(config.agentId, filter);
    if (!result) {
        return out.fail(result.error, result.message);
    }

    if (!result.task) {
        if (out.jsonMode) {
            out.os << json::object({{"status", "no_eligible_task"}}).dump() << std::endl;
        } else {
            out.os << "No eligible task" << std::endl;
        }
        return 0;
    }

    if (out.jsonMode) {
        json task = *result.task;
        out.os << task.dump() << std::endl;
    } else {
        out.os << "Claimed " << result.task->id << ": " << result.task->title
                  << " (" << toString(result.task->priority) << ")" << std::endl;
    }
    return 0;
}

int cmdRelease(const Config& config, const Output& out, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return out.fail(CoordError::InvalidArgument, "release takes exactly one task id");
    }
    const Layout layout(config.root);
    auto released = ClaimEngine(layout, LockOptions{config.lockTimeout}).release(args[0], config.agentId);
    if (!released) {
        return out.fail(released.error, released.message);
    }
    return out.success("release", {{"task_id", args[0]}}, "Released " + args[0]);
}

int cmdApprove(const Config& config, const Output& out, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return out.fail(CoordError::InvalidArgument, "approve takes exactly one task id");
    }
    const Layout layout(config.root);
    auto approved = ClaimEngine(layout, LockOptions{config.lockTimeout}).approve(args[0], config.agentId);
    if (!approved) {
        return out.fail(approved.error, approved.message);
    }
    return out.success("approve", {{"task_id", args[0]}}, "Approved " + args[0]);
}

int cmdMsg(const Config& config, const Output& out, const std::vector<std::string>& args) {
    std::ostringstream text;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i) text << " ";
        text << args[i];
    }
    if (text.str().empty()) {
        return out.fail(CoordError::InvalidArgument, "msg needs a message");
    }
    const Layout layout(config.root);
    auto appended = Journal(layout, LockOptions{config.lockTimeout}).append(config.agentId, text.str());
    if (!appended) {
        return out.fail(appended.error, appended.message);
    }
    return out.success("msg", json::object(), "");
}

int cmdBeat(const Config& config, const Output& out) {
    auto touched = Heartbeat(Layout(config.root)).touch(config.agentId);
    if (!touched) {
        return out.fail(touched.error, touched.message);
    }
    return out.success("beat", {{"agent_id", config.agentId}}, "Heartbeat " + config.agentId);
}

int cmdCleanStale(const Config& config, const Output& out, const std::vector<std::string>& args) {
    auto timeout = config.staleTimeout;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--timeout" && i + 1 < args.size()) {
            auto secs = parseCount(args[++i]);
            if (!secs) {
                return out.fail(CoordError::InvalidArgument, "Invalid timeout: " + args[i]);
            }
            timeout = std::chrono::seconds(*secs);
        } else {
            return out.fail(CoordError::InvalidArgument, "Unexpected clean-stale argument: " + args[i]);
        }
    }

    const Layout layout(config.root);
    const LockOptions lockOptions{config.lockTimeout};

    auto rotated = Journal(layout, lockOptions).rotateIfDue(std::chrono::system_clock::now());
    if (!rotated) {
        LOG_WARN("Log rotation failed: " + rotated.message);
    }

    auto result = Reaper(layout, lockOptions).cleanStaleLocks(timeout);
    if (!result) {
        return out.fail(result.error, result.message);
    }

    json cleaned = json::array();
    std::ostringstream text;
    text << "Reclaimed " << result.reclaimed.size() << " stale lock(s)";
    for (const auto& key : result.reclaimed) {
        cleaned.push_back(key.str());
        text << "\n  " << key.str();
    }
    return out.success("clean_stale", {{"cleaned", cleaned}}, text.str());
}

int cmdQuota(const Config& config, const Output& out, const std::vector<std::string>& args) {
    std::optional<std::uint64_t> add;
    bool reset = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--add" && i + 1 < args.size()) {
            add = parseCount(args[++i]);
            if (!add) {
                return out.fail(CoordError::InvalidArgument, "Invalid token count: " + args[i]);
            }
        } else if (args[i] == "--reset") {
            reset = true;
        } else {
            return out.fail(CoordError::InvalidArgument, "Unexpected quota argument: " + args[i]);
        }
    }
    if (add && reset) {
        return out.fail(CoordError::InvalidArgument, "--add and --reset are exclusive");
    }

    const QuotaTracker tracker(Layout(config.root), LockOptions{config.lockTimeout});
    auto result = add ? tracker.add(*add) : reset ? tracker.reset() : tracker.read();
    if (!result) {
        return out.fail(result.error, result.message);
    }

    std::ostringstream text;
    text << "Tokens used: " << result.quota.tokensUsed << "\n"
         << "Requests:    " << result.quota.requests << "\n"
         << "Last reset:  " << toRfc3339(result.quota.lastReset);
    return out.success("quota", {{"quota", result.quota}}, text.str());
}

int cmdList(const Config& config, const Output& out, const std::vector<std::string>& args, bool verbose) {
    for (const auto& arg : args) {
        if (arg == "--verbose") {
            verbose = true;
        } else {
            return out.fail(CoordError::InvalidArgument, "Unexpected ls argument: " + arg);
        }
    }

    const ClaimEngine engine(Layout(config.root), LockOptions{config.lockTimeout});
    auto registry = engine.snapshot();
    if (!registry) {
        return out.fail(registry.error, registry.message);
    }

    if (out.jsonMode) {
        json j = registry.snapshot;
        out.os << j.dump() << std::endl;
        return 0;
    }

    if (registry.snapshot.tasks.empty()) {
        out.os << "No tasks" << std::endl;
        return 0;
    }

    DependencyMap deps;
    if (verbose) {
        auto loaded = engine.dependencies();
        if (!loaded) {
            return out.fail(loaded.error, loaded.message);
        }
        deps = std::move(loaded.dependencies);
    }
    const auto statuses = indexStatuses(registry.snapshot);

    for (const auto& task : registry.snapshot.tasks) {
        out.os << glyph(task.status) << " " << task.id << "  " << task.title
                  << "  (" << toString(task.priority) << ")";
        if (verbose) {
            if (task.claimedBy) {
                out.os << "  claimed by " << *task.claimedBy;
            }
            if (task.blockedReason) {
                out.os << "  blocked: " << *task.blockedReason;
            }
            if (task.status == TaskStatus::Unclaimed) {
                auto pending = pendingPrerequisites(task, statuses, deps);
                if (!pending.empty()) {
                    out.os << "  waiting on";
                    for (const auto& id : pending) out.os << " " << id;
                }
            }
        }
        out.os << "\n";
    }
    out.os.flush();
    return 0;
}

int cmdLog(const Config& config, const Output& out, const std::vector<std::string>& args) {
    std::size_t count = 20;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--tail" && i + 1 < args.size()) {
            auto n = parseCount(args[++i]);
            if (!n) {
                return out.fail(CoordError::InvalidArgument, "Invalid line count: " + args[i]);
            }
            count = static_cast<std::size_t>(*n);
        } else {
            return out.fail(CoordError::InvalidArgument, "Unexpected log argument: " + args[i]);
        }
    }

    auto result = Journal(Layout(config.root), LockOptions{config.lockTimeout}).tail(count);
    if (!result) {
        return out.fail(result.error, result.message);
    }
    if (out.jsonMode) {
        return out.success("log", {{"lines", result.lines}}, "");
    }
    for (const auto& line : result.lines) {
        out.os << line << "\n";
    }
    out.os.flush();
    return 0;
}

int cmdRotateLog(const Config& config, const Output& out) {
    auto result = Journal(Layout(config.root), LockOptions{config.lockTimeout})
                      .rotate(std::chrono::system_clock::now());
    if (!result) {
        return out.fail(result.error, result.message);
    }
    if (!result.rotated) {
        return out.success("rotate_log", {{"rotated", false}}, "Nothing to rotate");
    }
    return out.success("rotate_log", {{"rotated", true}, {"archive", result.archive.string()}},
                       "Archived to " + result.archive.string());
}

}

int run(const std::vector<std::string>& argv, std::ostream& os, std::ostream& es, const char* progName) {
    Output out{os, es};
    std::optional<std::string> root;
    std::optional<std::string> agentId;
    bool verbose = false;
    std::string command;
    std::vector<std::string> args;

    for (std::size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg == "--json" || arg == "--agent") {
            out.jsonMode = true;
        } else if (arg == "--root" || arg == "--agent-id") {
            if (i + 1 >= argv.size()) {
                es << "Error: " << arg << " requires a value\n";
                return 1;
            }
            (arg == "--root" ? root : agentId) = argv[++i];
        } else if (command.empty()) {
            if (arg == "--verbose") {
                verbose = true;
            } else {
                command = arg;
            }
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        printUsage(os, progName);
        return 1;
    }

    try {
        Config config = Config::fromEnv();
        if (root) config.root = *root;
        if (agentId) {
            config.agentId = *agentId;
            config.agentIdGenerated = false;
        }
        if (config.agentIdGenerated) {
            LOG_WARN("No agent id configured, using generated id " + config.agentId);
        }
        if (!isValidAgentId(config.agentId)) {
            return out.fail(CoordError::InvalidArgument,
                            "Invalid agent id '" + config.agentId + "': no '/', '.' or NUL allowed");
        }

        if (!Layout(config.root).ensure()) {
            return out.fail(CoordError::IoError, "Failed to prepare coordination root " + config.root.string());
        }

        if (command == "claim") return cmdClaim(config, out, args);
        if (command == "release") return cmdRelease(config, out, args);
        if (command == "approve") return cmdApprove(config, out, args);
        if (command == "msg") return cmdMsg(config, out, args);
        if (command == "beat") return cmdBeat(config, out);
        if (command == "clean-stale") return cmdCleanStale(config, out, args);
        if (command == "quota") return cmdQuota(config, out, args);
        if (command == "ls") return cmdList(config, out, args, verbose);
        if (command == "log") return cmdLog(config, out, args);
        if (command == "rotate-log") return cmdRotateLog(config, out);

        es << "Error: Unknown command: " << command << "\n\n";
        printUsage(es, progName);
        return 1;

    } catch (const std::exception& e) {
        return out.fail(CoordError::IoError, e.what());
    }
}

}
