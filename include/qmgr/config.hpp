/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

#include "qmgr/executor.hpp"
#include "qmgr/result_guard.hpp"
#include "qmgr/types.hpp"

namespace qmgr {

// Which terminal records cleanup() may delete. Zero disables a limit.
// Non-terminal records are never touched.
struct RetentionPolicy {
    std::chrono::seconds maxAge{0};
    std::size_t maxTerminalRecords = 0;

    [[nodiscard]] bool enabled() const noexcept {
        return maxAge.count() > 0 || maxTerminalRecords > 0;
    }
};

// Caps on how many records the registry holds. When a cap is reached the
// oldest terminal record in scope is evicted; with none to evict, submit
// fails with QueueFull. Zero disables a limit.
struct CapacityLimits {
    std::size_t maxJobs = 0;
    std::map<std::string, std::size_t> perType;

    [[nodiscard]] std::size_t limitFor(const std::string& jobType) const noexcept {
        auto it = perType.find(jobType);
        return it == perType.end() ? 0 : it->second;
    }
};

struct SupervisorConfig {
    std::filesystem::path registryPath = "qmgr_registry.jsonl";
    int maxConcurrentJobs = 10;
    std::uint64_t resultWarnBytes = ResultGuard::kDefaultWarnBytes;
    std::uint64_t resultMaxBytes = ResultGuard::kDefaultMaxBytes;

    std::chrono::milliseconds jobTimeout{0};           // 0 = no limit
    std::chrono::milliseconds cancelGrace{2000};
    std::chrono::milliseconds hookTimeout{5000};
    std::chrono::milliseconds shutdownTimeout{30000};
    std::chrono::seconds cleanupInterval{60};           // 0 = no maintenance thread

    RetentionPolicy retention;
    CapacityLimits capacity;
    // Compact once superseded lines exceed this share of the log.
    int compactThresholdPercent = 50;

    Isolation isolation = Isolation::Process;
    bool syncWrites = true;
    // Off: submit leaves the job CREATED until start(job_id). On: submit also
    // admits it, so a free worker may pick it up before submit returns.
    bool autoStart = false;

    // Defaults overridden by QMGR_* variables; unparsable values keep the default.
    [[nodiscard]] static SupervisorConfig fromEnv();
    [[nodiscard]] OpResult validate() const;
};

}
