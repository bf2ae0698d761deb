/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/config.hpp"
#include "qmgr/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace qmgr {

namespace {
// Unlike a size limit, zero is meaningful for most settings here ("off").
std::uint64_t env_u64(const char* name, std::uint64_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t used = 0;
        const std::string text(val);
        if (text.find('-') != std::string::npos) {
            throw std::invalid_argument("negative");
        }
        std::uint64_t parsed = std::stoull(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

// "type=count,type=count"; malformed entries are skipped.
std::map<std::string, std::size_t> env_type_limits(const char* name) {
    std::map<std::string, std::size_t> limits;
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return limits;
    }
    std::stringstream entries(val);
    std::string entry;
    while (std::getline(entries, entry, ',')) {
        const auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == entry.size()) {
            LOG_WARN(std::string("Ignoring invalid ") + name + " entry '" + entry + "'");
            continue;
        }
        const std::string count = entry.substr(eq + 1);
        if (count.find_first_not_of("0123456789") != std::string::npos) {
            LOG_WARN(std::string("Ignoring invalid ") + name + " entry '" + entry + "'");
            continue;
        }
        try {
            limits[entry.substr(0, eq)] = static_cast<std::size_t>(std::stoull(count));
        } catch (const std::out_of_range&) {
            LOG_WARN(std::string("Ignoring invalid ") + name + " entry '" + entry + "'");
        }
    }
    return limits;
}

bool env_flag(const char* name, bool defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    std::string text(val);
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
    return defv;
}
}

SupervisorConfig SupervisorConfig::fromEnv() {
    SupervisorConfig config;

    if (const char* path = std::getenv("QMGR_REGISTRY_PATH"); path && *path) {
        config.registryPath = path;
    }

    config.maxConcurrentJobs = static_cast<int>(std::min<std::uint64_t>(
        env_u64("QMGR_MAX_CONCURRENT_JOBS", static_cast<std::uint64_t>(config.maxConcurrentJobs)), 4096));
    config.resultWarnBytes = env_u64("QMGR_RESULT_WARN_BYTES", config.resultWarnBytes);
    config.resultMaxBytes = env_u64("QMGR_RESULT_MAX_BYTES", config.resultMaxBytes);

    using std::chrono::milliseconds;
    using std::chrono::seconds;
    config.jobTimeout = milliseconds(env_u64("QMGR_JOB_TIMEOUT_MS", config.jobTimeout.count()));
    config.cancelGrace = milliseconds(env_u64("QMGR_CANCEL_GRACE_MS", config.cancelGrace.count()));
    config.hookTimeout = milliseconds(env_u64("QMGR_HOOK_TIMEOUT_MS", config.hookTimeout.count()));
    config.shutdownTimeout = milliseconds(env_u64("QMGR_SHUTDOWN_TIMEOUT_MS", config.shutdownTimeout.count()));
    config.cleanupInterval = seconds(env_u64("QMGR_CLEANUP_INTERVAL_S", config.cleanupInterval.count()));

    config.retention.maxAge = seconds(env_u64("QMGR_RETENTION_MAX_AGE_S", 0));
    config.retention.maxTerminalRecords = env_u64("QMGR_RETENTION_MAX_RECORDS", 0);
    config.capacity.maxJobs = env_u64("QMGR_MAX_JOBS", 0);
    config.capacity.perType = env_type_limits("QMGR_PER_TYPE_LIMITS");
    config.compactThresholdPercent = static_cast<int>(std::min<std::uint64_t>(
        env_u64("QMGR_COMPACT_THRESHOLD", static_cast<std::uint64_t>(config.compactThresholdPercent)), 100));

    if (const char* iso = std::getenv("QMGR_ISOLATION"); iso && *iso) {
        if (auto parsed = isolationFromString(iso)) {
            config.isolation = *parsed;
        } else {
            LOG_WARN(std::string("Ignoring invalid QMGR_ISOLATION=") + iso);
        }
    }

    config.syncWrites = env_flag("QMGR_SYNC_WRITES", config.syncWrites);
    config.autoStart = env_flag("QMGR_AUTO_START", config.autoStart);
    return config;
}

OpResult SupervisorConfig::validate() const {
    if (registryPath.empty()) {
        return OpResult::failure(ErrorCode::InvalidArgument, "registry_path must not be empty");
    }
    if (maxConcurrentJobs < 1) {
        return OpResult::failure(ErrorCode::InvalidArgument, "max_concurrent_jobs must be at least 1");
    }
    if (resultMaxBytes == 0) {
        return OpResult::failure(ErrorCode::InvalidArgument, "result_max_bytes must be positive");
    }
    if (resultWarnBytes > resultMaxBytes) {
        return OpResult::failure(ErrorCode::InvalidArgument,
            "result_warn_bytes (" + std::to_string(resultWarnBytes) + ") exceeds result_max_bytes (" +
            std::to_string(resultMaxBytes) + ")");
    }
    if (jobTimeout.count() < 0 || cancelGrace.count() < 0 || hookTimeout.count() < 0 ||
        shutdownTimeout.count() < 0 || cleanupInterval.count() < 0 || retention.maxAge.count() < 0) {
        return OpResult::failure(ErrorCode::InvalidArgument, "durations must not be negative");
    }
    if (compactThresholdPercent < 0 || compactThresholdPercent > 100) {
        return OpResult::failure(ErrorCode::InvalidArgument, "compact threshold must be within 0..100");
    }
    return OpResult::success();
}

}
