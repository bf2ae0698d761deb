/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "qmgr/config.hpp"
#include "qmgr/executor.hpp"
#include "qmgr/job.hpp"
#include "qmgr/registry.hpp"
#include "qmgr/types.hpp"

namespace qmgr {

enum class ProcessResult : uint8_t {
    Completed,
    Failed,
    Cancelled,
    Skipped,      // no longer QUEUED when the worker got to it
    StorageError  // outcome could not be recorded
};

using TerminalCallback = std::function<void(const JobRecord&)>;

// Drives one claimed job from QUEUED to its terminal state and tracks the
// executions in flight so they can be cancelled or hard-stopped.
class Processor {
public:
    Processor(Registry& registry, const JobTypes& types, std::unique_ptr<Executor> executor,
              const SupervisorConfig& config);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // Called after every terminal commit, before the job's closing hooks run.
    void setTerminalCallback(TerminalCallback callback) { onTerminal_ = std::move(callback); }

    [[nodiscard]] ProcessResult process(const JobId& jobId, int workerId) noexcept;

    // Jobs claimed after this stay QUEUED.
    void stopAccepting() noexcept;

    // Cooperative cancel of a running job; false when it is not running here.
    [[nodiscard]] bool cancel(const JobId& jobId) noexcept;
    void cancelAll() noexcept;
    // Hard-stops every running job; each is recorded FAILED with `reason`.
    void terminateAll(const JobError& reason) noexcept;

    // Waits until nothing is running; false on deadline.
    [[nodiscard]] bool waitIdle(Clock::time_point deadline) const;
    [[nodiscard]] std::vector<JobId> running() const;

private:
    struct RunningJob {
        std::shared_ptr<Execution> execution;
        bool cancelRequested = false;
        std::optional<JobError> stopReason;
    };

    [[nodiscard]] ExecutionOutcome runToCompletion(const JobId& jobId, Execution& execution, RunningJob& entry);
    [[nodiscard]] ProcessResult commit(const JobId& jobId, ExecutionOutcome outcome,
                                       const std::shared_ptr<Execution>& execution) noexcept;
    void recordProgress(const JobId& jobId, int progress, const std::string& description) noexcept;
    void release(const JobId& jobId) noexcept;

    Registry& registry_;
    const JobTypes& types_;
    std::unique_ptr<Executor> executor_;
    SupervisorConfig config_;
    TerminalCallback onTerminal_;

    mutable std::mutex runningMutex_;
    mutable std::condition_variable idle_;
    std::unordered_map<JobId, std::shared_ptr<RunningJob>> running_;
    bool accepting_ = true;
};

}
