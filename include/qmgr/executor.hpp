/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "qmgr/job.hpp"
#include "qmgr/result_guard.hpp"
#include "qmgr/types.hpp"

namespace qmgr {

enum class Isolation : uint8_t {
    Process,  // forked child per job, hard-killable
    Thread    // in-process thread, abandoned on hard stop
};

enum class OutcomeKind : uint8_t {
    Returned,   // execute() produced a result that passed the guard
    Rejected,   // result failed the guard
    Faulted,    // execute() threw or the child crashed
    Cancelled,  // execute() yielded with JobCancelled
    Terminated  // hard-stopped via terminate()
};

struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::Faulted;
    nlohmann::json result;
    std::uint64_t sizeBytes = 0;
    JobError error;
};

using Clock = std::chrono::steady_clock;
using ProgressSink = std::function<void(int progress, const std::string& description)>;

// One running job. await(), finish() and the destructor are called by the
// owning worker; cancel() and terminate() may be called from any thread.
class Execution {
public:
    virtual ~Execution() = default;

    // Blocks until the outcome is known or the deadline passes (nothing).
    [[nodiscard]] virtual std::optional<ExecutionOutcome> await(std::optional<Clock::time_point> deadline) = 0;
    virtual void cancel() noexcept = 0;
    virtual void terminate() noexcept = 0;

    // Runs onEnd() and, for FAILED, onError() once the terminal state is
    // committed. Hooks that overrun the timeout are cut off.
    virtual void finish(Status committed, const std::optional<JobError>& error,
                        std::chrono::milliseconds hookTimeout) noexcept = 0;
};

class Executor {
public:
    virtual ~Executor() = default;

    // Starts onStart() and execute() for the job. The sink receives progress
    // reports until the outcome is delivered.
    [[nodiscard]] virtual std::unique_ptr<Execution> launch(std::unique_ptr<Job> job, ProgressSink sink) = 0;
};

// Runs each job on its own thread. A hard stop abandons the thread.
class ThreadExecutor final : public Executor {
public:
    explicit ThreadExecutor(ResultGuard guard) noexcept : guard_(guard) {}
    [[nodiscard]] std::unique_ptr<Execution> launch(std::unique_ptr<Job> job, ProgressSink sink) override;

private:
    ResultGuard guard_;
};

// Forks a child per job and talks to it over a socket pair. The child
// validates its own result and streams it back; a hard stop is SIGKILL.
class ProcessExecutor final : public Executor {
public:
    explicit ProcessExecutor(ResultGuard guard) noexcept : guard_(guard) {}
    [[nodiscard]] std::unique_ptr<Execution> launch(std::unique_ptr<Job> job, ProgressSink sink) override;

private:
    ResultGuard guard_;
};

[[nodiscard]] std::unique_ptr<Executor> makeExecutor(Isolation isolation, const ResultGuard& guard);

[[nodiscard]] const char* isolationToString(Isolation isolation) noexcept;
[[nodiscard]] std::optional<Isolation> isolationFromString(const std::string& text) noexcept;

}
