/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/processor.hpp"
#include "qmgr/logger.hpp"
#include "qmgr/state_machine.hpp"
#include <algorithm>

namespace qmgr {

Processor::Processor(Registry& registry, const JobTypes& types, std::unique_ptr<Executor> executor,
                     const SupervisorConfig& config)
    : registry_(registry), types_(types), executor_(std::move(executor)), config_(config) {
    LOG_DEBUG(std::string("Processor created with ") + isolationToString(config_.isolation) + " isolation");
}

ProcessResult Processor::process(const JobId& jobId, int workerId) noexcept {
    auto record = registry_.get(jobId);
    if (!record || record->status != Status::Queued) {
        LOG_DEBUG("Skipping job " + jobId + ": no longer queued");
        return ProcessResult::Skipped;
    }

    auto entry = std::make_shared<RunningJob>();
    try {
        std::lock_guard<std::mutex> lock(runningMutex_);
        if (!accepting_) {
            LOG_DEBUG("Leaving job " + jobId + " queued: shutting down");
            return ProcessResult::Skipped;
        }
        running_[jobId] = entry;
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot track job " + jobId + ": " + e.what());
        return ProcessResult::Skipped;
    }

    // Loses against a concurrent cancel of the queued job, which is fine
    JobRecord current;
    OpResult started = registry_.update(jobId,
        [](JobRecord& r) { return transition(r, Status::Running, nowMillis()); }, &current);
    if (!started) {
        if (started.error == ErrorCode::StorageError) {
            LOG_ERROR("Job " + jobId + " could not be started: " + started.message);
        } else {
            LOG_DEBUG("Job " + jobId + " not started: " + started.message);
        }
        release(jobId);
        return ProcessResult::Skipped;
    }
    LOG_INFO("Worker-" + std::to_string(workerId) + " started job " + jobId + " (" + current.type + ")");

    ExecutionOutcome outcome;
    std::shared_ptr<Execution> execution;
    try {
        auto job = types_.create(current.type, jobId, current.params);
        execution = executor_->launch(std::move(job),
            [this, jobId](int progress, const std::string& description) {
                recordProgress(jobId, progress, description);
            });
    } catch (...) {
        outcome.kind = OutcomeKind::Faulted;
        outcome.error = describeFault(std::current_exception());
    }

    if (execution) {
        bool cancelNow = false;
        bool stopNow = false;
        {
            std::lock_guard<std::mutex> lock(runningMutex_);
            entry->execution = execution;
            cancelNow = entry->cancelRequested;
            stopNow = entry->stopReason.has_value();
        }
        if (cancelNow) {
            execution->cancel();
        }
        if (stopNow) {
            execution->terminate();
        }

        try {
            outcome = runToCompletion(jobId, *execution, *entry);
        } catch (const std::exception& e) {
            LOG_ERROR("Lost track of job " + jobId + ": " + e.what());
            execution->terminate();
            outcome.kind = OutcomeKind::Faulted;
            outcome.error = {"SupervisorError", e.what()};
        }
    }

    ProcessResult result = commit(jobId, std::move(outcome), execution);
    release(jobId);
    return result;
}

ExecutionOutcome Processor::runToCompletion(const JobId& jobId, Execution& execution, RunningJob& entry) {
    std::optional<Clock::time_point> deadline;
    if (config_.jobTimeout.count() > 0) {
        deadline = Clock::now() + config_.jobTimeout;
    }

    auto outcome = execution.await(deadline);
    if (!outcome) {
        LOG_WARN("Job " + jobId + " exceeded timeout of " + std::to_string(config_.jobTimeout.count()) +
                 "ms, cancelling");
        execution.cancel();
        outcome = execution.await(Clock::now() + config_.cancelGrace);
        if (!outcome) {
            LOG_WARN("Job " + jobId + " ignored cancellation for " +
                     std::to_string(config_.cancelGrace.count()) + "ms, stopping it");
            execution.terminate();
            outcome = execution.await(std::nullopt);
        }

        ExecutionOutcome timedOut;
        timedOut.kind = OutcomeKind::Terminated;
        timedOut.error = {"Timeout", "Job exceeded timeout of " + std::to_string(config_.jobTimeout.count()) + "ms"};
        return timedOut;
    }

    if (outcome->kind == OutcomeKind::Terminated) {
        std::lock_guard<std::mutex> lock(runningMutex_);
        if (entry.stopReason) {
            outcome->error = *entry.stopReason;
        }
    }
    return std::move(*outcome);
}

ProcessResult Processor::commit(const JobId& jobId, ExecutionOutcome outcome,
                                const std::shared_ptr<Execution>& execution) noexcept {
    Mutation mutation;
    switch (outcome.kind) {
        case OutcomeKind::Returned:
            mutation = [&outcome](JobRecord& r) {
                return complete(r, std::move(outcome.result), outcome.sizeBytes, nowMillis());
            };
            break;
        case OutcomeKind::Cancelled:
            mutation = [](JobRecord& r) { return transition(r, Status::Cancelled, nowMillis()); };
            break;
        default:
            mutation = [&outcome](JobRecord& r) { return fail(r, outcome.error, nowMillis()); };
            break;
    }

    JobRecord committed;
    OpResult written = registry_.update(jobId, mutation, &committed);
    if (!written) {
        LOG_ERROR("Failed to record outcome of job " + jobId + ": " + written.message);
        return ProcessResult::StorageError;
    }

    ProcessResult result = ProcessResult::Failed;
    switch (committed.status) {
        case Status::Completed:
            LOG_INFO("Job " + jobId + " completed (" + std::to_string(committed.sizeBytes) + " bytes)");
            result = ProcessResult::Completed;
            break;
        case Status::Cancelled:
            LOG_INFO("Job " + jobId + " cancelled");
            result = ProcessResult::Cancelled;
            break;
        default:
            LOG_WARN("Job " + jobId + " failed: " + committed.error->kind + ": " + committed.error->message);
            break;
    }

    if (onTerminal_) {
        try {
            onTerminal_(committed);
        } catch (const std::exception& e) {
            LOG_ERROR("Terminal callback failed for job " + jobId + ": " + e.what());
        }
    }

    if (execution) {
        execution->finish(committed.status, committed.error, config_.hookTimeout);
    }
    return result;
}

void Processor::recordProgress(const JobId& jobId, int progress, const std::string& description) noexcept {
    OpResult r = registry_.update(jobId,
        [&](JobRecord& record) { return reportProgress(record, progress, description, nowMillis()); });
    if (!r) {
        LOG_DEBUG("Progress for job " + jobId + " not recorded: " + r.message);
    }
}

void Processor::release(const JobId& jobId) noexcept {
    std::lock_guard<std::mutex> lock(runningMutex_);
    running_.erase(jobId);
    idle_.notify_all();
}

void Processor::stopAccepting() noexcept {
    std::lock_guard<std::mutex> lock(runningMutex_);
    accepting_ = false;
}

bool Processor::cancel(const JobId& jobId) noexcept {
    std::shared_ptr<Execution> execution;
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        auto it = running_.find(jobId);
        if (it == running_.end()) {
            return false;
        }
        it->second->cancelRequested = true;
        execution = it->second->execution;
    }
    if (execution) {
        execution->cancel();
    }
    LOG_INFO("Cancellation requested for running job " + jobId);
    return true;
}

void Processor::cancelAll() noexcept {
    std::vector<std::shared_ptr<Execution>> executions;
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        for (auto& [id, entry] : running_) {
            entry->cancelRequested = true;
            if (entry->execution) {
                executions.push_back(entry->execution);
            }
        }
    }
    for (auto& execution : executions) {
        execution->cancel();
    }
}

void Processor::terminateAll(const JobError& reason) noexcept {
    std::vector<std::shared_ptr<Execution>> executions;
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        for (auto& [id, entry] : running_) {
            entry->stopReason = reason;
            if (entry->execution) {
                executions.push_back(entry->execution);
            }
            LOG_WARN("Hard-stopping job " + id + ": " + reason.message);
        }
    }
    for (auto& execution : executions) {
        execution->terminate();
    }
}

bool Processor::waitIdle(Clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(runningMutex_);
    return idle_.wait_until(lock, deadline, [this] { return running_.empty(); });
}

std::vector<JobId> Processor::running() const {
    std::vector<JobId> ids;
    {
        std::lock_guard<std::mutex> lock(runningMutex_);
        ids.reserve(running_.size());
        for (const auto& entry : running_) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}
