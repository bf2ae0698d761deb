/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/executor.hpp"
#include "qmgr/logger.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

namespace qmgr {

namespace {
// Shared between the execution handle and the job thread, which may outlive
// the handle once abandoned.
struct SharedState {
    std::mutex mutex;
    std::condition_variable changed;
    std::atomic<bool> cancelRequested{false};
    bool abandoned = false;
    bool finished = false;
    bool delivered = false;
    std::optional<ExecutionOutcome> outcome;
    std::optional<std::pair<Status, std::optional<JobError>>> committed;
    ProgressSink sink;
    std::unique_ptr<Job> job;
};

class ThreadContext final : public JobContext {
public:
    explicit ThreadContext(std::shared_ptr<SharedState> state) : state_(std::move(state)) {}

    bool cancelled() const noexcept override {
        return state_->cancelRequested.load();
    }

    void reportProgress(int progress, const std::string& description) noexcept override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->abandoned || state_->outcome || !state_->sink) {
            return;
        }
        try {
            state_->sink(progress, description);
        } catch (const std::exception& e) {
            LOG_WARN("Progress report failed for job " + state_->job->id() + ": " + e.what());
        }
    }

private:
    std::shared_ptr<SharedState> state_;
};

template <typename Fn>
void runHook(const char* hook, const JobId& id, Fn&& fn) {
    try {
        fn();
    } catch (...) {
        JobError fault = describeFault(std::current_exception());
        LOG_WARN("Job " + id + ": " + hook + " hook failed: " + fault.kind + ": " + fault.message);
    }
}

void runJob(std::shared_ptr<SharedState> state, ResultGuard guard) {
    Job& job = *state->job;
    setThreadName("Job-" + job.id());
    ThreadContext ctx(state);

    runHook("on_start", job.id(), [&] { job.onStart(); });

    ExecutionOutcome outcome;
    try {
        nlohmann::json value = job.execute(ctx);
        GuardResult verdict = guard.validate(value);
        if (verdict) {
            outcome.kind = OutcomeKind::Returned;
            outcome.result = std::move(value);
            outcome.sizeBytes = verdict.sizeBytes;
        } else {
            outcome.kind = OutcomeKind::Rejected;
            outcome.error = verdict.toError();
        }
    } catch (const JobCancelled&) {
        outcome.kind = OutcomeKind::Cancelled;
    } catch (...) {
        outcome.kind = OutcomeKind::Faulted;
        outcome.error = describeFault(std::current_exception());
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->outcome = std::move(outcome);
    state->changed.notify_all();
    state->changed.wait(lock, [&] { return state->committed.has_value() || state->abandoned; });

    if (!state->abandoned) {
        auto committed = *state->committed;
        lock.unlock();
        runHook("on_end", job.id(), [&] { job.onEnd(); });
        if (committed.first == Status::Failed && committed.second) {
            runHook("on_error", job.id(), [&] { job.onError(*committed.second); });
        }
        lock.lock();
    }

    state->finished = true;
    state->changed.notify_all();
    clearThreadName();
}

class ThreadExecution final : public Execution {
public:
    ThreadExecution(std::shared_ptr<SharedState> state, std::thread worker)
        : state_(std::move(state)), worker_(std::move(worker)) {}

    ~ThreadExecution() override {
        bool finished = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            finished = state_->finished;
            if (!finished) {
                state_->abandoned = true;
                state_->sink = nullptr;
                state_->changed.notify_all();
            }
        }
        if (!worker_.joinable()) {
            return;
        }
        if (finished) {
            worker_.join();
        } else {
            LOG_WARN("Abandoning thread of job " + state_->job->id());
            worker_.detach();
        }
    }

    std::optional<ExecutionOutcome> await(std::optional<Clock::time_point> deadline) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        auto ready = [this] {
            return (state_->outcome.has_value() && !state_->delivered) || state_->abandoned;
        };
        if (deadline) {
            if (!state_->changed.wait_until(lock, *deadline, ready)) {
                return std::nullopt;
            }
        } else {
            state_->changed.wait(lock, ready);
        }

        if (state_->outcome && !state_->delivered) {
            state_->delivered = true;
            state_->sink = nullptr;
            return std::move(*state_->outcome);
        }

        ExecutionOutcome stopped;
        stopped.kind = OutcomeKind::Terminated;
        stopped.error = {"Terminated", "job thread abandoned"};
        return stopped;
    }

    void cancel() noexcept override {
        state_->cancelRequested.store(true);
    }

    void terminate() noexcept override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->finished) {
            state_->abandoned = true;
            state_->sink = nullptr;
        }
        state_->changed.notify_all();
    }

    void finish(Status committed, const std::optional<JobError>& error,
                std::chrono::milliseconds hookTimeout) noexcept override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->abandoned || state_->finished) {
            return;
        }
        state_->sink = nullptr;
        state_->committed = std::make_pair(committed, error);
        state_->changed.notify_all();

        bool done = state_->changed.wait_for(lock, hookTimeout,
            [this] { return state_->finished || state_->abandoned; });
        if (!done) {
            LOG_WARN("Hooks of job " + state_->job->id() + " exceeded " +
                     std::to_string(hookTimeout.count()) + "ms");
            state_->abandoned = true;
        }
    }

private:
    std::shared_ptr<SharedState> state_;
    std::thread worker_;
};
}

std::unique_ptr<Execution> ThreadExecutor::launch(std::unique_ptr<Job> job, ProgressSink sink) {
    auto state = std::make_shared<SharedState>();
    state->job = std::move(job);
    state->sink = std::move(sink);

    std::thread worker(runJob, state, guard_);
    return std::make_unique<ThreadExecution>(std::move(state), std::move(worker));
}

}
