/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "qmgr/types.hpp"

namespace qmgr {

// Thrown by job code to yield to a cancellation request.
class JobCancelled : public std::runtime_error {
public:
    JobCancelled() : std::runtime_error("Job cancelled") {}
};

// Handed to execute(). Lives in the same execution context as the job.
class JobContext {
public:
    virtual ~JobContext() = default;

    [[nodiscard]] virtual bool cancelled() const noexcept = 0;
    virtual void reportProgress(int progress, const std::string& description) noexcept = 0;

    void throwIfCancelled() const {
        if (cancelled()) {
            throw JobCancelled();
        }
    }
};

// User job contract. Hooks default to no-ops; only execute() is required.
// Exceptions from hooks are logged as warnings and never change the outcome.
class Job {
public:
    Job(JobId id, nlohmann::json params);
    virtual ~Job() = default;

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    virtual void onStart() {}
    virtual nlohmann::json execute(JobContext& ctx) = 0;
    // Runs after the terminal state has been committed.
    virtual void onEnd() {}
    // Runs after onEnd() when the committed state is FAILED.
    virtual void onError(const JobError& error) { (void)error; }

    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] const nlohmann::json& params() const noexcept { return params_; }

private:
    JobId id_;
    nlohmann::json params_;
};

using JobFactory = std::function<std::unique_ptr<Job>(const JobId&, const nlohmann::json&)>;

// Name -> factory table used to instantiate jobs, including after a restart.
class JobTypes {
public:
    [[nodiscard]] OpResult add(const std::string& name, JobFactory factory);
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

    // Throws std::invalid_argument for an unknown name; factory exceptions propagate.
    [[nodiscard]] std::unique_ptr<Job> create(const std::string& name, const JobId& id,
                                              const nlohmann::json& params) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, JobFactory> factories_;
};

// {kind, message} for an in-flight exception; kind is the exception's type name.
[[nodiscard]] JobError describeFault(std::exception_ptr fault) noexcept;

}
