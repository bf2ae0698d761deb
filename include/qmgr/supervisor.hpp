/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "qmgr/config.hpp"
#include "qmgr/job.hpp"
#include "qmgr/registry.hpp"
#include "qmgr/types.hpp"

namespace qmgr {

class Pool;
class Processor;

struct SupervisorStats {
    std::array<std::size_t, 6> byStatus{};
    std::vector<JobId> running;
    std::size_t queueDepth = 0;
    int workers = 0;
    RegistryStats registry;

    [[nodiscard]] std::size_t count(Status status) const noexcept {
        return byStatus[static_cast<std::size_t>(status)];
    }
    [[nodiscard]] std::size_t total() const noexcept;
};

// Owns the registry, the worker pool and the executions. The only writer
// of the registry file.
class Supervisor final {
public:
    explicit Supervisor(SupervisorConfig config = SupervisorConfig{});
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    Supervisor(Supervisor&&) = delete;
    Supervisor& operator=(Supervisor&&) = delete;

    [[nodiscard]] OpResult registerJobType(const std::string& name, JobFactory factory);

    template <typename T>
    [[nodiscard]] OpResult registerJobType(const std::string& name) {
        return registerJobType(name, [](const JobId& id, const nlohmann::json& params) -> std::unique_ptr<Job> {
            return std::make_unique<T>(id, params);
        });
    }

    // Opens the registry, recovers jobs left behind by a previous run and
    // starts the workers.
    [[nodiscard]] OpResult start() noexcept;
    // Cancels running jobs and waits up to shutdown_timeout before
    // hard-stopping them. Queued jobs stay QUEUED.
    void shutdown() noexcept;
    void shutdown(std::chrono::milliseconds timeout) noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Creates a CREATED record and, with auto_start, admits it. Fails with
    // QueueFull when a capacity limit is reached and nothing finished can be evicted.
    [[nodiscard]] OpResult submit(const std::string& jobType, const JobId& jobId,
                                  const nlohmann::json& params = nlohmann::json::object()) noexcept;
    // Admits a CREATED job (needed when auto_start is off).
    [[nodiscard]] OpResult start(const JobId& jobId) noexcept;
    [[nodiscard]] OpResult cancel(const JobId& jobId) noexcept;
    // Deletes a terminal job; its id stays reserved.
    [[nodiscard]] OpResult remove(const JobId& jobId) noexcept;

    [[nodiscard]] std::optional<JobRecord> getStatus(const JobId& jobId) const noexcept;
    [[nodiscard]] std::vector<JobRecord> list() const noexcept;

    // Blocks until the job is terminal. Nothing on timeout, unknown id or shutdown.
    [[nodiscard]] std::optional<JobRecord> waitFor(const JobId& jobId, std::chrono::milliseconds timeout) const noexcept;

    [[nodiscard]] OpResult cleanup(const RetentionPolicy& policy, std::size_t* removed = nullptr) noexcept;
    [[nodiscard]] OpResult compact() noexcept;
    [[nodiscard]] SupervisorStats stats() const noexcept;

    [[nodiscard]] const SupervisorConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] OpResult admit(const JobId& jobId) noexcept;
    [[nodiscard]] OpResult makeRoom(const std::string& jobType, const JobId& incoming);
    [[nodiscard]] OpResult recoverJobs() noexcept;
    void notifyTerminal() noexcept;
    void maintenanceLoop();
    void runMaintenance() noexcept;

    SupervisorConfig config_;
    JobTypes types_;
    Registry registry_;

    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;
    // Serializes the capacity check with the append it makes room for.
    std::mutex submitMutex_;

    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Pool> pool_;

    mutable std::mutex waitMutex_;
    mutable std::condition_variable terminal_;

    std::mutex maintenanceMutex_;
    std::condition_variable maintenanceWake_;
    bool maintenanceStop_ = false;
    std::thread maintenanceThread_;
};

}
