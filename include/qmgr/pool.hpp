/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "qmgr/types.hpp"

namespace qmgr {

using JobHandler = std::function<void(const JobId&, int workerId)>;

// Fixed set of worker threads draining a queue ordered by enqueue time,
// ties broken by job id.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobHandler handler);
    // Stops handing out jobs without waiting for the workers.
    void close() noexcept;
    // Joins the workers once their current job returns. Queued ids are dropped.
    void stop() noexcept;

    [[nodiscard]] bool submit(const JobId& jobId, Timestamp enqueuedAt) noexcept;
    // Takes a job out of the queue; false if a worker already claimed it.
    [[nodiscard]] bool remove(const JobId& jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] int busyCount() const noexcept { return busy_.load(); }

private:
    using QueueKey = std::pair<Timestamp, JobId>;

    void workerLoop(int workerId);

    int workers_;
    JobHandler handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> busy_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::set<QueueKey> jobQueue_;
    std::unordered_map<JobId, Timestamp> queued_;

    std::vector<std::thread> workerThreads_;
};

}
