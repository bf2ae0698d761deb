/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/pool.hpp"
#include "qmgr/logger.hpp"

namespace qmgr {

Pool::Pool(int workers) noexcept : workers_(workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobHandler handler) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!handler || workers_ < 1) {
        LOG_ERROR("Invalid pool configuration");
        return false;
    }

    handler_ = std::move(handler);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }

        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    jobAvailable_.notify_all();
}

void Pool::stop() noexcept {
    if (workerThreads_.empty()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    close();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        jobQueue_.clear();
        queued_.clear();
    }

    LOG_INFO("Pool stopped" + (dropped > 0 ? " (" + std::to_string(dropped) + " job(s) left queued)" : std::string()));
}

bool Pool::submit(const JobId& jobId, Timestamp enqueuedAt) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit job to stopped pool: " + jobId);
                return false;
            }
            if (!queued_.emplace(jobId, enqueuedAt).second) {
                LOG_DEBUG("Job already queued: " + jobId);
                return false;
            }
            jobQueue_.emplace(enqueuedAt, jobId);
        }

        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + e.what());
        return false;
    }
}

bool Pool::remove(const JobId& jobId) noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    auto it = queued_.find(jobId);
    if (it == queued_.end()) {
        return false;
    }
    jobQueue_.erase({it->second, jobId});
    queued_.erase(it);
    return true;
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName("Worker-" + std::to_string(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");

    while (!shutdown_.load()) {
        JobId jobId;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }

            auto head = jobQueue_.begin();
            jobId = head->second;
            queued_.erase(jobId);
            jobQueue_.erase(head);
            ++busy_;
        }

        LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed job: " + jobId);
        try {
            handler_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker-" + std::to_string(workerId) + " job handling error: " +
                      std::string(e.what()) + " (job: " + jobId + ")");
        }
        --busy_;
    }

    LOG_DEBUG("Worker-" + std::to_string(workerId) + " stopped");
    clearThreadName();
}

}
