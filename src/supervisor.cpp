/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/supervisor.hpp"
#include "qmgr/codec.hpp"
#include "qmgr/logger.hpp"
#include "qmgr/pool.hpp"
#include "qmgr/processor.hpp"
#include "qmgr/result_guard.hpp"
#include "qmgr/state_machine.hpp"
#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace qmgr {

namespace {
constexpr std::size_t kMinLinesForCompaction = 64;

OpResult stateError(const char* op, const JobId& jobId, Status status) {
    return OpResult::failure(ErrorCode::InvalidTransition,
        std::string("Cannot ") + op + " job '" + jobId + "' in state '" + statusToString(status) + "'");
}

OpResult notFound(const JobId& jobId) {
    return OpResult::failure(ErrorCode::NotFound, "Job with ID '" + jobId + "' not found");
}

OpResult notRunning() {
    return OpResult::failure(ErrorCode::NotRunning, "Supervisor is not running");
}

// Brings the records in scope (one type, or all when jobType is null) below
// limit by deleting the oldest terminal ones. Active jobs are never evicted.
OpResult evictOldest(Registry& registry, std::vector<JobRecord>& records, const std::string* jobType,
                     std::size_t limit, const JobId& incoming) {
    auto inScope = [jobType](const JobRecord& r) { return !jobType || r.type == *jobType; };
    const std::size_t count = static_cast<std::size_t>(std::count_if(records.begin(), records.end(), inScope));
    if (count < limit) {
        return OpResult::success();
    }
    const std::size_t needed = count - limit + 1;
    const std::string scope = jobType ? "'" + *jobType + "'" : std::string("global");

    std::vector<const JobRecord*> candidates;
    for (const auto& r : records) {
        if (inScope(r) && isTerminal(r.status)) {
            candidates.push_back(&r);
        }
    }
    if (candidates.size() < needed) {
        return OpResult::failure(ErrorCode::QueueFull,
            "Queue is full (" + scope + " limit: " + std::to_string(limit) + "); no finished job to evict");
    }
    std::sort(candidates.begin(), candidates.end(), [](const JobRecord* a, const JobRecord* b) {
        if (a->createdAt != b->createdAt) {
            return a->createdAt < b->createdAt;
        }
        return a->id < b->id;
    });

    std::unordered_set<JobId> evict;
    for (std::size_t i = 0; i < needed; ++i) {
        evict.insert(candidates[i]->id);
        LOG_INFO("Evicting oldest job " + candidates[i]->id + " (" + scope + " limit: " +
                 std::to_string(limit) + ", adding: " + incoming + ")");
    }
    OpResult r = registry.removeIf([&evict](const JobRecord& rec) {
        return isTerminal(rec.status) && evict.count(rec.id) > 0;
    });
    if (!r) {
        return r;
    }
    records.erase(std::remove_if(records.begin(), records.end(),
        [&evict](const JobRecord& rec) { return evict.count(rec.id) > 0; }), records.end());
    return OpResult::success();
}
}

std::size_t SupervisorStats::total() const noexcept {
    return std::accumulate(byStatus.begin(), byStatus.end(), std::size_t{0});
}

Supervisor::Supervisor(SupervisorConfig config)
    : config_(std::move(config)), registry_(config_.registryPath, config_.syncWrites) {
    LOG_DEBUG("Supervisor created - registry: " + config_.registryPath.string() +
              ", workers: " + std::to_string(config_.maxConcurrentJobs) +
              ", isolation: " + isolationToString(config_.isolation));
}

Supervisor::~Supervisor() {
    shutdown();
}

OpResult Supervisor::registerJobType(const std::string& name, JobFactory factory) {
    OpResult added = types_.add(name, std::move(factory));
    if (added) {
        LOG_DEBUG("Registered job type: " + name);
    }
    return added;
}

OpResult Supervisor::start() noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (running_.load()) {
        LOG_WARN("Supervisor already running");
        return OpResult::success("Supervisor already running");
    }

    OpResult valid = config_.validate();
    if (!valid) {
        LOG_ERROR("Invalid configuration: " + valid.message);
        return valid;
    }

    LOG_INFO("Starting qmgr supervisor...");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Registry: " + config_.registryPath.string());
    LOG_DEBUG("Workers: " + std::to_string(config_.maxConcurrentJobs));
    LOG_DEBUG(std::string("Isolation: ") + isolationToString(config_.isolation));
    LOG_DEBUG("Result limits: warn " + std::to_string(config_.resultWarnBytes) + " / max " +
              std::to_string(config_.resultMaxBytes) + " bytes");
    LOG_DEBUG("Job timeout: " + std::to_string(config_.jobTimeout.count()) + "ms");
    LOG_DEBUG("========================================");

    OpResult opened = registry_.open();
    if (!opened) {
        LOG_ERROR("Failed to open registry: " + opened.message);
        return opened;
    }

    try {
        ResultGuard guard(config_.resultWarnBytes, config_.resultMaxBytes);
        processor_ = std::make_unique<Processor>(registry_, types_, makeExecutor(config_.isolation, guard), config_);
        processor_->setTerminalCallback([this](const JobRecord&) { notifyTerminal(); });

        pool_ = std::make_unique<Pool>(config_.maxConcurrentJobs);
        Processor* processor = processor_.get();
        if (!pool_->start([processor](const JobId& jobId, int workerId) {
            (void)processor->process(jobId, workerId);
        })) {
            registry_.close();
            return OpResult::failure(ErrorCode::NotRunning, "Failed to start worker pool");
        }

        running_.store(true);

        OpResult recovered = recoverJobs();
        if (!recovered) {
            LOG_WARN("Some jobs could not be recovered: " + recovered.message);
        }

        if (config_.cleanupInterval.count() > 0) {
            {
                std::lock_guard<std::mutex> lock(maintenanceMutex_);
                maintenanceStop_ = false;
            }
            maintenanceThread_ = std::thread(&Supervisor::maintenanceLoop, this);
        }

        LOG_INFO("Supervisor started");
        return OpResult::success();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start supervisor: " + std::string(e.what()));
        running_.store(false);
        if (pool_) {
            pool_->stop();
        }
        registry_.close();
        return OpResult::failure(ErrorCode::NotRunning, std::string("Failed to start supervisor: ") + e.what());
    }
}

void Supervisor::shutdown() noexcept {
    shutdown(config_.shutdownTimeout);
}

void Supervisor::shutdown(std::chrono::milliseconds timeout) noexcept {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (!running_.load()) {
        return;
    }

    LOG_INFO("Shutting down supervisor...");
    running_.store(false);
    notifyTerminal();

    {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        maintenanceStop_ = true;
    }
    maintenanceWake_.notify_all();
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }

    pool_->close();
    processor_->stopAccepting();
    processor_->cancelAll();

    if (!processor_->waitIdle(Clock::now() + timeout)) {
        LOG_WARN("Jobs still running after " + std::to_string(timeout.count()) + "ms, stopping them");
        processor_->terminateAll({"Shutdown", "Supervisor shut down before the job finished"});
    }

    pool_->stop();
    registry_.close();
    notifyTerminal();

    LOG_INFO("Supervisor shutdown complete");
}

OpResult Supervisor::recoverJobs() noexcept {
    try {
        int interrupted = 0;
        int requeued = 0;
        int failures = 0;

        for (const auto& record : registry_.list()) {
            switch (record.status) {
                case Status::Running: {
                    LOG_WARN("Recovering interrupted job: " + record.id);
                    OpResult r = registry_.update(record.id, [](JobRecord& rec) {
                        return fail(rec, {"Interrupted", "Supervisor stopped while the job was running"}, nowMillis());
                    });
                    if (r) {
                        ++interrupted;
                    } else {
                        LOG_ERROR("Failed to recover job " + record.id + ": " + r.message);
                        ++failures;
                    }
                    break;
                }
                case Status::Queued:
                    if (!types_.contains(record.type)) {
                        LOG_WARN("Job " + record.id + " of unregistered type '" + record.type + "' stays queued");
                    } else if (pool_->submit(record.id, record.updatedAt)) {
                        ++requeued;
                    }
                    break;
                case Status::Created:
                    if (config_.autoStart && types_.contains(record.type)) {
                        if (admit(record.id)) {
                            ++requeued;
                        } else {
                            ++failures;
                        }
                    }
                    break;
                default:
                    break;
            }
        }

        if (interrupted > 0 || requeued > 0) {
            LOG_INFO("Recovered " + std::to_string(interrupted) + " interrupted and " +
                     std::to_string(requeued) + " queued job(s)");
        }
        if (failures > 0) {
            return OpResult::failure(ErrorCode::StorageError,
                                     std::to_string(failures) + " job(s) could not be recovered");
        }
        return OpResult::success();
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorCode::StorageError, std::string("Recovery failed: ") + e.what());
    }
}

OpResult Supervisor::submit(const std::string& jobType, const JobId& jobId, const nlohmann::json& params) noexcept {
    if (!running_.load()) {
        return notRunning();
    }
    if (jobId.empty()) {
        return OpResult::failure(ErrorCode::InvalidArgument, "job_id must be a non-empty string");
    }
    if (!types_.contains(jobType)) {
        return OpResult::failure(ErrorCode::InvalidArgument, "Unknown job type '" + jobType + "'");
    }
    if (!params.is_object()) {
        return OpResult::failure(ErrorCode::InvalidArgument, "params must be a JSON object");
    }
    if (!encodedSize(nlohmann::json(jobId))) {
        return OpResult::failure(ErrorCode::InvalidArgument, "job_id is not valid UTF-8");
    }
    if (GuardResult screened = checkSerializable(params); !screened) {
        return OpResult::failure(ErrorCode::InvalidArgument, "params are not serializable: " + screened.reason);
    }

    try {
        std::lock_guard<std::mutex> lock(submitMutex_);
        if (!registry_.contains(jobId)) {
            OpResult room = makeRoom(jobType, jobId);
            if (!room) {
                return room;
            }
        }

        JobRecord record;
        record.id = jobId;
        record.type = jobType;
        record.status = Status::Created;
        record.params = params;
        record.description = "Job created";
        record.createdAt = nowMillis();
        record.updatedAt = record.createdAt;

        OpResult added = registry_.append(record);
        if (!added) {
            return added;
        }
        LOG_INFO("Job submitted: " + jobId + " (" + jobType + ")");
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorCode::StorageError, std::string("Failed to submit job: ") + e.what());
    }

    if (config_.autoStart) {
        return admit(jobId);
    }
    return OpResult::success();
}

OpResult Supervisor::makeRoom(const std::string& jobType, const JobId& incoming) {
    const CapacityLimits& capacity = config_.capacity;
    const std::size_t typeLimit = capacity.limitFor(jobType);
    if (typeLimit == 0 && capacity.maxJobs == 0) {
        return OpResult::success();
    }

    std::vector<JobRecord> records = registry_.list();
    if (typeLimit > 0) {
        OpResult r = evictOldest(registry_, records, &jobType, typeLimit, incoming);
        if (!r) {
            return r;
        }
    }
    if (capacity.maxJobs > 0) {
        return evictOldest(registry_, records, nullptr, capacity.maxJobs, incoming);
    }
    return OpResult::success();
}

OpResult Supervisor::start(const JobId& jobId) noexcept {
    if (!running_.load()) {
        return notRunning();
    }
    auto record = registry_.get(jobId);
    if (!record) {
        return notFound(jobId);
    }
    if (record->status != Status::Created) {
        return stateError("start", jobId, record->status);
    }
    if (!types_.contains(record->type)) {
        return OpResult::failure(ErrorCode::InvalidArgument, "Unknown job type '" + record->type + "'");
    }
    return admit(jobId);
}

OpResult Supervisor::admit(const JobId& jobId) noexcept {
    JobRecord queued;
    OpResult r = registry_.update(jobId,
        [](JobRecord& rec) { return transition(rec, Status::Queued, nowMillis()); }, &queued);
    if (!r) {
        return r;
    }
    if (!pool_->submit(jobId, queued.updatedAt)) {
        LOG_WARN("Job " + jobId + " is queued but workers are stopped; it runs after the next start");
    }
    return OpResult::success();
}

OpResult Supervisor::cancel(const JobId& jobId) noexcept {
    if (!running_.load()) {
        return notRunning();
    }
    auto record = registry_.get(jobId);
    if (!record) {
        return notFound(jobId);
    }

    switch (record->status) {
        case Status::Cancelled:
            return OpResult::success("Job already cancelled");
        case Status::Completed:
        case Status::Failed:
            return stateError("cancel", jobId, record->status);
        default:
            break;
    }

    // A queued job is cancelled in place; a running one only gets the signal
    bool running = false;
    OpResult r = registry_.update(jobId, [&running](JobRecord& rec) {
        if (rec.status == Status::Running) {
            running = true;
            return OpResult::failure(ErrorCode::InvalidTransition, "job is running");
        }
        return transition(rec, Status::Cancelled, nowMillis());
    });

    if (r) {
        (void)pool_->remove(jobId);
        LOG_INFO("Job cancelled before it ran: " + jobId);
        notifyTerminal();
        return OpResult::success("Job cancelled");
    }

    if (running && processor_->cancel(jobId)) {
        return OpResult::success("Cancellation requested");
    }
    if (r.error == ErrorCode::StorageError) {
        return r;
    }

    // Reached a terminal state in the meantime
    auto latest = registry_.get(jobId);
    if (!latest) {
        return notFound(jobId);
    }
    if (latest->status == Status::Cancelled) {
        return OpResult::success("Job already cancelled");
    }
    return stateError("cancel", jobId, latest->status);
}

OpResult Supervisor::remove(const JobId& jobId) noexcept {
    if (!running_.load()) {
        return notRunning();
    }
    auto record = registry_.get(jobId);
    if (!record) {
        return notFound(jobId);
    }
    if (!isTerminal(record->status)) {
        return OpResult::failure(ErrorCode::JobNotTerminal,
            "Cannot delete job '" + jobId + "' in state '" + statusToString(record->status) + "'");
    }

    OpResult r = registry_.remove(jobId);
    if (r) {
        LOG_INFO("Job deleted: " + jobId);
    }
    return r;
}

std::optional<JobRecord> Supervisor::getStatus(const JobId& jobId) const noexcept {
    return registry_.get(jobId);
}

std::vector<JobRecord> Supervisor::list() const noexcept {
    return registry_.list();
}

std::optional<JobRecord> Supervisor::waitFor(const JobId& jobId, std::chrono::milliseconds timeout) const noexcept {
    const auto deadline = Clock::now() + timeout;
    std::optional<JobRecord> found;

    std::unique_lock<std::mutex> lock(waitMutex_);
    terminal_.wait_until(lock, deadline, [&] {
        found = registry_.get(jobId);
        return !found || isTerminal(found->status) || !running_.load();
    });

    if (found && isTerminal(found->status)) {
        return found;
    }
    return std::nullopt;
}

void Supervisor::notifyTerminal() noexcept {
    // Pairs with the predicate check in waitFor(); no wakeup can slip between them
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
    }
    terminal_.notify_all();
}

OpResult Supervisor::cleanup(const RetentionPolicy& policy, std::size_t* removed) noexcept {
    if (removed) {
        *removed = 0;
    }
    if (!running_.load()) {
        return notRunning();
    }
    if (!policy.enabled()) {
        return OpResult::success("Retention disabled");
    }

    try {
        std::unordered_set<JobId> overflow;
        if (policy.maxTerminalRecords > 0) {
            std::vector<JobRecord> terminal;
            for (auto& record : registry_.list()) {
                if (isTerminal(record.status)) {
                    terminal.push_back(std::move(record));
                }
            }
            std::sort(terminal.begin(), terminal.end(), [](const JobRecord& a, const JobRecord& b) {
                if (a.updatedAt != b.updatedAt) {
                    return a.updatedAt > b.updatedAt;
                }
                return a.id < b.id;
            });
            for (std::size_t i = policy.maxTerminalRecords; i < terminal.size(); ++i) {
                overflow.insert(terminal[i].id);
            }
        }

        const bool byAge = policy.maxAge.count() > 0;
        const Timestamp cutoff = nowMillis() -
            std::chrono::duration_cast<std::chrono::milliseconds>(policy.maxAge).count();

        std::size_t count = 0;
        OpResult r = registry_.removeIf([&](const JobRecord& record) {
            if (!isTerminal(record.status)) {
                return false;
            }
            return overflow.count(record.id) > 0 || (byAge && record.updatedAt < cutoff);
        }, &count);

        if (r && count > 0) {
            LOG_INFO("Retention removed " + std::to_string(count) + " terminal job(s)");
        }
        if (removed) {
            *removed = count;
        }
        return r;
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorCode::StorageError, std::string("Cleanup failed: ") + e.what());
    }
}

OpResult Supervisor::compact() noexcept {
    if (!running_.load()) {
        return notRunning();
    }
    return registry_.compact();
}

SupervisorStats Supervisor::stats() const noexcept {
    SupervisorStats s;
    for (const auto& record : registry_.list()) {
        ++s.byStatus[static_cast<std::size_t>(record.status)];
    }
    s.registry = registry_.stats();
    s.workers = config_.maxConcurrentJobs;
    if (running_.load()) {
        try {
            s.running = processor_->running();
        } catch (const std::exception& e) {
            LOG_WARN("Could not list running jobs: " + std::string(e.what()));
        }
        s.queueDepth = pool_->queueSize();
    }
    return s;
}

void Supervisor::maintenanceLoop() {
    setThreadName("Maintenance");
    LOG_DEBUG("Maintenance loop started");

    std::unique_lock<std::mutex> lock(maintenanceMutex_);
    while (!maintenanceStop_) {
        if (maintenanceWake_.wait_for(lock, config_.cleanupInterval, [this] { return maintenanceStop_; })) {
            break;
        }
        lock.unlock();
        runMaintenance();
        lock.lock();
    }

    LOG_DEBUG("Maintenance loop stopped");
    clearThreadName();
}

void Supervisor::runMaintenance() noexcept {
    if (config_.retention.enabled()) {
        OpResult r = cleanup(config_.retention);
        if (!r) {
            LOG_WARN("Retention pass failed: " + r.message);
        }
    }

    RegistryStats s = registry_.stats();
    if (s.lines >= kMinLinesForCompaction &&
        s.supersededLines * 100 > s.lines * static_cast<std::size_t>(config_.compactThresholdPercent)) {
        LOG_DEBUG("Compacting registry: " + std::to_string(s.supersededLines) + " of " +
                  std::to_string(s.lines) + " lines superseded");
        OpResult r = registry_.compact();
        if (!r) {
            LOG_WARN("Compaction failed: " + r.message);
        }
    }
}

}
