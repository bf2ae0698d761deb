/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/state_machine.hpp"
#include <algorithm>

namespace qmgr {

namespace {
OpResult rejected(const JobRecord& record, Status to) {
    return OpResult::failure(ErrorCode::InvalidTransition,
        "Cannot move job '" + record.id + "' from " + statusToString(record.status) +
        " to " + statusToString(to));
}

void stamp(JobRecord& record, Timestamp now) {
    record.updatedAt = std::max({record.updatedAt, record.createdAt, now});
}
}

bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Failed || status == Status::Cancelled;
}

bool canTransition(Status from, Status to) noexcept {
    if (isTerminal(from)) {
        return false;
    }
    if (to == Status::Cancelled) {
        return true;
    }
    switch (from) {
        case Status::Created: return to == Status::Queued;
        case Status::Queued: return to == Status::Running;
        case Status::Running: return to == Status::Completed || to == Status::Failed;
        default: return false;
    }
}

OpResult transition(JobRecord& record, Status to, Timestamp now) {
    if (to == Status::Completed || to == Status::Failed) {
        return OpResult::failure(ErrorCode::InvalidArgument,
            std::string("Use complete()/fail() to enter ") + statusToString(to));
    }
    if (!canTransition(record.status, to)) {
        return rejected(record, to);
    }
    record.status = to;
    if (to == Status::Cancelled) {
        record.description = "Job cancelled";
    } else if (to == Status::Running) {
        record.description = "Job started";
    }
    stamp(record, now);
    return OpResult::success();
}

OpResult complete(JobRecord& record, nlohmann::json result, std::uint64_t sizeBytes, Timestamp now) {
    if (!canTransition(record.status, Status::Completed)) {
        return rejected(record, Status::Completed);
    }
    if (record.result || record.error) {
        return OpResult::failure(ErrorCode::InvalidTransition,
            "Job '" + record.id + "' already carries an outcome");
    }
    record.status = Status::Completed;
    record.result = std::move(result);
    record.sizeBytes = sizeBytes;
    record.progress = 100;
    record.description = "Job completed successfully";
    stamp(record, now);
    return OpResult::success();
}

OpResult fail(JobRecord& record, JobError error, Timestamp now) {
    if (!canTransition(record.status, Status::Failed)) {
        return rejected(record, Status::Failed);
    }
    if (record.result || record.error) {
        return OpResult::failure(ErrorCode::InvalidTransition,
            "Job '" + record.id + "' already carries an outcome");
    }
    record.status = Status::Failed;
    record.description = "Job failed: " + error.message;
    record.error = std::move(error);
    record.sizeBytes = 0;
    stamp(record, now);
    return OpResult::success();
}

OpResult reportProgress(JobRecord& record, int progress, const std::string& description, Timestamp now) {
    if (record.status != Status::Running) {
        return OpResult::failure(ErrorCode::InvalidTransition,
            "Job '" + record.id + "' is " + statusToString(record.status) + ", progress ignored");
    }
    record.progress = std::clamp(progress, 0, 100);
    record.description = description;
    stamp(record, now);
    return OpResult::success();
}

}
