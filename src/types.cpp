/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/types.hpp"
#include <chrono>

namespace qmgr {

const char* statusToString(Status status) noexcept {
    switch (status) {
        case Status::Created: return "CREATED";
        case Status::Queued: return "QUEUED";
        case Status::Running: return "RUNNING";
        case Status::Completed: return "COMPLETED";
        case Status::Failed: return "FAILED";
        case Status::Cancelled: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

std::optional<Status> statusFromString(const std::string& text) noexcept {
    if (text == "CREATED") return Status::Created;
    if (text == "QUEUED") return Status::Queued;
    if (text == "RUNNING") return Status::Running;
    if (text == "COMPLETED") return Status::Completed;
    if (text == "FAILED") return Status::Failed;
    if (text == "CANCELLED") return Status::Cancelled;
    return std::nullopt;
}

const char* errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::DuplicateJobId: return "DuplicateJobId";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidTransition: return "InvalidTransition";
        case ErrorCode::JobNotTerminal: return "JobNotTerminal";
        case ErrorCode::ResultRejected: return "ResultRejected";
        case ErrorCode::JobFault: return "JobFault";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::StorageError: return "StorageError";
        case ErrorCode::NotRunning: return "NotRunning";
        case ErrorCode::QueueFull: return "QueueFull";
        default: return "Unknown";
    }
}

Timestamp nowMillis() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}
