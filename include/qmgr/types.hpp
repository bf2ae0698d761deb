/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace qmgr {

// Job lifecycle states. Order matches the forward direction of the lifecycle.
enum class Status : std::uint8_t { Created, Queued, Running, Completed, Failed, Cancelled };

// Caller-supplied job identifier, unique across the whole registry history.
using JobId = std::string;

// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

struct JobError {
    std::string kind;
    std::string message;
};

struct JobRecord {
    JobId id;
    std::string type;
    Status status = Status::Created;
    nlohmann::json params = nlohmann::json::object();
    std::optional<nlohmann::json> result;
    std::optional<JobError> error;
    int progress = 0;
    std::string description;
    Timestamp createdAt = 0;
    Timestamp updatedAt = 0;
    std::uint64_t sizeBytes = 0;
};

enum class ErrorCode : std::uint8_t {
    None = 0,
    InvalidArgument,
    DuplicateJobId,
    NotFound,
    InvalidTransition,
    JobNotTerminal,
    ResultRejected,
    JobFault,
    DecodeError,
    StorageError,
    NotRunning,
    QueueFull
};

struct OpResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    static OpResult success(std::string message = {}) {
        return {true, ErrorCode::None, std::move(message)};
    }
    static OpResult failure(ErrorCode code, std::string message) {
        return {false, code, std::move(message)};
    }
};

[[nodiscard]] const char* statusToString(Status status) noexcept;
[[nodiscard]] std::optional<Status> statusFromString(const std::string& text) noexcept;
[[nodiscard]] const char* errorCodeToString(ErrorCode code) noexcept;
[[nodiscard]] Timestamp nowMillis() noexcept;

}
