/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>

#include "qmgr/types.hpp"

namespace qmgr {

// CREATED -> QUEUED -> RUNNING -> {COMPLETED, FAILED, CANCELLED}
// plus any non-terminal -> CANCELLED. Nothing leaves a terminal state.
[[nodiscard]] bool isTerminal(Status status) noexcept;
[[nodiscard]] bool canTransition(Status from, Status to) noexcept;

// Moves the record to `to` and stamps updated_at. Use the dedicated helpers
// for COMPLETED and FAILED so the payload lands with the transition.
[[nodiscard]] OpResult transition(JobRecord& record, Status to, Timestamp now);

[[nodiscard]] OpResult complete(JobRecord& record, nlohmann::json result,
                                std::uint64_t sizeBytes, Timestamp now);
[[nodiscard]] OpResult fail(JobRecord& record, JobError error, Timestamp now);

// Progress reports are only accepted while RUNNING.
[[nodiscard]] OpResult reportProgress(JobRecord& record, int progress,
                                      const std::string& description, Timestamp now);

}
