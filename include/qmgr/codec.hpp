/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "qmgr/types.hpp"

namespace qmgr {

// Marks a job id as retired: the record is gone but the id stays reserved.
struct Tombstone {
    JobId id;
    Timestamp deletedAt = 0;
};

enum class DecodeStatus : uint8_t {
    Ok,
    Malformed,  // not parseable: truncated or corrupt bytes
    Invalid     // well-formed JSON that is not a valid record
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Malformed;
    std::optional<JobRecord> record;
    std::optional<Tombstone> tombstone;
    std::string error;
    explicit operator bool() const noexcept { return status == DecodeStatus::Ok; }
};

// One unit per line. The returned text never contains a raw newline; the
// store appends the terminator.
[[nodiscard]] std::string encode(const JobRecord& record);
[[nodiscard]] std::string encode(const Tombstone& tombstone);

[[nodiscard]] DecodeResult decode(std::string_view line) noexcept;

// Byte size of the compact serialization, or nothing when the value cannot be
// serialized (invalid UTF-8).
[[nodiscard]] std::optional<std::uint64_t> encodedSize(const nlohmann::json& value) noexcept;

}
