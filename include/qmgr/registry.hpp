/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "qmgr/codec.hpp"
#include "qmgr/types.hpp"

namespace qmgr {

struct RegistryStats {
    std::size_t records = 0;
    std::size_t tombstones = 0;
    std::size_t lines = 0;
    std::size_t supersededLines = 0;
    std::size_t skippedLines = 0;
    std::uintmax_t bytes = 0;
    std::uint64_t generation = 0;
};

// Runs on a copy of the current record; nothing is written unless it succeeds.
using Mutation = std::function<OpResult(JobRecord&)>;
using RecordFilter = std::function<bool(const JobRecord&)>;

// Append-structured JSON-lines log of job records with an in-memory index.
// Every update appends the full record; the last line per job id wins.
// All mutating calls are serialized; this is the single write path.
class Registry final {
public:
    explicit Registry(std::filesystem::path path, bool syncWrites = true);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry&&) = delete;

    // Loads the log, dropping a torn trailing line. Interior corruption fails
    // with DecodeError and leaves the file untouched.
    [[nodiscard]] OpResult open() noexcept;
    void close() noexcept;
    [[nodiscard]] bool isOpen() const noexcept;

    // Creates a record; the id must never have been used before.
    [[nodiscard]] OpResult append(const JobRecord& record) noexcept;
    [[nodiscard]] OpResult update(const JobId& id, const Mutation& mutation,
                                  JobRecord* updated = nullptr) noexcept;

    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const noexcept;
    [[nodiscard]] std::vector<JobRecord> list() const noexcept;
    // True for live records and for deleted (tombstoned) ids.
    [[nodiscard]] bool contains(const JobId& id) const noexcept;

    [[nodiscard]] OpResult compact() noexcept;
    [[nodiscard]] OpResult remove(const JobId& id) noexcept;
    [[nodiscard]] OpResult removeIf(const RecordFilter& filter, std::size_t* removed = nullptr) noexcept;

    [[nodiscard]] RegistryStats stats() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    [[nodiscard]] OpResult load();
    [[nodiscard]] OpResult appendLine(const std::string& line) noexcept;
    [[nodiscard]] OpResult rewrite(const std::vector<JobId>& drop, Timestamp now) noexcept;
    [[nodiscard]] OpResult openForAppend() noexcept;
    [[nodiscard]] bool acceptLoaded(const JobRecord& record, std::size_t lineNo);

    std::filesystem::path path_;
    bool syncWrites_;

    mutable std::mutex mutex_;
    int fd_ = -1;
    std::uintmax_t bytes_ = 0;
    std::size_t lines_ = 0;
    std::size_t skipped_ = 0;
    std::uint64_t generation_ = 0;

    std::unordered_map<JobId, JobRecord> index_;
    std::unordered_map<JobId, Timestamp> tombstones_;
};

}
