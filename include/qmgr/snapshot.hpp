/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "qmgr/types.hpp"

namespace qmgr {

// Read-only view of a registry file for processes other than the writer.
// Takes no lock shared with the writer: it reads complete lines only, so it
// may be one update behind but never sees a torn record. Not thread-safe.
class Snapshot {
public:
    explicit Snapshot(std::filesystem::path path) noexcept;

    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;
    Snapshot(Snapshot&&) noexcept = default;
    Snapshot& operator=(Snapshot&&) noexcept = default;

    // Re-reads the file. On failure the previous view is kept.
    [[nodiscard]] OpResult refresh() noexcept;

    [[nodiscard]] std::optional<JobRecord> get(const JobId& id) const noexcept;
    [[nodiscard]] std::optional<Status> status(const JobId& id) const noexcept;
    // Most recently updated record.
    [[nodiscard]] std::optional<JobRecord> latest() const noexcept;
    // Ordered by creation time, then id. A non-zero max keeps only the newest.
    [[nodiscard]] std::vector<JobRecord> list(std::size_t max = 0) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] std::size_t skippedLines() const noexcept { return skipped_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct View {
        std::unordered_map<JobId, JobRecord> records;
        std::unordered_set<JobId> deleted;
        std::size_t skipped = 0;
    };

    [[nodiscard]] OpResult load(View& view) const;

    std::filesystem::path path_;
    std::unordered_map<JobId, JobRecord> records_;
    std::size_t skipped_ = 0;
};

}
