/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/snapshot.hpp"
#include "qmgr/codec.hpp"
#include "qmgr/logger.hpp"
#include <algorithm>
#include <fstream>

namespace qmgr {

Snapshot::Snapshot(std::filesystem::path path) noexcept
    : path_(std::move(path)) {
    LOG_DEBUG("Snapshot created for registry: " + path_.string());
    OpResult loaded = refresh();
    if (!loaded) {
        LOG_DEBUG("Initial snapshot load failed: " + loaded.message);
    }
}

OpResult Snapshot::refresh() noexcept {
    try {
        View view;
        OpResult r = load(view);
        if (!r && r.error == ErrorCode::StorageError) {
            // One retry for transient failures; a concurrent rename is not one of them
            LOG_DEBUG("Retrying snapshot read of " + path_.string() + ": " + r.message);
            view = View{};
            r = load(view);
        }
        if (!r) {
            return r;
        }

        records_ = std::move(view.records);
        skipped_ = view.skipped;
        return OpResult::success();
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorCode::StorageError,
                                 "Failed to read registry " + path_.string() + ": " + e.what());
    }
}

OpResult Snapshot::load(View& view) const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return OpResult::failure(ErrorCode::NotFound, "Registry not found: " + path_.string());
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return OpResult::failure(ErrorCode::StorageError, "Cannot open registry: " + path_.string());
    }

    std::string line;
    while (std::getline(in, line)) {
        if (in.eof()) {
            // unterminated: an append still in flight
            break;
        }
        if (line.empty()) {
            continue;
        }

        DecodeResult r = decode(line);
        if (!r) {
            ++view.skipped;
            continue;
        }
        if (r.tombstone) {
            view.records.erase(r.tombstone->id);
            view.deleted.insert(r.tombstone->id);
            continue;
        }
        if (view.deleted.count(r.record->id) > 0) {
            ++view.skipped;
            continue;
        }
        view.records[r.record->id] = std::move(*r.record);
    }

    if (in.bad()) {
        return OpResult::failure(ErrorCode::StorageError, "Read error on registry: " + path_.string());
    }
    return OpResult::success();
}

std::optional<JobRecord> Snapshot::get(const JobId& id) const noexcept {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Status> Snapshot::status(const JobId& id) const noexcept {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<JobRecord> Snapshot::latest() const noexcept {
    const JobRecord* newest = nullptr;
    for (const auto& entry : records_) {
        const JobRecord& record = entry.second;
        if (!newest || record.updatedAt > newest->updatedAt ||
            (record.updatedAt == newest->updatedAt && record.id > newest->id)) {
            newest = &record;
        }
    }
    if (!newest) {
        return std::nullopt;
    }
    return *newest;
}

std::vector<JobRecord> Snapshot::list(std::size_t max) const noexcept {
    std::vector<JobRecord> jobs;
    try {
        jobs.reserve(records_.size());
        for (const auto& entry : records_) {
            jobs.push_back(entry.second);
        }
        std::sort(jobs.begin(), jobs.end(), [](const JobRecord& a, const JobRecord& b) {
            if (a.createdAt != b.createdAt) {
                return a.createdAt < b.createdAt;
            }
            return a.id < b.id;
        });
        if (max > 0 && jobs.size() > max) {
            jobs.erase(jobs.begin(), jobs.end() - static_cast<std::ptrdiff_t>(max));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing jobs: " + std::string(e.what()));
        jobs.clear();
    }
    return jobs;
}

}
