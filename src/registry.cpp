/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/registry.hpp"
#include "qmgr/logger.hpp"
#include "qmgr/state_machine.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <unordered_set>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace qmgr {

namespace {
constexpr std::size_t kRewriteChunkBytes = 1 << 20;

std::string errnoMessage(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

// Writes the whole buffer, retrying short writes. Returns 0 or errno.
int writeAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return 0;
}

bool fsyncParentDirectory(const std::filesystem::path& p, int& err) {
    err = 0;
    auto parent = p.parent_path();
    if (parent.empty()) {
        parent = ".";
    }
    int dfd = ::open(parent.c_str(), O_RDONLY | O_CLOEXEC);
    if (dfd < 0) {
        err = errno;
        return false;
    }
    bool ok = (::fsync(dfd) == 0);
    if (!ok) {
        err = errno;
    }
    ::close(dfd);
    return ok;
}

bool recordOrder(const JobRecord* a, const JobRecord* b) {
    if (a->createdAt != b->createdAt) {
        return a->createdAt < b->createdAt;
    }
    return a->id < b->id;
}

OpResult storageError(std::string message) {
    LOG_ERROR(message);
    return OpResult::failure(ErrorCode::StorageError, std::move(message));
}
}

Registry::Registry(std::filesystem::path path, bool syncWrites)
    : path_(std::move(path)), syncWrites_(syncWrites) {
    LOG_DEBUG("Registry created for " + path_.string());
}

Registry::~Registry() {
    close();
}

OpResult Registry::open() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        return OpResult::success("Registry already open");
    }

    try {
        index_.clear();
        tombstones_.clear();
        lines_ = 0;
        skipped_ = 0;
        bytes_ = 0;

        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        OpResult loaded = load();
        if (!loaded) {
            index_.clear();
            tombstones_.clear();
            return loaded;
        }
        return openForAppend();
    } catch (const std::exception& e) {
        return storageError("Failed to open registry " + path_.string() + ": " + e.what());
    }
}

void Registry::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ < 0) {
        return;
    }
    if (::close(fd_) != 0) {
        LOG_WARN(errnoMessage("Closing registry " + path_.string() + " failed", errno));
    }
    fd_ = -1;
    index_.clear();
    tombstones_.clear();
    LOG_DEBUG("Registry closed: " + path_.string());
}

bool Registry::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

OpResult Registry::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LOG_INFO("Creating new registry: " + path_.string());
        return OpResult::success();
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return storageError("Failed to open registry for reading: " + path_.string());
    }

    std::string line;
    std::uintmax_t offset = 0;
    std::uintmax_t goodOffset = 0;
    std::size_t lineNo = 0;
    std::size_t malformedLine = 0;
    std::string malformedError;

    while (std::getline(in, line)) {
        ++lineNo;
        const bool terminated = !in.eof();
        const std::uintmax_t next = offset + line.size() + (terminated ? 1 : 0);

        if (malformedLine != 0) {
            return OpResult::failure(ErrorCode::DecodeError,
                "Registry " + path_.string() + " is corrupt at line " + std::to_string(malformedLine) +
                " (" + malformedError + "); refusing to repair interior damage");
        }

        if (!terminated) {
            // Interrupted append: the line never received its terminator
            LOG_WARN("Discarding unterminated trailing line " + std::to_string(lineNo) + " (" +
                     std::to_string(line.size()) + " bytes) from " + path_.string());
            offset = next;
            break;
        }

        if (!line.empty()) {
            DecodeResult r = decode(line);
            if (r.status == DecodeStatus::Malformed) {
                malformedLine = lineNo;
                malformedError = r.error;
                offset = next;
                continue;
            }

            if (r.status == DecodeStatus::Invalid) {
                LOG_WARN("Skipping invalid record at line " + std::to_string(lineNo) + ": " + r.error);
                ++skipped_;
            } else if (r.tombstone) {
                index_.erase(r.tombstone->id);
                tombstones_[r.tombstone->id] = r.tombstone->deletedAt;
                ++lines_;
            } else if (acceptLoaded(*r.record, lineNo)) {
                ++lines_;
            } else {
                ++skipped_;
            }
        }

        offset = next;
        goodOffset = next;
    }

    if (in.bad()) {
        return storageError("Read error while loading registry " + path_.string());
    }

    if (malformedLine != 0) {
        LOG_WARN("Discarding malformed trailing line " + std::to_string(malformedLine) + " from " +
                 path_.string() + ": " + malformedError);
    }

    if (goodOffset < offset) {
        if (::truncate(path_.c_str(), static_cast<off_t>(goodOffset)) != 0) {
            return storageError(errnoMessage("Failed to truncate torn tail of " + path_.string(), errno));
        }
        LOG_WARN("Recovered registry " + path_.string() + ": truncated from " + std::to_string(offset) +
                 " to " + std::to_string(goodOffset) + " bytes");
    }

    bytes_ = goodOffset;
    LOG_INFO("Loaded " + std::to_string(index_.size()) + " job record(s) from " + path_.string());
    return OpResult::success();
}

bool Registry::acceptLoaded(const JobRecord& record, std::size_t lineNo) {
    if (tombstones_.count(record.id) > 0) {
        LOG_WARN("Ignoring line " + std::to_string(lineNo) + ": job id '" + record.id + "' was deleted");
        return false;
    }

    auto it = index_.find(record.id);
    if (it == index_.end()) {
        index_.emplace(record.id, record);
        return true;
    }

    const Status previous = it->second.status;
    const bool forward = canTransition(previous, record.status) ||
                         (previous == record.status && !isTerminal(previous));
    if (!forward) {
        LOG_WARN("Ignoring line " + std::to_string(lineNo) + ": job '" + record.id + "' cannot move from " +
                 statusToString(previous) + " to " + statusToString(record.status));
        return false;
    }
    it->second = record;
    return true;
}

OpResult Registry::openForAppend() noexcept {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return storageError(errnoMessage("Failed to open registry for append: " + path_.string(), errno));
    }

    struct stat st{};
    if (::fstat(fd_, &st) == 0) {
        bytes_ = static_cast<std::uintmax_t>(st.st_size);
    }
    return OpResult::success();
}

OpResult Registry::appendLine(const std::string& line) noexcept {
    if (fd_ < 0) {
        return OpResult::failure(ErrorCode::StorageError, "Registry is not open");
    }

    try {
        std::string buffer;
        buffer.reserve(line.size() + 1);
        buffer.append(line);
        buffer.push_back('\n');

        // One write per line keeps readers from ever seeing a mix of two records
        int err = writeAll(fd_, buffer.data(), buffer.size());
        if (err == 0 && syncWrites_ && ::fdatasync(fd_) != 0) {
            err = errno;
        }

        if (err != 0) {
            // Put the file back on the last line boundary; the record keeps its previous state
            if (::ftruncate(fd_, static_cast<off_t>(bytes_)) != 0) {
                LOG_ERROR(errnoMessage("Failed to roll back partial append on " + path_.string(), errno));
            }
            return storageError(errnoMessage("Failed to append to registry " + path_.string(), err));
        }

        bytes_ += buffer.size();
        ++lines_;
        return OpResult::success();
    } catch (const std::exception& e) {
        return storageError("Failed to append to registry " + path_.string() + ": " + e.what());
    }
}

OpResult Registry::append(const JobRecord& record) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record.id.empty()) {
        return OpResult::failure(ErrorCode::InvalidArgument, "job_id must be a non-empty string");
    }
    if (index_.count(record.id) > 0 || tombstones_.count(record.id) > 0) {
        return OpResult::failure(ErrorCode::DuplicateJobId,
                                 "Job with ID '" + record.id + "' already exists");
    }

    try {
        OpResult written = appendLine(encode(record));
        if (!written) {
            return written;
        }
        index_.emplace(record.id, record);
        LOG_TRACE("Appended job " + record.id + " (" + statusToString(record.status) + ")");
        return OpResult::success();
    } catch (const std::exception& e) {
        return storageError("Failed to encode job " + record.id + ": " + e.what());
    }
}

OpResult Registry::update(const JobId& id, const Mutation& mutation, JobRecord* updated) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return OpResult::failure(ErrorCode::NotFound, "Job with ID '" + id + "' not found");
    }

    try {
        JobRecord copy = it->second;
        OpResult changed = mutation(copy);
        if (!changed) {
            return changed;
        }
        if (copy.id != id) {
            return OpResult::failure(ErrorCode::InvalidArgument, "A mutation may not change the job id");
        }

        OpResult written = appendLine(encode(copy));
        if (!written) {
            return written;
        }
        it->second = std::move(copy);
        if (updated) {
            *updated = it->second;
        }
        LOG_TRACE("Updated job " + id + " (" + statusToString(it->second.status) + ")");
        return OpResult::success();
    } catch (const std::exception& e) {
        return storageError("Failed to update job " + id + ": " + e.what());
    }
}

std::optional<JobRecord> Registry::get(const JobId& id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<JobRecord> Registry::list() const noexcept {
    std::vector<JobRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const JobRecord*> ordered;
    ordered.reserve(index_.size());
    for (const auto& entry : index_) {
        ordered.push_back(&entry.second);
    }
    std::sort(ordered.begin(), ordered.end(), recordOrder);

    out.reserve(ordered.size());
    for (const auto* record : ordered) {
        out.push_back(*record);
    }
    return out;
}

bool Registry::contains(const JobId& id) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(id) > 0 || tombstones_.count(id) > 0;
}

OpResult Registry::compact() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return rewrite({}, nowMillis());
}

OpResult Registry::remove(const JobId& id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(id) == 0) {
        return OpResult::failure(ErrorCode::NotFound, "Job with ID '" + id + "' not found");
    }
    return rewrite({id}, nowMillis());
}

OpResult Registry::removeIf(const RecordFilter& filter, std::size_t* removed) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (removed) {
        *removed = 0;
    }

    std::vector<JobId> drop;
    try {
        for (const auto& [id, record] : index_) {
            if (filter(record)) {
                drop.push_back(id);
            }
        }
    } catch (const std::exception& e) {
        return OpResult::failure(ErrorCode::InvalidArgument, std::string("Record filter failed: ") + e.what());
    }

    if (drop.empty()) {
        return OpResult::success();
    }
    OpResult r = rewrite(drop, nowMillis());
    if (r && removed) {
        *removed = drop.size();
    }
    return r;
}

// Writes the surviving state to a temp file and renames it over the log.
// Until the rename succeeds the original file is untouched.
OpResult Registry::rewrite(const std::vector<JobId>& drop, Timestamp now) noexcept {
    if (fd_ < 0) {
        return OpResult::failure(ErrorCode::StorageError, "Registry is not open");
    }

    int tfd = -1;
    std::string tempPath;
    auto abandon = [&](const std::string& message) {
        if (tfd >= 0) {
            ::close(tfd);
        }
        if (!tempPath.empty()) {
            ::unlink(tempPath.c_str());
        }
        return storageError(message);
    };

    try {
        std::unordered_set<JobId> dropped(drop.begin(), drop.end());
        auto tombstones = tombstones_;
        for (const auto& id : drop) {
            tombstones[id] = now;
        }

        std::vector<const JobRecord*> keep;
        keep.reserve(index_.size());
        for (const auto& entry : index_) {
            if (dropped.count(entry.first) == 0) {
                keep.push_back(&entry.second);
            }
        }
        std::sort(keep.begin(), keep.end(), recordOrder);

        std::vector<Tombstone> retired;
        retired.reserve(tombstones.size());
        for (const auto& [id, deletedAt] : tombstones) {
            retired.push_back({id, deletedAt});
        }
        std::sort(retired.begin(), retired.end(),
                  [](const Tombstone& a, const Tombstone& b) { return a.id < b.id; });

        std::string tmpl = path_.string() + ".tmp.XXXXXX";
        std::vector<char> name(tmpl.begin(), tmpl.end());
        name.push_back('\0');
        tfd = ::mkstemp(name.data());
        if (tfd < 0) {
            return abandon(errnoMessage("Failed to create temp file for " + path_.string(), errno));
        }
        tempPath = name.data();

        std::string chunk;
        chunk.reserve(kRewriteChunkBytes);
        std::uintmax_t written = 0;
        int err = 0;
        auto flush = [&]() {
            if (err == 0 && !chunk.empty()) {
                err = writeAll(tfd, chunk.data(), chunk.size());
                written += chunk.size();
            }
            chunk.clear();
        };

        for (const auto& t : retired) {
            chunk += encode(t);
            chunk.push_back('\n');
            if (chunk.size() >= kRewriteChunkBytes) {
                flush();
            }
        }
        for (const auto* record : keep) {
            chunk += encode(*record);
            chunk.push_back('\n');
            if (chunk.size() >= kRewriteChunkBytes) {
                flush();
            }
        }
        flush();
        if (err != 0) {
            return abandon(errnoMessage("Failed to write compacted registry " + tempPath, err));
        }

        if (::fchmod(tfd, 0644) != 0) {
            LOG_WARN(errnoMessage("Could not set permissions on " + tempPath, errno));
        }
        if (::fsync(tfd) != 0) {
            return abandon(errnoMessage("Failed to sync compacted registry " + tempPath, errno));
        }
        int closeResult = ::close(tfd);
        tfd = -1;
        if (closeResult != 0) {
            return abandon(errnoMessage("Failed to close compacted registry " + tempPath, errno));
        }

        if (::rename(tempPath.c_str(), path_.c_str()) != 0) {
            return abandon(errnoMessage("Failed to replace registry " + path_.string(), errno));
        }
        tempPath.clear();

        int dirErr = 0;
        if (!fsyncParentDirectory(path_, dirErr)) {
            LOG_WARN(errnoMessage("Directory sync after compaction failed", dirErr));
        }

        const std::size_t before = lines_;
        for (const auto& id : drop) {
            index_.erase(id);
        }
        tombstones_ = std::move(tombstones);
        lines_ = index_.size() + tombstones_.size();
        ++generation_;

        // The old descriptor still points at the replaced inode
        ::close(fd_);
        fd_ = -1;
        OpResult reopened = openForAppend();
        if (!reopened) {
            return reopened;
        }
        bytes_ = written;

        LOG_DEBUG("Registry rewritten (generation " + std::to_string(generation_) + "): " +
                  std::to_string(before) + " -> " + std::to_string(lines_) + " lines, " +
                  std::to_string(drop.size()) + " record(s) removed");
        return OpResult::success();
    } catch (const std::exception& e) {
        return abandon("Failed to rewrite registry " + path_.string() + ": " + e.what());
    }
}

RegistryStats Registry::stats() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    RegistryStats s;
    s.records = index_.size();
    s.tombstones = tombstones_.size();
    s.lines = lines_;
    const std::size_t live = s.records + s.tombstones;
    s.supersededLines = lines_ > live ? lines_ - live : 0;
    s.skippedLines = skipped_;
    s.bytes = bytes_;
    s.generation = generation_;
    return s;
}

}
