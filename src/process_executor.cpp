/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/executor.hpp"
#include "qmgr/logger.hpp"
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <deque>
#include <mutex>
#include <set>
#include <system_error>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// Wire format between supervisor and child, over one AF_UNIX stream socket.
//   child -> supervisor: newline-terminated JSON frames
//     {"type":"progress","progress":N,"description":"..."}
//     {"type":"warning","message":"..."}
//     {"type":"outcome","kind":"returned|rejected|faulted|cancelled",...}
//       followed, for "returned", by one line holding the result itself
//     {"type":"done"}                      hooks finished, child exits
//   supervisor -> child:
//     'C'                                  cancellation request
//     'A' {"status":"...","error":{...}}\n committed state, run hooks
// The child never logs: it may have been forked while another thread held
// the logger lock.

namespace qmgr {

namespace {
constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::uint64_t kFrameSlack = 64 * 1024;
constexpr char kCancelByte = 'C';
constexpr char kAckByte = 'A';
constexpr int kChildProtocolFailure = 3;

// Supervisor-side socket ends; a forked child closes all of them.
std::mutex g_forkMutex;
std::set<int> g_supervisorFds;

void releaseFd(int fd) noexcept {
    std::lock_guard<std::mutex> lock(g_forkMutex);
    g_supervisorFds.erase(fd);
    ::close(fd);
}

bool sendAll(int fd, const char* data, std::size_t size) noexcept {
    while (size > 0) {
        ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

bool sendLine(int fd, std::string line) noexcept {
    line.push_back('\n');
    return sendAll(fd, line.data(), line.size());
}

std::string dumpCompact(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json errorToJson(const JobError& error) {
    return {{"kind", error.kind}, {"message", error.message}};
}

JobError errorFromJson(const nlohmann::json& value) {
    JobError error;
    if (value.is_object()) {
        error.kind = value.value("kind", std::string("Unknown"));
        error.message = value.value("message", std::string());
    }
    return error;
}

// ---- child side ----

class ChildContext final : public JobContext {
public:
    explicit ChildContext(int fd) : fd_(fd) {}

    bool cancelled() const noexcept override {
        while (!cancelled_) {
            char byte = 0;
            ssize_t n = ::recv(fd_, &byte, 1, MSG_DONTWAIT);
            if (n == 1) {
                cancelled_ = (byte == kCancelByte);
                continue;
            }
            if (n == 0) {
                // supervisor went away
                cancelled_ = true;
            } else if (errno == EINTR) {
                continue;
            }
            break;
        }
        return cancelled_;
    }

    void reportProgress(int progress, const std::string& description) noexcept override {
        try {
            nlohmann::json frame = {{"type", "progress"}, {"progress", progress}, {"description", description}};
            (void)sendLine(fd_, dumpCompact(frame));
        } catch (const std::exception&) {
            // progress is advisory; a lost report is not a fault
        }
    }

private:
    int fd_;
    mutable bool cancelled_ = false;
};

template <typename Fn>
void runChildHook(int fd, const char* hook, Fn&& fn) noexcept {
    try {
        fn();
    } catch (...) {
        JobError fault = describeFault(std::current_exception());
        try {
            nlohmann::json frame = {{"type", "warning"},
                {"message", std::string(hook) + " hook failed: " + fault.kind + ": " + fault.message}};
            (void)sendLine(fd, dumpCompact(frame));
        } catch (const std::exception&) {
            // nothing left to report with
        }
    }
}

// Blocks for the supervisor's commit acknowledgement. Stray cancel bytes are skipped.
std::optional<nlohmann::json> readAck(int fd) {
    char byte = 0;
    bool inAck = false;
    std::string line;
    for (;;) {
        ssize_t n = ::recv(fd, &byte, 1, 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return std::nullopt;
        }
        if (!inAck) {
            inAck = (byte == kAckByte);
            continue;
        }
        if (byte == '\n') {
            auto ack = nlohmann::json::parse(line, nullptr, false);
            if (ack.is_discarded()) {
                return std::nullopt;
            }
            return ack;
        }
        line.push_back(byte);
    }
}

[[noreturn]] void childMain(int fd, Job& job, const ResultGuard& guard) noexcept {
    try {
        ChildContext ctx(fd);
        runChildHook(fd, "on_start", [&] { job.onStart(); });

        nlohmann::json frame = {{"type", "outcome"}};
        std::string payload;
        try {
            nlohmann::json value = job.execute(ctx);
            GuardResult verdict = guard.check(value);
            if (verdict) {
                frame["kind"] = "returned";
                frame["size_bytes"] = verdict.sizeBytes;
                payload = dumpCompact(value);
            } else {
                frame["kind"] = "rejected";
                frame["error"] = errorToJson(verdict.toError());
            }
        } catch (const JobCancelled&) {
            frame["kind"] = "cancelled";
        } catch (...) {
            frame["kind"] = "faulted";
            frame["error"] = errorToJson(describeFault(std::current_exception()));
        }

        if (!sendLine(fd, dumpCompact(frame))) {
            ::_exit(kChildProtocolFailure);
        }
        if (!payload.empty() && !sendLine(fd, std::move(payload))) {
            ::_exit(kChildProtocolFailure);
        }

        auto ack = readAck(fd);
        if (!ack) {
            ::_exit(0);
        }

        runChildHook(fd, "on_end", [&] { job.onEnd(); });
        auto committed = statusFromString(ack->value("status", std::string()));
        if (committed && *committed == Status::Failed && ack->contains("error")) {
            JobError error = errorFromJson((*ack)["error"]);
            runChildHook(fd, "on_error", [&] { job.onError(error); });
        }

        (void)sendLine(fd, R"({"type":"done"})");
        ::_exit(0);
    } catch (...) {
        ::_exit(kChildProtocolFailure);
    }
}

// ---- supervisor side ----

struct Line {
    std::string text;
    bool truncated = false;
    std::uint64_t bytes = 0;
};

class ProcessExecution final : public Execution {
public:
    ProcessExecution(pid_t pid, int fd, JobId jobId, ProgressSink sink, ResultGuard guard)
        : pid_(pid), fd_(fd), jobId_(std::move(jobId)), sink_(std::move(sink)), guard_(guard) {
        LOG_DEBUG("Job " + jobId_ + " running in child pid " + std::to_string(pid_));
    }

    ~ProcessExecution() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!reaped_) {
                ::kill(pid_, SIGKILL);
            }
        }
        reap();
        releaseFd(fd_);
    }

    std::optional<ExecutionOutcome> await(std::optional<Clock::time_point> deadline) override {
        for (;;) {
            if (auto outcome = drain()) {
                sink_ = nullptr;
                return outcome;
            }
            if (eof_) {
                sink_ = nullptr;
                return lostChild();
            }
            if (!pump(deadline)) {
                return std::nullopt;
            }
        }
    }

    void cancel() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) {
            return;
        }
        if (::send(fd_, &kCancelByte, 1, MSG_NOSIGNAL | MSG_DONTWAIT) != 1) {
            LOG_DEBUG("Cancel signal to job " + jobId_ + " not delivered: " + std::strerror(errno));
        }
    }

    void terminate() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated_ = true;
        if (!reaped_ && ::kill(pid_, SIGKILL) == 0) {
            LOG_WARN("Killed child pid " + std::to_string(pid_) + " of job " + jobId_);
        }
    }

    void finish(Status committed, const std::optional<JobError>& error,
                std::chrono::milliseconds hookTimeout) noexcept override {
        try {
            if (!eof_ && !terminated_) {
                nlohmann::json ack = {{"status", statusToString(committed)}};
                if (error) {
                    ack["error"] = errorToJson(*error);
                }
                std::string message(1, kAckByte);
                message += dumpCompact(ack);
                if (sendLine(fd_, std::move(message))) {
                    const auto deadline = Clock::now() + hookTimeout;
                    while (!hooksDone_ && !eof_) {
                        (void)drain();
                        if (hooksDone_ || eof_) {
                            break;
                        }
                        if (!pump(deadline)) {
                            LOG_WARN("Hooks of job " + jobId_ + " exceeded " +
                                     std::to_string(hookTimeout.count()) + "ms");
                            break;
                        }
                    }
                }
            }
        } catch (const std::exception& e) {
            LOG_WARN("Hook hand-off for job " + jobId_ + " failed: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!reaped_ && !hooksDone_) {
                ::kill(pid_, SIGKILL);
            }
        }
        reap();
    }

private:
    std::uint64_t ceiling() const noexcept {
        return guard_.maxBytes() + kFrameSlack;
    }

    // Reads whatever is available. False once the deadline has passed.
    bool pump(std::optional<Clock::time_point> deadline) {
        int timeoutMs = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
            if (remaining <= 0) {
                return false;
            }
            timeoutMs = static_cast<int>(std::min<long long>(remaining + 1, INT_MAX));
        }

        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready < 0) {
            if (errno != EINTR) {
                LOG_ERROR("poll on job " + jobId_ + " channel failed: " + std::strerror(errno));
                eof_ = true;
            }
            return true;
        }
        if (ready == 0) {
            return true;
        }

        char buffer[kReadChunk];
        ssize_t n = ::recv(fd_, buffer, sizeof(buffer), MSG_DONTWAIT);
        if (n > 0) {
            ingest(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_ERROR("Reading job " + jobId_ + " channel failed: " + std::strerror(errno));
            eof_ = true;
        }
        return true;
    }

    // Splits the stream into lines. A line longer than the ceiling is counted
    // and dropped instead of buffered.
    void ingest(const char* data, std::size_t size) {
        while (size > 0) {
            const char* newline = static_cast<const char*>(std::memchr(data, '\n', size));
            std::size_t length = newline ? static_cast<std::size_t>(newline - data) : size;

            if (discarding_) {
                discarded_ += length;
            } else {
                pending_.append(data, length);
                if (pending_.size() > ceiling()) {
                    discarding_ = true;
                    discarded_ = pending_.size();
                    std::string().swap(pending_);
                }
            }

            if (newline) {
                Line line;
                if (discarding_) {
                    line.truncated = true;
                    line.bytes = discarded_;
                    discarding_ = false;
                    discarded_ = 0;
                } else {
                    line.bytes = pending_.size();
                    line.text = std::move(pending_);
                    pending_.clear();
                }
                lines_.push_back(std::move(line));
                ++length;
            }
            data += length;
            size -= length;
        }
    }

    std::optional<ExecutionOutcome> drain() {
        while (!lines_.empty()) {
            Line line = std::move(lines_.front());
            lines_.pop_front();

            if (expectingPayload_) {
                expectingPayload_ = false;
                return payloadOutcome(line);
            }
            if (line.truncated) {
                LOG_WARN("Job " + jobId_ + ": dropped oversized frame of " + std::to_string(line.bytes) + " bytes");
                continue;
            }

            try {
                auto frame = nlohmann::json::parse(line.text, nullptr, false);
                if (frame.is_discarded() || !frame.is_object()) {
                    LOG_WARN("Job " + jobId_ + ": unreadable frame from child");
                    continue;
                }

                const std::string type = frame.value("type", std::string());
                if (type == "progress") {
                    if (sink_) {
                        sink_(frame.value("progress", 0), frame.value("description", std::string()));
                    }
                } else if (type == "warning") {
                    LOG_WARN("Job " + jobId_ + ": " + frame.value("message", std::string()));
                } else if (type == "done") {
                    hooksDone_ = true;
                } else if (type == "outcome") {
                    const std::string kind = frame.value("kind", std::string());
                    if (kind == "returned") {
                        expectingPayload_ = true;
                        continue;
                    }
                    ExecutionOutcome outcome;
                    if (kind == "cancelled") {
                        outcome.kind = OutcomeKind::Cancelled;
                    } else {
                        outcome.kind = (kind == "rejected") ? OutcomeKind::Rejected : OutcomeKind::Faulted;
                        outcome.error = errorFromJson(frame.value("error", nlohmann::json::object()));
                    }
                    return outcome;
                }
            } catch (const nlohmann::json::exception& e) {
                LOG_WARN("Job " + jobId_ + ": bad frame from child: " + e.what());
            }
        }
        return std::nullopt;
    }

    ExecutionOutcome payloadOutcome(Line& line) {
        ExecutionOutcome outcome;
        if (line.truncated || line.bytes > guard_.maxBytes()) {
            outcome.kind = OutcomeKind::Rejected;
            outcome.error = guard_.oversized(line.bytes).toError();
            return outcome;
        }

        auto value = nlohmann::json::parse(line.text, nullptr, false);
        if (value.is_discarded()) {
            outcome.kind = OutcomeKind::Faulted;
            outcome.error = {"ProtocolError", "unreadable result payload from child"};
            return outcome;
        }

        guard_.noteAccepted(line.bytes);
        outcome.kind = OutcomeKind::Returned;
        outcome.result = std::move(value);
        outcome.sizeBytes = line.bytes;
        return outcome;
    }

    // The channel closed before an outcome arrived.
    ExecutionOutcome lostChild() {
        reap();
        ExecutionOutcome outcome;
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_) {
            outcome.kind = OutcomeKind::Terminated;
            outcome.error = {"Terminated", "child process killed"};
        } else if (WIFSIGNALED(waitStatus_)) {
            int sig = WTERMSIG(waitStatus_);
            outcome.error = {"Crash", "child killed by signal " + std::to_string(sig) + " (" +
                                      std::string(::strsignal(sig)) + ")"};
        } else if (WIFEXITED(waitStatus_)) {
            outcome.error = {"Crash", "child exited with status " + std::to_string(WEXITSTATUS(waitStatus_)) +
                                      " before reporting an outcome"};
        } else {
            outcome.error = {"Crash", "child vanished before reporting an outcome"};
        }
        return outcome;
    }

    // Waits for exit without reaping first, so kill() under the lock can
    // never hit a recycled pid.
    void reap() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reaped_) {
                return;
            }
        }
        siginfo_t info{};
        while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) {
            return;
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        waitStatus_ = status;
        reaped_ = true;
    }

    pid_t pid_;
    int fd_;
    JobId jobId_;
    ProgressSink sink_;
    ResultGuard guard_;

    std::mutex mutex_;
    bool reaped_ = false;
    bool terminated_ = false;
    int waitStatus_ = 0;

    std::string pending_;
    std::deque<Line> lines_;
    bool discarding_ = false;
    std::uint64_t discarded_ = 0;
    bool expectingPayload_ = false;
    bool hooksDone_ = false;
    bool eof_ = false;
};
}

std::unique_ptr<Execution> ProcessExecutor::launch(std::unique_ptr<Job> job, ProgressSink sink) {
    int sv[2] = {-1, -1};
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(g_forkMutex);
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
            throw std::system_error(errno, std::generic_category(), "socketpair");
        }

        pid = ::fork();
        if (pid < 0) {
            int err = errno;
            ::close(sv[0]);
            ::close(sv[1]);
            throw std::system_error(err, std::generic_category(), "fork");
        }
        if (pid == 0) {
            for (int fd : g_supervisorFds) {
                ::close(fd);
            }
            ::close(sv[0]);
            childMain(sv[1], *job, guard_);
        }

        ::close(sv[1]);
        g_supervisorFds.insert(sv[0]);
    }

    return std::make_unique<ProcessExecution>(pid, sv[0], job->id(), std::move(sink), guard_);
}

}
