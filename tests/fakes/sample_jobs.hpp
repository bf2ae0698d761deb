/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

#include "qmgr/job.hpp"
#include "qmgr/supervisor.hpp"

// Jobs with fixed, observable behaviour. Anything they need to report back
// goes through the record or the filesystem so they work in a forked child.
namespace qmgr::test {

// {"n": N} -> {"sum": 1 + .. + N}
class SumJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext& ctx) override {
        const int n = params().value("n", 0);
        long long sum = 0;
        for (int i = 1; i <= n; ++i) {
            ctx.throwIfCancelled();
            sum += i;
        }
        return {{"sum", sum}};
    }
};

// Throws std::runtime_error with {"message"} (default "boom").
class FailJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext&) override {
        throw std::runtime_error(params().value("message", std::string("boom")));
    }
};

// Sleeps {"ms"} in 10ms steps, reporting progress and honouring cancellation.
class SleepJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext& ctx) override {
        const int ms = params().value("ms", 100);
        const int steps = std::max(1, ms / 10);
        for (int i = 0; i < steps; ++i) {
            ctx.throwIfCancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ctx.reportProgress((i + 1) * 100 / steps, "step " + std::to_string(i + 1));
        }
        return {{"slept_ms", ms}};
    }
};

// Sleeps {"ms"} without ever looking at the cancellation flag.
class StubbornJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(params().value("ms", 1000)));
        return {{"ignored", "cancel"}};
    }
};

// Returns a string of {"bytes"} characters.
class BigResultJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext&) override {
        return {{"blob", std::string(params().value("bytes", std::size_t{1024}), 'x')}};
    }
};

class NanResultJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext&) override {
        return {{"ratio", std::numeric_limits<double>::quiet_NaN()}};
    }
};

// Exits without reporting; only meaningful with process isolation.
class CrashJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext&) override {
        std::_Exit(3);
    }
};

// Touches <marker_dir>/<id>.<hook> for every hook that runs. With
// {"fail": true} execute() throws, with {"throw_in_hooks": true} the hooks
// throw after leaving their marker.
class HookJob : public Job {
public:
    using Job::Job;

    void onStart() override {
        mark("start");
    }

    nlohmann::json execute(JobContext&) override {
        if (params().value("fail", false)) {
            throw std::logic_error("hook job failed");
        }
        return {{"ok", true}};
    }

    void onEnd() override {
        mark("end");
        if (params().value("throw_in_hooks", false)) {
            throw std::runtime_error("onEnd exploded");
        }
    }

    void onError(const JobError& error) override {
        mark("error", error.kind + ": " + error.message);
        if (params().value("throw_in_hooks", false)) {
            throw std::runtime_error("onError exploded");
        }
    }

private:
    void mark(const std::string& hook, const std::string& content = {}) const {
        std::ofstream out(params().value("marker_dir", std::string(".")) + "/" + id() + "." + hook);
        out << content;
    }
};

inline void registerSampleJobs(Supervisor& supervisor) {
    (void)supervisor.registerJobType<SumJob>("sum");
    (void)supervisor.registerJobType<FailJob>("fail");
    (void)supervisor.registerJobType<SleepJob>("sleep");
    (void)supervisor.registerJobType<StubbornJob>("stubborn");
    (void)supervisor.registerJobType<BigResultJob>("big");
    (void)supervisor.registerJobType<NanResultJob>("nan");
    (void)supervisor.registerJobType<CrashJob>("crash");
    (void)supervisor.registerJobType<HookJob>("hooks");
}

}
