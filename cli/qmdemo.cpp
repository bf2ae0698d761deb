/*
 * qmgr - Demo supervisor (qmdemo)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/logger.hpp"
#include "qmgr/supervisor.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <thread>

using namespace qmgr;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

// {"numbers": [..]} -> {"sum": N}
class SumJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext& ctx) override {
        const auto& numbers = params().at("numbers");
        long long sum = 0;
        std::size_t done = 0;
        for (const auto& n : numbers) {
            ctx.throwIfCancelled();
            sum += n.get<long long>();
            ++done;
            ctx.reportProgress(static_cast<int>(done * 100 / numbers.size()), "Added " + std::to_string(done) + " numbers");
        }
        return {{"sum", sum}};
    }
};

// {"seconds": N}; sleeps in 100ms steps and honours cancellation.
class SleepJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext& ctx) override {
        const double seconds = params().value("seconds", 1.0);
        const int steps = std::max(1, static_cast<int>(seconds * 10));
        for (int i = 0; i < steps; ++i) {
            ctx.throwIfCancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            ctx.reportProgress((i + 1) * 100 / steps, "Sleeping");
        }
        return {{"slept", seconds}};
    }
};

// {"message": "..."}; always throws.
class FailJob : public Job {
public:
    using Job::Job;

    nlohmann::json execute(JobContext&) override {
        throw std::runtime_error(params().value("message", std::string("boom")));
    }
};

void printUsage(const char* progName) {
    std::cout << "qmgr Demo Supervisor v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <registry> [count] [--serve]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  registry      Registry file (created if missing)\n";
    std::cout << "  count         Number of demo jobs to submit (default: 6)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --serve       Keep running after the demo jobs until SIGINT/SIGTERM\n\n";
    std::cout << "Job types: sum, sleep, fail\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  QMGR_LOG_LEVEL            Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  QMGR_MAX_CONCURRENT_JOBS  Worker count (default: 10)\n";
    std::cout << "  QMGR_ISOLATION            process | thread (default: process)\n";
    std::cout << "  QMGR_JOB_TIMEOUT_MS       Per-job timeout, 0 = none\n\n";
    std::cout << "Inspect the registry with qmstat.\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string registry = argv[1];
    if (registry == "-h" || registry == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    int count = 6;
    bool serve = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--serve") {
            serve = true;
            continue;
        }
        try {
            count = std::stoi(arg);
        } catch (const std::exception&) {
            std::cerr << "Error: invalid count: " << arg << "\n";
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    SupervisorConfig config = SupervisorConfig::fromEnv();
    config.registryPath = registry;

    Supervisor supervisor(config);
    if (!supervisor.registerJobType<SumJob>("sum") ||
        !supervisor.registerJobType<SleepJob>("sleep") ||
        !supervisor.registerJobType<FailJob>("fail")) {
        std::cerr << "Error: failed to register job types\n";
        return 1;
    }

    OpResult started = supervisor.start();
    if (!started) {
        std::cerr << "Error: " << started.message << "\n";
        return 1;
    }

    const std::string prefix = "demo-" + std::to_string(nowMillis()) + "-";
    std::vector<JobId> submitted;
    for (int i = 0; i < count; ++i) {
        JobId id = prefix + std::to_string(i);
        OpResult r;
        switch (i % 3) {
            case 0: {
                std::vector<int> numbers(static_cast<std::size_t>(5 + i));
                std::iota(numbers.begin(), numbers.end(), 1);
                r = supervisor.submit("sum", id, {{"numbers", numbers}});
                break;
            }
            case 1:
                r = supervisor.submit("sleep", id, {{"seconds", 0.5}});
                break;
            default:
                r = supervisor.submit("fail", id, {{"message", "demo failure " + std::to_string(i)}});
                break;
        }
        if (!r) {
            std::cerr << "Submit " << id << " failed: " << r.message << "\n";
            continue;
        }
        if (!config.autoStart) {
            r = supervisor.start(id);
            if (!r) {
                std::cerr << "Start " << id << " failed: " << r.message << "\n";
                continue;
            }
        }
        submitted.push_back(id);
    }

    for (const auto& id : submitted) {
        if (g_shutdown_requested) {
            break;
        }
        auto record = supervisor.waitFor(id, std::chrono::seconds(30));
        if (!record) {
            std::cout << id << "  still running\n";
            continue;
        }
        std::cout << id << "  " << statusToString(record->status);
        if (record->result) {
            std::cout << "  " << record->result->dump();
        }
        if (record->error) {
            std::cout << "  " << record->error->kind << ": " << record->error->message;
        }
        std::cout << "\n";
    }

    if (serve) {
        std::cout << "Serving " << registry << " (Ctrl+C to stop)\n";
        while (!g_shutdown_requested && supervisor.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    SupervisorStats stats = supervisor.stats();
    std::cout << "completed=" << stats.count(Status::Completed)
              << " failed=" << stats.count(Status::Failed)
              << " cancelled=" << stats.count(Status::Cancelled)
              << " total=" << stats.total() << "\n";

    supervisor.shutdown();
    return 0;
}
