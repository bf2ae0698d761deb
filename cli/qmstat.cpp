/*
 * qmgr - Registry status tool (qmstat)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/codec.hpp"
#include "qmgr/logger.hpp"
#include "qmgr/snapshot.hpp"
#include "qmgr/state_machine.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace qmgr;

void printUsage(const char* progName) {
    std::cout << "qmgr Registry Status Tool\n\n";
    std::cout << "Usage: " << progName << " <registry> [job_id] [--wait] [--latest] [-n <count>]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  registry      Registry file written by a qmgr supervisor\n";
    std::cout << "  job_id        Job to print as JSON (optional)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Block until the job reaches a terminal state\n";
    std::cout << "  -l, --latest  Print the most recently updated job\n";
    std::cout << "  -n <count>    Limit the job table to the newest <count> jobs\n\n";
    std::cout << "Exit codes:\n";
    std::cout << "  0  job completed (or table printed)\n";
    std::cout << "  1  job failed, cancelled or not found\n";
    std::cout << "  2  job not finished yet\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  QMGR_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./qmgr_registry.jsonl\n";
    std::cout << "  " << progName << " ./qmgr_registry.jsonl job-42 --wait\n";
}

void printTable(const std::vector<JobRecord>& jobs) {
    std::cout << std::left << std::setw(24) << "JOB ID" << std::setw(16) << "TYPE"
              << std::setw(11) << "STATUS" << std::setw(6) << "PROG" << "DESCRIPTION\n";
    for (const auto& job : jobs) {
        std::cout << std::left << std::setw(24) << job.id << std::setw(16) << job.type
                  << std::setw(11) << statusToString(job.status)
                  << std::setw(6) << (std::to_string(job.progress) + "%") << job.description << "\n";
    }
}

int exitCodeFor(Status status) {
    if (status == Status::Completed) return 0;
    if (isTerminal(status)) return 1;
    return 2;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; QMGR_LOG_LEVEL overrides
    if (!std::getenv("QMGR_LOG_LEVEL")) {
        Logger::setLevel(LogLevel::WARN);
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string registry = argv[1];
    if (registry == "-h" || registry == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    std::string jobId;
    bool wait = false;
    bool latest = false;
    std::size_t limit = 0;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "-l" || arg == "--latest") {
            latest = true;
        } else if (arg == "-n") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -n requires a count\n";
                return 1;
            }
            try {
                limit = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: invalid count: " << argv[i] << "\n";
                return 1;
            }
        } else {
            jobId = arg;
        }
    }

    // Job id may be piped in
    if (jobId.empty() && !latest && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        Snapshot snapshot(registry);
        OpResult loaded = snapshot.refresh();
        if (!loaded) {
            std::cerr << "Error: " << loaded.message << std::endl;
            return 1;
        }

        if (latest) {
            auto newest = snapshot.latest();
            if (!newest) {
                std::cerr << "No jobs found" << std::endl;
                return 1;
            }
            jobId = newest->id;
        }

        if (jobId.empty()) {
            printTable(snapshot.list(limit));
            if (snapshot.skippedLines() > 0) {
                std::cerr << snapshot.skippedLines() << " unreadable line(s) skipped" << std::endl;
            }
            return 0;
        }

        // Another process owns the writer; polling the file is all a reader can do
        if (wait) {
            while (true) {
                auto status = snapshot.status(jobId);
                if (status && isTerminal(*status)) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                OpResult refreshed = snapshot.refresh();
                if (!refreshed) {
                    LOG_DEBUG("Refresh failed while waiting: " + refreshed.message);
                }
            }
        }

        auto job = snapshot.get(jobId);
        if (!job) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        std::cout << nlohmann::json::parse(encode(*job)).dump(2) << std::endl;
        return exitCodeFor(job->status);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
