/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/executor.hpp"
#include <algorithm>
#include <cctype>

namespace qmgr {

std::unique_ptr<Executor> makeExecutor(Isolation isolation, const ResultGuard& guard) {
    switch (isolation) {
        case Isolation::Thread: return std::make_unique<ThreadExecutor>(guard);
        case Isolation::Process:
        default: return std::make_unique<ProcessExecutor>(guard);
    }
}

const char* isolationToString(Isolation isolation) noexcept {
    switch (isolation) {
        case Isolation::Process: return "process";
        case Isolation::Thread: return "thread";
        default: return "unknown";
    }
}

std::optional<Isolation> isolationFromString(const std::string& text) noexcept {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "process") return Isolation::Process;
    if (lower == "thread") return Isolation::Thread;
    return std::nullopt;
}

}
