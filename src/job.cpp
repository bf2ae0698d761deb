/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/job.hpp"
#include <algorithm>
#include <cstdlib>
#include <cxxabi.h>
#include <typeinfo>

namespace qmgr {

namespace {
std::string demangle(const char* mangled) {
    int status = 0;
    char* readable = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || !readable) {
        return mangled;
    }
    std::string name(readable);
    std::free(readable);
    return name;
}
}

Job::Job(JobId id, nlohmann::json params)
    : id_(std::move(id)), params_(std::move(params)) {
}

OpResult JobTypes::add(const std::string& name, JobFactory factory) {
    if (name.empty()) {
        return OpResult::failure(ErrorCode::InvalidArgument, "Job type name must be non-empty");
    }
    if (!factory) {
        return OpResult::failure(ErrorCode::InvalidArgument, "Job type '" + name + "' has no factory");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = factories_.emplace(name, std::move(factory));
    if (!inserted) {
        return OpResult::failure(ErrorCode::InvalidArgument, "Job type '" + name + "' already registered");
    }
    return OpResult::success();
}

bool JobTypes::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(name) > 0;
}

std::vector<std::string> JobTypes::names() const {
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(factories_.size());
        for (const auto& entry : factories_) {
            out.push_back(entry.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<Job> JobTypes::create(const std::string& name, const JobId& id,
                                      const nlohmann::json& params) const {
    JobFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            throw std::invalid_argument("Unknown job type '" + name + "'");
        }
        factory = it->second;
    }

    auto job = factory(id, params);
    if (!job) {
        throw std::runtime_error("Factory for job type '" + name + "' returned no job");
    }
    return job;
}

JobError describeFault(std::exception_ptr fault) noexcept {
    try {
        if (fault) {
            std::rethrow_exception(fault);
        }
        return {"UnknownException", "no exception recorded"};
    } catch (const std::exception& e) {
        try {
            return {demangle(typeid(e).name()), e.what()};
        } catch (const std::bad_alloc&) {
            return {"std::bad_alloc", "out of memory describing fault"};
        }
    } catch (...) {
        // Job code may throw any type; it is still recorded as a fault.
        return {"UnknownException", "non-standard exception thrown"};
    }
}

}
