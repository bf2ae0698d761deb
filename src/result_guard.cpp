/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "qmgr/result_guard.hpp"
#include "qmgr/codec.hpp"
#include "qmgr/logger.hpp"
#include <cmath>
#include <vector>

namespace qmgr {

namespace {
// Depth-first search for a NaN or infinity, which JSON cannot represent
// (the serializer would silently write null).
bool findNonFinite(const nlohmann::json& value, std::string& where) {
    std::vector<std::pair<const nlohmann::json*, std::string>> stack;
    stack.emplace_back(&value, "");
    while (!stack.empty()) {
        auto [node, path] = stack.back();
        stack.pop_back();
        if (node->is_number_float()) {
            if (!std::isfinite(node->get<double>())) {
                where = path.empty() ? "/" : path;
                return true;
            }
        } else if (node->is_object()) {
            for (auto it = node->begin(); it != node->end(); ++it) {
                stack.emplace_back(&it.value(), path + "/" + it.key());
            }
        } else if (node->is_array()) {
            for (std::size_t i = 0; i < node->size(); ++i) {
                stack.emplace_back(&(*node)[i], path + "/" + std::to_string(i));
            }
        }
    }
    return false;
}

GuardResult reject(Rejection kind, std::string reason) {
    GuardResult r;
    r.rejection = kind;
    r.reason = std::move(reason);
    return r;
}
}

JobError GuardResult::toError() const {
    return {"ResultRejected", std::string(rejectionToString(rejection)) + ": " + reason};
}

ResultGuard::ResultGuard(std::uint64_t warnBytes, std::uint64_t maxBytes) noexcept
    : warnBytes_(warnBytes), maxBytes_(maxBytes) {
}

GuardResult ResultGuard::check(const nlohmann::json& value) const noexcept {
    GuardResult r = checkSerializable(value);
    if (r && r.sizeBytes > maxBytes_) {
        try {
            return oversized(r.sizeBytes);
        } catch (const std::bad_alloc&) {
            return reject(Rejection::Oversized, std::string());
        }
    }
    return r;
}

GuardResult ResultGuard::validate(const nlohmann::json& value) const noexcept {
    GuardResult r = check(value);
    if (r) {
        try {
            noteAccepted(r.sizeBytes);
        } catch (const std::exception&) {
            // logging failure does not change the verdict
        }
    }
    return r;
}

void ResultGuard::noteAccepted(std::uint64_t sizeBytes) const {
    if (sizeBytes > warnBytes_) {
        LOG_WARN("Large result: " + std::to_string(sizeBytes) + " bytes exceeds warning threshold of " +
                 std::to_string(warnBytes_) + " bytes");
    }
}

GuardResult ResultGuard::oversized(std::uint64_t observedBytes) const {
    GuardResult r = reject(Rejection::Oversized,
        "result is " + std::to_string(observedBytes) + " bytes, limit is " +
        std::to_string(maxBytes_) + " bytes");
    r.sizeBytes = observedBytes;
    return r;
}

GuardResult checkSerializable(const nlohmann::json& value) noexcept {
    try {
        std::string where;
        if (findNonFinite(value, where)) {
            return reject(Rejection::NonSerializable, "non-finite number at " + where);
        }

        auto size = encodedSize(value);
        if (!size) {
            return reject(Rejection::NonSerializable, "contains invalid UTF-8 text");
        }
        GuardResult r;
        r.ok = true;
        r.sizeBytes = *size;
        return r;
    } catch (const std::bad_alloc&) {
        return reject(Rejection::Oversized, "too large to serialize in memory");
    }
}

const char* rejectionToString(Rejection rejection) noexcept {
    switch (rejection) {
        case Rejection::None: return "none";
        case Rejection::NonSerializable: return "non-serializable";
        case Rejection::Oversized: return "oversized";
        default: return "unknown";
    }
}

}
