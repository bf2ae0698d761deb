/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

#include "qmgr/types.hpp"

namespace qmgr {

enum class Rejection : uint8_t {
    None = 0,
    NonSerializable,
    Oversized
};

struct GuardResult {
    bool ok = false;
    std::uint64_t sizeBytes = 0;
    Rejection rejection = Rejection::None;
    std::string reason;
    explicit operator bool() const noexcept { return ok; }

    // FAILED payload for a rejected result.
    [[nodiscard]] JobError toError() const;
};

// Gate between a produced result and the registry: a result is committed
// whole or not at all.
class ResultGuard {
public:
    static constexpr std::uint64_t kDefaultWarnBytes = 10ULL * 1024 * 1024;
    static constexpr std::uint64_t kDefaultMaxBytes = 50ULL * 1024 * 1024;

    ResultGuard() noexcept = default;
    ResultGuard(std::uint64_t warnBytes, std::uint64_t maxBytes) noexcept;

    // Same decision as validate() without logging; safe in a forked child.
    [[nodiscard]] GuardResult check(const nlohmann::json& value) const noexcept;
    [[nodiscard]] GuardResult validate(const nlohmann::json& value) const noexcept;

    // Emits the large-result warning for an accepted result of the given size.
    void noteAccepted(std::uint64_t sizeBytes) const;

    // Used when the payload was cut off while streaming and only its size is known.
    [[nodiscard]] GuardResult oversized(std::uint64_t observedBytes) const;

    [[nodiscard]] std::uint64_t warnBytes() const noexcept { return warnBytes_; }
    [[nodiscard]] std::uint64_t maxBytes() const noexcept { return maxBytes_; }

private:
    std::uint64_t warnBytes_ = kDefaultWarnBytes;
    std::uint64_t maxBytes_ = kDefaultMaxBytes;
};

// Whether a value survives a write and read back unchanged: no NaN or
// infinity, valid UTF-8 throughout. No size limit applies.
[[nodiscard]] GuardResult checkSerializable(const nlohmann::json& value) noexcept;

[[nodiscard]] const char* rejectionToString(Rejection rejection) noexcept;

}
