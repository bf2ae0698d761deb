/*
 * qmgr - Local Job Queue Manager
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace qmgr {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Accepts error|warn|warning|info|debug|trace, case-insensitive.
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::qmgr::Logger::error(msg)
#define LOG_WARN(msg)  ::qmgr::Logger::warn(msg)
#define LOG_INFO(msg)  ::qmgr::Logger::info(msg)
#define LOG_DEBUG(msg) ::qmgr::Logger::debug(msg)
#define LOG_TRACE(msg) ::qmgr::Logger::trace(msg)
