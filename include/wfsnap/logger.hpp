/*
 * wfsnap - Workflow Snapshot Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace wfsnap {

enum class LogLevel : std::uint8_t {
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

    [[nodiscard]] static LogLevel parseLevel(const std::string& text, LogLevel fallback) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context ("Main", "Worker-0", ...)
void setThreadName(const std::string& name);
std::string workerThreadName(int workerId);

}

#define LOG_ERROR(msg) ::wfsnap::Logger::error(msg)
#define LOG_WARN(msg)  ::wfsnap::Logger::warn(msg)
#define LOG_INFO(msg)  ::wfsnap::Logger::info(msg)
#define LOG_DEBUG(msg) ::wfsnap::Logger::debug(msg)
#define LOG_TRACE(msg) ::wfsnap::Logger::trace(msg)
