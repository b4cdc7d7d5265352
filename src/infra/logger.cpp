/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats each entry as `[YYYY-MM-DD HH:MM:SS] [TAG] message`, colour-codes the
 * severity tag when colour output is enabled, and drops entries below the
 * configured threshold.
 */

#include "lyra/infra/logger.hpp"

#include "lyra/infra/string.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace lyra::infra {

std::mutex Logger::mutex_;
LogLevel Logger::threshold_ = LogLevel::INFO;
bool Logger::color_ = true;

namespace {

const char* tag_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "[TRCE] ";
    case LogLevel::DEBUG:
        return "[DBUG] ";
    case LogLevel::INFO:
        return "[INFO] ";
    case LogLevel::WARN:
        return "[WARN] ";
    case LogLevel::ERROR:
        return "[FAIL] ";
    case LogLevel::FATAL:
        return "[CRIT] ";
    }
    return "[????] ";
}

const char* color_for(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "\033[90m";
    case LogLevel::DEBUG:
        return "\033[36m";
    case LogLevel::INFO:
        return "\033[32m";
    case LogLevel::WARN:
        return "\033[33m";
    case LogLevel::ERROR:
        return "\033[31m";
    case LogLevel::FATAL:
        return "\033[1;31m";
    }
    return "";
}

} // namespace

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Entries below the threshold return before any locking.
 * 2. **Synchronization**: A `lock_guard` prevents interleaved output.
 * 3. **Stream Segregation**: WARN and above bypass stdout buffering.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    if (color_) {
        stream << color_for(level) << tag_for(level) << message << "\033[0m" << std::endl;
    } else {
        stream << tag_for(level) << message << std::endl;
    }
}

void Logger::set_threshold(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::threshold()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void Logger::set_color(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    color_ = enabled;
}

bool Logger::parse_level(const std::string& name, LogLevel& out)
{
    std::string n = String::to_lower(String::trim(name));
    if (n == "trace") {
        out = LogLevel::TRACE;
    } else if (n == "debug") {
        out = LogLevel::DEBUG;
    } else if (n == "info") {
        out = LogLevel::INFO;
    } else if (n == "warn" || n == "warning") {
        out = LogLevel::WARN;
    } else if (n == "error") {
        out = LogLevel::ERROR;
    } else if (n == "fatal") {
        out = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

void Logger::init_from_env()
{
    const char* env = std::getenv("LYRA_LOG_LEVEL");
    if (env == nullptr) {
        return;
    }
    LogLevel level;
    if (parse_level(env, level)) {
        set_threshold(level);
    } else {
        log(LogLevel::WARN, std::string("Config: Ignoring unknown LYRA_LOG_LEVEL '") + env + "'");
    }
}

} // namespace lyra::infra
