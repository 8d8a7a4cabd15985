//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, level parsing and environment configuration.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <iostream>

#include "env/EnvVars.h"

// INFO unless MCPHOST_LOG_LEVEL says otherwise (applied by Logger::configureFromEnv)
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

bool envFlag(const char* name, const char* def) {
    const std::string v = GetEnvOrDefault(name, def);
    return v == "1" || v == "true" || v == "TRUE";
}

const char* labelColor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m";
    }
    if (::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m";
}

// Local wall-clock time with milliseconds: HH:MM:SS.mmm
std::string clockStamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);
    return fmt::format("{:02}:{:02}:{:02}.{:03}", tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
}

// Source file name without its directory
const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash != nullptr ? slash + 1 : path;
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

void Logger::configureFromEnv() {
    const std::string lvl = GetEnvOrDefault("MCPHOST_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(levelFromString(lvl));
    }
    const std::string file = GetEnvOrDefault("MCPHOST_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    sLogFile << "\n=== mcphost log opened at " << clockStamp() << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Read once; changing these mid-run has no effect
    static const bool colorEnabled = envFlag("MCPHOST_LOG_COLOR", "1");
    static const bool useStderr = envFlag("MCPHOST_STDIO_MODE", "0");

    const std::string tail = fmt::format("{} {}:{}: {}\n", clockStamp(), baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& out = useStderr ? std::cerr : std::cout;
    if (colorEnabled) {
        out << "[" << labelColor(level) << level << "\033[0m] " << tail;
    } else {
        out << "[" << level << "] " << tail;
    }
    out.flush();

    if (sLogFile.is_open()) {
        sLogFile << "[" << level << "] " << tail;
        sLogFile.flush();
    }
}
