//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, record formatting and environment configuration
//==========================================================================================================

#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace ssehost {

std::atomic<LogLevel> Logger::threshold{LogLevel::Info};

namespace {

struct Sinks {
    std::mutex mutex;
    std::ofstream file;
    bool color{true};
    bool useStderr{false};
};

Sinks& sinks() {
    static Sinks s;
    return s;
}

const char* labelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
        case LogLevel::Fatal: return "\033[38;5;88m";
        case LogLevel::Warn: return "\033[33m";
        default: return "\033[35m";
    }
}

// "src/ssehost/Session.cpp" -> "Session.cpp"
const char* baseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::format("{}.{:03}Z", buf, millis);
}

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "INFO";
}

LogLevel Logger::levelFromString(std::string_view level) {
    std::string s;
    s.reserve(level.size());
    for (char c : level) {
        s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::Debug;
    if (s == "WARN" || s == "WARNING") return LogLevel::Warn;
    if (s == "ERROR") return LogLevel::Error;
    if (s == "FATAL") return LogLevel::Fatal;
    return LogLevel::Info;
}

void Logger::configureFromEnvironment() {
    setLevel(levelFromString(GetEnvOrDefault("SSEHOST_LOG_LEVEL", "INFO")));
    setColor(GetEnvFlag("SSEHOST_LOG_COLOR", true));
    setUseStderr(GetEnvFlag("SSEHOST_LOG_STDERR", false));
    const std::string file = GetEnvOrDefault("SSEHOST_LOG_FILE", "");
    if (!file.empty() && !setLogFile(file)) {
        LOG_ERROR("Failed to open log file: {}", file);
    }
}

bool Logger::setLogFile(const std::string& path) {
    Sinks& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) {
        s.file.close();
    }
    s.file.open(path, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        return false;
    }
    s.file << "\n=== Log opened at " << utcTimestamp() << " ===\n";
    s.file.flush();
    return true;
}

void Logger::setColor(bool on) {
    Sinks& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.color = on;
}

void Logger::setUseStderr(bool on) {
    Sinks& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.useStderr = on;
}

void Logger::write(LogLevel level, const std::string& message, const char* file, unsigned int line) {
    const std::string stamp = utcTimestamp();
    const char* label = toString(level);
    Sinks& s = sinks();
    std::lock_guard<std::mutex> lock(s.mutex);

    const std::string plain = std::format("{} [{}] {}:{}: {}\n", stamp, label, baseName(file), line, message);
    std::ostream& out = s.useStderr ? std::cerr : std::cout;
    if (s.color) {
        out << std::format("{} [{}{}\033[0m] {}:{}: {}\n", stamp, labelColor(level), label, baseName(file), line, message);
    } else {
        out << plain;
    }
    out.flush();
    if (s.file.is_open()) {
        s.file << plain;
        s.file.flush();
    }
}

} // namespace ssehost
