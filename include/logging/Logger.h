//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, std::format messages and optional file sink.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>

namespace ssehost {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Fatal
};

const char* toString(LogLevel level);

//==========================================================================================================
// Logger
// Purpose: Writes one line per record: "<UTC time> [LEVEL] file:line: message".
// Notes:
//   Records go to stdout (stderr with SSEHOST_LOG_STDERR=1) and, when a log file is set, are mirrored
//   there. Output is serialized by an internal mutex, so any thread may log.
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; "WARNING" is accepted for WARN. Unknown strings map to Info.
    static LogLevel levelFromString(std::string_view level);

    static void setLevel(LogLevel level) { threshold.store(level, std::memory_order_relaxed); }
    static LogLevel level() { return threshold.load(std::memory_order_relaxed); }
    static bool enabled(LogLevel level) { return level >= Logger::level(); }

    //==========================================================================================================
    // configureFromEnvironment
    // Purpose: Applies SSEHOST_LOG_LEVEL (default INFO), SSEHOST_LOG_FILE, SSEHOST_LOG_COLOR (default on)
    //          and SSEHOST_LOG_STDERR (default off).
    //==========================================================================================================
    static void configureFromEnvironment();

    // Opens (append mode) a file that mirrors every record. Returns false when it cannot be opened.
    static bool setLogFile(const std::string& path);
    static void setColor(bool on);
    static void setUseStderr(bool on);

    template <typename... Args>
    static void logf(LogLevel level, std::string_view fmt, const char* file, unsigned int line, Args&&... args) {
        std::string text;
        try {
            text = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            text = std::string("<bad log format \"") + std::string(fmt) + "\": " + e.what() + ">";
        }
        write(level, text, file, line);
    }

    static void write(LogLevel level, const std::string& message, const char* file, unsigned int line);

private:
    static std::atomic<LogLevel> threshold;
};

} // namespace ssehost

#define SSEHOST_LOG_AT(lvl, fmt, ...)                                                                  \
    do {                                                                                               \
        if (::ssehost::Logger::enabled(lvl)) {                                                         \
            ::ssehost::Logger::logf(lvl, fmt, __FILE__, __LINE__, ##__VA_ARGS__);                      \
        }                                                                                              \
    } while (0)

#define LOG_DEBUG(fmt, ...) SSEHOST_LOG_AT(::ssehost::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  SSEHOST_LOG_AT(::ssehost::LogLevel::Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  SSEHOST_LOG_AT(::ssehost::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) SSEHOST_LOG_AT(::ssehost::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...)                                                                            \
    do {                                                                                               \
        ::ssehost::Logger::logf(::ssehost::LogLevel::Fatal, fmt, __FILE__, __LINE__, ##__VA_ARGS__);   \
        ::_Exit(EXIT_FAILURE);                                                                         \
    } while (0)
