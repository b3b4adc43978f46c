//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging with std::format message formatting and level filtering.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <errno.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <format>
#include <cstdlib>
#include <cctype>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to fallback.
    static LogLevel levelFromString(const std::string& lvl, LogLevel fallback = LogLevel::LOG_INFO_LEVEL) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
        if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
        return fallback;
    }

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    // Initial level: MCPSESSION_LOG_LEVEL when set, INFO otherwise.
    static LogLevel initialLogLevel() {
        return levelFromString(GetEnvOrDefault("MCPSESSION_LOG_LEVEL", "INFO"));
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        } else {
            auto now = std::chrono::system_clock::now();
            std::time_t now_time = std::chrono::system_clock::to_time_t(now);
            std::tm buf{};
            ::localtime_r(&now_time, &buf);
            sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
            sLogFile.flush();
        }
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostringstream oss;
        // Optional ANSI colorization for LABEL only controlled by MCPSESSION_LOG_COLOR
        static bool colorEnabled = [](){
            const std::string v = GetEnvOrDefault("MCPSESSION_LOG_COLOR", "1");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        const char* reset = colorEnabled ? "\033[0m" : "";
        const char* labelColor = "";
        if (colorEnabled) {
            if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
                labelColor = "\033[38;5;88m"; // burgundy
            } else if (::strncmp(level, "WARN", 4) == 0) {
                labelColor = "\033[33m";
            } else {
                labelColor = "\033[35m"; // purple
            }
        }
        if (*labelColor) {
            oss << "[" << labelColor << level << reset << "] " << file << ":" << line << ": " << msg << std::endl;
        } else {
            oss << "[" << level << "] " << file << ":" << line << ": " << msg << std::endl;
        }

        std::string logMessage = oss.str();

        // Console goes to stderr unless MCPSESSION_LOG_STDOUT=1; stdout belongs to the host application
        static bool useStdout = [](){
            const std::string v = GetEnvOrDefault("MCPSESSION_LOG_STDOUT", "0");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        if (useStdout) {
            std::cout << logMessage;
        } else {
            std::cerr << logMessage;
        }

        static bool fileFromEnv = [](){
            const std::string path = GetEnvOrDefault("MCPSESSION_LOG_FILE", "");
            if (!path.empty()) {
                sLogFile.open(path, std::ios::out | std::ios::app);
            }
            return sLogFile.is_open();
        }();
        (void)fileFromEnv;

        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Static members declared but not defined here
// Definitions are in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard to avoid manual pairs and ensure correct function on exit
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif
