//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide diagnostic logger with std::format messages and environment configuration.
//==========================================================================================================
#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include "env/EnvVars.h"

class Logger {
public:
    // Severity level scoped to Logger
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to INFO.
    static Level levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return Level::DEBUG;
        if (s == "INFO")  return Level::INFO;
        if (s == "WARN" || s == "WARNING")  return Level::WARN;
        if (s == "ERROR") return Level::ERROR;
        if (s == "FATAL") return Level::FATAL;
        return Level::INFO;
    }

    static bool isEnabled(Level level) {
        return static_cast<int>(level) >= static_cast<int>(sLogLevel.load());
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

    // Configure logging
    static void setLogLevel(Level level) {
        sLogLevel.store(level);
    }

    static Level getLogLevel() {
        return sLogLevel.load();
    }

    //==========================================================================================================
    // Applies MCPENGINE_LOG_LEVEL, MCPENGINE_LOG_FILE and MCPENGINE_LOG_STDERR.
    // Args:
    //   (none)
    // Returns:
    //   (none)
    //==========================================================================================================
    static void configureFromEnvironment() {
        const std::string lvl = GetEnvOrDefault("MCPENGINE_LOG_LEVEL", "");
        if (!lvl.empty()) {
            setLogLevel(levelFromString(lvl));
        }
        const std::string file = GetEnvOrDefault("MCPENGINE_LOG_FILE", "");
        if (!file.empty()) {
            setLogFile(file);
        }
        sUseStderr.store(GetEnvBool("MCPENGINE_LOG_STDERR", sUseStderr.load()));
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        auto now = std::chrono::system_clock::now();
        std::time_t now_time = std::chrono::system_clock::to_time_t(now);
        std::tm buf{};
        ::localtime_r(&now_time, &buf);
        sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
        sLogFile.flush();
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostringstream oss;
        // Optional ANSI colorization for LABEL only controlled by MCPENGINE_LOG_COLOR
        static bool colorEnabled = GetEnvBool("MCPENGINE_LOG_COLOR", true);
        const char* reset = colorEnabled ? "\033[0m" : "";
        const char* labelColor = "";
        if (colorEnabled) {
            const bool severe = (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0);
            labelColor = severe ? "\033[38;5;88m" : (::strncmp(level, "WARN", 4) == 0 ? "\033[33m" : "\033[35m");
        }
        oss << "[" << labelColor << level << reset << "] " << baseName(file) << ":" << line << ": " << msg << '\n';

        const std::string logMessage = oss.str();
        if (sUseStderr.load()) {
            std::cerr << logMessage;
        } else {
            std::cout << logMessage;
        }
        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static std::atomic<Level> sLogLevel;

private:
    static const char* baseName(const char* path) {
        const char* slash = ::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

    static std::atomic<bool> sUseStderr;
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Static members declared but not defined here
// Definitions are in Logger.cpp

#define LOG_DEBUG(fmt, ...) if (Logger::isEnabled(Logger::Level::DEBUG)) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::isEnabled(Logger::Level::INFO))  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::isEnabled(Logger::Level::WARN))  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::isEnabled(Logger::Level::ERROR)) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
