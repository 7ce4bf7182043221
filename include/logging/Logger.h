//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional file sink and std::format-style macros.
//==========================================================================================================
#pragma once

#include <mutex>
#include <fstream>
#include <string>
#include <format>
#include <cstdlib>
#include "env/EnvVars.h"

enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
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

    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    //==========================================================================================================
    // setLogLevelFromString
    // Purpose: Applies a textual level (DEBUG|INFO|WARN|ERROR|FATAL, case-insensitive) as the active filter.
    // Args:
    //   lvl: Level name; unknown names select DEBUG.
    //==========================================================================================================
    static void setLogLevelFromString(const std::string& lvl);

    //==========================================================================================================
    // configureFromEnvironment
    // Purpose: Applies MCPGW_LOG_LEVEL (default INFO) and, when set, opens MCPGW_LOG_FILE as an extra sink.
    //==========================================================================================================
    static void configureFromEnvironment();

    // Appends to filePath; a failure to open is reported on stderr and the console sink stays active.
    static void setLogFile(const std::string& filePath);

    // Line format: "<HH:MM:SS.mmm> [LEVEL] file:line: msg". Console goes to stdout unless MCPGW_LOG_STDERR=1.
    static void log(const char* level, const std::string& msg, const char* file, unsigned int line);

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Entry/exit tracing, compiled in for _DEBUG builds only
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
