//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks, level parsing and environment configuration.
//==========================================================================================================

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

bool envFlag(const char* name, const char* def) {
    const std::string v = GetEnvOrDefault(name, def);
    return v == "1" || v == "true" || v == "TRUE";
}

std::tm localTime(std::time_t t) {
    std::tm buf{};
#ifdef _WIN32
    ::localtime_s(&buf, &t);
#else
    ::localtime_r(&t, &buf);
#endif
    return buf;
}

void writeClock(std::ostream& os) {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));
    os << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
}

const char* labelColor(const char* level) {
    if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m"; // burgundy
    }
    if (::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m";
    }
    return "\033[35m";
}

} // namespace

void Logger::setLogLevelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "INFO") {
        sLogLevel = LogLevel::LOG_INFO_LEVEL;
    } else if (s == "WARN" || s == "WARNING") {
        sLogLevel = LogLevel::LOG_WARN_LEVEL;
    } else if (s == "ERROR") {
        sLogLevel = LogLevel::LOG_ERROR_LEVEL;
    } else if (s == "FATAL") {
        sLogLevel = LogLevel::LOG_FATAL_LEVEL;
    } else {
        sLogLevel = LogLevel::LOG_DEBUG_LEVEL;
    }
}

void Logger::configureFromEnvironment() {
    setLogLevelFromString(GetEnvOrDefault("MCPGW_LOG_LEVEL", "INFO"));
    const std::string file = GetEnvOrDefault("MCPGW_LOG_FILE", "");
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
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    sLogFile << "\n=== Log opened at " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    static const bool colorEnabled = envFlag("MCPGW_LOG_COLOR", "1");
    static const bool useStderr = envFlag("MCPGW_LOG_STDERR", "0");

    std::ostringstream plain;
    writeClock(plain);
    const std::string clock = plain.str();
    plain << " [" << level << "] " << file << ":" << line << ": " << msg << '\n';

    std::lock_guard<std::mutex> lock(sLogMutex);
    if (colorEnabled) {
        std::ostringstream oss;
        oss << clock << " [" << labelColor(level) << level << "\033[0m] " << file << ":" << line << ": " << msg << '\n';
        (useStderr ? std::cerr : std::cout) << oss.str() << std::flush;
    } else {
        (useStderr ? std::cerr : std::cout) << plain.str() << std::flush;
    }
    // File sink never carries colour codes
    if (sLogFile.is_open()) {
        sLogFile << plain.str();
        sLogFile.flush();
    }
}
