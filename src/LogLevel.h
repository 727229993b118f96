/**
 * @file LogLevel.h
 * @brief Centralized log level system for heoslink
 *
 * Provides 4 log levels (ERROR, WARN, INFO, DEBUG) with runtime filtering
 * via g_logLevel. The session runs several threads (supervisor, reader,
 * subscriber workers), so each line is written under g_logMutex.
 *
 * Usage:
 *   LOG_ERROR("something failed: " << reason);
 *   LOG_WARN("heartbeat missed: " << failures);
 *   LOG_INFO("Session ready");
 *   LOG_DEBUG("[Component] detailed message");
 */

#ifndef HEOSLINK_LOGLEVEL_H
#define HEOSLINK_LOGLEVEL_H

#include <iostream>
#include <mutex>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

extern LogLevel g_logLevel;
extern std::mutex g_logMutex;

#define LOG_ERROR(x) do { \
    if (g_logLevel >= LogLevel::ERROR) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cerr << "[ERROR] " << x << std::endl; \
    } \
} while(0)
#define LOG_WARN(x) do { \
    if (g_logLevel >= LogLevel::WARN) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << "[WARN] " << x << std::endl; \
    } \
} while(0)
#define LOG_INFO(x) do { \
    if (g_logLevel >= LogLevel::INFO) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << x << std::endl; \
    } \
} while(0)
#define LOG_DEBUG(x) do { \
    if (g_logLevel >= LogLevel::DEBUG) { \
        std::lock_guard<std::mutex> logLock_(g_logMutex); \
        std::cout << x << std::endl; \
    } \
} while(0)

#endif // HEOSLINK_LOGLEVEL_H
