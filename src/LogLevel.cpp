/**
 * @file LogLevel.cpp
 * @brief Global log level state
 */

#include "LogLevel.h"

LogLevel g_logLevel = LogLevel::INFO;
std::mutex g_logMutex;
