/**
 * @file Config.h
 * @brief Configuration for heoslink
 */

#ifndef HEOSLINK_CONFIG_H
#define HEOSLINK_CONFIG_H

#include <string>
#include <cstddef>
#include <cstdint>
#include <vector>

struct Config {
    // HEOS connection
    std::string host;                   // empty = SSDP discovery (CLI only)
    uint16_t port = 1255;               // HEOS CLI TCP port
    std::string username;               // empty = stay signed out
    std::string password;
    unsigned int connectTimeoutMs = 5000;

    // Commands
    unsigned int commandTimeoutMs = 10000;
    unsigned int groupGracePeriodMs = 3000;   // wait for groups_changed before refetching

    // Session supervision
    unsigned int heartbeatIntervalS = 30;
    unsigned int heartbeatFailureLimit = 2;   // consecutive misses before reconnect
    unsigned int initialBackoffS = 1;
    unsigned int maxBackoffS = 30;
    unsigned int refreshRetryS = 5;

    // Buffers
    size_t maxMessageBytes = 1024 * 1024;     // framing guard
    size_t subscriberQueueCapacity = 256;

    // Discovery
    int discoveryTimeoutS = 3;
    int discoveryRetries = 3;

    // Logging
    bool verbose = false;
    bool quiet = false;

    // Actions
    bool listOnly = false;
    bool showVersion = false;
    std::string action;                 // "volume", "play", "pause", "stop", "group", "ungroup"
    int actionTarget = 0;               // pid, leader pid or gid
    int actionLevel = 0;
    std::vector<int> actionMembers;
};

#endif // HEOSLINK_CONFIG_H
