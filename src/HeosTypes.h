/**
 * @file HeosTypes.h
 * @brief Data model shared by the heoslink session core
 *
 * Players, groups and music sources as reported by the HEOS system,
 * plus the error taxonomy returned by every session operation.
 */

#ifndef HEOSLINK_HEOS_TYPES_H
#define HEOSLINK_HEOS_TYPES_H

#include <string>
#include <vector>
#include <cstdint>

// ============================================
// Errors
// ============================================

enum class HeosError {
    None,
    ConnectError,       // endpoint unreachable (retried by the session)
    AuthError,          // credentials rejected (not retried)
    ProtocolError,      // malformed message or response
    Timeout,            // no response within the command timeout
    CommandError,       // device rejected the command (eid/text)
    Disconnected,       // connection lost while the command was outstanding
    InvalidGroup,       // grouping request inconsistent with the registry
    InvalidArgument,    // rejected locally, nothing sent
    RefreshError        // enumeration failed, registry kept as is
};

const char* toString(HeosError error);

// ============================================
// Player state
// ============================================

enum class PlayState { Stopped, Playing, Paused };
enum class RepeatMode { Off, All, One };

const char* toString(PlayState state);
const char* toString(RepeatMode mode);

// Wire values: "play"/"pause"/"stop", "off"/"on_all"/"on_one"
bool parsePlayState(const std::string& value, PlayState& out);
bool parseRepeatMode(const std::string& value, RepeatMode& out);
const char* wireValue(PlayState state);
const char* wireValue(RepeatMode mode);

struct NowPlaying {
    std::string type;           // "song", "station", ...
    std::string title;
    std::string artist;
    std::string album;
    std::string artworkUrl;
    std::string mediaId;
    std::string albumId;
    std::string station;
    int sourceId = 0;
    std::string sourceName;     // resolved from the music source list
    uint32_t durationMs = 0;
    uint32_t positionMs = 0;

    bool operator==(const NowPlaying& other) const;
    bool operator!=(const NowPlaying& other) const { return !(*this == other); }
};

struct Player {
    int pid = 0;
    std::string name;
    std::string model;
    std::string version;
    std::string ip;
    std::string network;
    bool online = true;
    int volume = 0;             // 0-100
    bool muted = false;
    PlayState state = PlayState::Stopped;
    RepeatMode repeat = RepeatMode::Off;
    bool shuffle = false;
    NowPlaying nowPlaying;

    bool operator==(const Player& other) const;
    bool operator!=(const Player& other) const { return !(*this == other); }
};

struct Group {
    int gid = 0;
    std::string name;
    int leaderId = 0;
    std::vector<int> memberIds;     // non-leader members, device order
    int volume = 0;
    bool muted = false;

    bool contains(int pid) const;
    std::vector<int> allPlayerIds() const;  // leader first

    bool operator==(const Group& other) const;
    bool operator!=(const Group& other) const { return !(*this == other); }
};

// Music service, favorite, input or browse result
struct SourceEntry {
    int sourceId = 0;           // sid the entry lives under
    int parentSourceId = 0;     // 0 for top-level services
    std::string containerId;
    std::string mediaId;
    std::string name;
    std::string type;
    std::string imageUrl;
    bool playable = false;
    bool browsable = false;
    bool available = true;

    bool operator==(const SourceEntry& other) const;
    bool operator!=(const SourceEntry& other) const { return !(*this == other); }
};

#endif // HEOSLINK_HEOS_TYPES_H
