/**
 * @file HeosTypes.cpp
 * @brief String conversions and comparisons for the data model
 */

#include "HeosTypes.h"

#include <algorithm>

const char* toString(HeosError error) {
    switch (error) {
        case HeosError::None:            return "ok";
        case HeosError::ConnectError:    return "connect error";
        case HeosError::AuthError:       return "authentication error";
        case HeosError::ProtocolError:   return "protocol error";
        case HeosError::Timeout:         return "timeout";
        case HeosError::CommandError:    return "command error";
        case HeosError::Disconnected:    return "disconnected";
        case HeosError::InvalidGroup:    return "invalid group";
        case HeosError::InvalidArgument: return "invalid argument";
        case HeosError::RefreshError:    return "refresh error";
    }
    return "unknown";
}

const char* toString(PlayState state) {
    switch (state) {
        case PlayState::Playing: return "playing";
        case PlayState::Paused:  return "paused";
        case PlayState::Stopped: return "stopped";
    }
    return "stopped";
}

const char* toString(RepeatMode mode) {
    switch (mode) {
        case RepeatMode::Off: return "off";
        case RepeatMode::All: return "all";
        case RepeatMode::One: return "one";
    }
    return "off";
}

bool parsePlayState(const std::string& value, PlayState& out) {
    if (value == "play") {
        out = PlayState::Playing;
    } else if (value == "pause") {
        out = PlayState::Paused;
    } else if (value == "stop") {
        out = PlayState::Stopped;
    } else {
        return false;
    }
    return true;
}

bool parseRepeatMode(const std::string& value, RepeatMode& out) {
    if (value == "off") {
        out = RepeatMode::Off;
    } else if (value == "on_all") {
        out = RepeatMode::All;
    } else if (value == "on_one") {
        out = RepeatMode::One;
    } else {
        return false;
    }
    return true;
}

const char* wireValue(PlayState state) {
    switch (state) {
        case PlayState::Playing: return "play";
        case PlayState::Paused:  return "pause";
        case PlayState::Stopped: return "stop";
    }
    return "stop";
}

const char* wireValue(RepeatMode mode) {
    switch (mode) {
        case RepeatMode::Off: return "off";
        case RepeatMode::All: return "on_all";
        case RepeatMode::One: return "on_one";
    }
    return "off";
}

// ============================================
// Comparisons
// ============================================

bool NowPlaying::operator==(const NowPlaying& other) const {
    return type == other.type && title == other.title && artist == other.artist
        && album == other.album && artworkUrl == other.artworkUrl
        && mediaId == other.mediaId && albumId == other.albumId
        && station == other.station && sourceId == other.sourceId
        && sourceName == other.sourceName && durationMs == other.durationMs
        && positionMs == other.positionMs;
}

bool Player::operator==(const Player& other) const {
    return pid == other.pid && name == other.name && model == other.model
        && version == other.version && ip == other.ip && network == other.network
        && online == other.online && volume == other.volume && muted == other.muted
        && state == other.state && repeat == other.repeat && shuffle == other.shuffle
        && nowPlaying == other.nowPlaying;
}

bool Group::contains(int pid) const {
    return leaderId == pid
        || std::find(memberIds.begin(), memberIds.end(), pid) != memberIds.end();
}

std::vector<int> Group::allPlayerIds() const {
    std::vector<int> ids;
    ids.reserve(memberIds.size() + 1);
    ids.push_back(leaderId);
    ids.insert(ids.end(), memberIds.begin(), memberIds.end());
    return ids;
}

bool Group::operator==(const Group& other) const {
    return gid == other.gid && name == other.name && leaderId == other.leaderId
        && memberIds == other.memberIds && volume == other.volume
        && muted == other.muted;
}

bool SourceEntry::operator==(const SourceEntry& other) const {
    return sourceId == other.sourceId && parentSourceId == other.parentSourceId
        && containerId == other.containerId && mediaId == other.mediaId
        && name == other.name && type == other.type && imageUrl == other.imageUrl
        && playable == other.playable && browsable == other.browsable
        && available == other.available;
}
