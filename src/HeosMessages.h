/**
 * @file HeosMessages.h
 * @brief Message definitions for the HEOS CLI protocol
 *
 * Requests are URLs terminated by CRLF:
 *   heos://player/set_volume?pid=1&level=30
 * Responses and events are single-line JSON objects:
 *   {"heos":{"command":"player/set_volume","result":"success","message":"pid=1&level=30"}}
 *   {"heos":{"command":"event/player_volume_changed","message":"pid=1&level=30&mute=off"}}
 *
 * Every inbound line is decoded here into a HeosMessage, and events further
 * into a HeosEvent, before any session logic looks at it.
 */

#ifndef HEOSLINK_HEOS_MESSAGES_H
#define HEOSLINK_HEOS_MESSAGES_H

#include "HeosTypes.h"

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ============================================
// Protocol Constants
// ============================================

constexpr uint16_t HEOS_PORT = 1255;
constexpr char HEOS_SCHEME[] = "heos://";
constexpr char HEOS_EVENT_PREFIX[] = "event/";
constexpr char HEOS_UNDER_PROCESS[] = "command under process";
constexpr int HEOS_FAVORITES_SID = 1028;

// Command names (group/command)
namespace HeosCmd {
    constexpr char HEART_BEAT[]         = "system/heart_beat";
    constexpr char REGISTER_EVENTS[]    = "system/register_for_change_events";
    constexpr char CHECK_ACCOUNT[]      = "system/check_account";
    constexpr char SIGN_IN[]            = "system/sign_in";
    constexpr char SIGN_OUT[]           = "system/sign_out";

    constexpr char GET_PLAYERS[]        = "player/get_players";
    constexpr char GET_PLAYER_INFO[]    = "player/get_player_info";
    constexpr char GET_PLAY_STATE[]     = "player/get_play_state";
    constexpr char SET_PLAY_STATE[]     = "player/set_play_state";
    constexpr char GET_NOW_PLAYING[]    = "player/get_now_playing_media";
    constexpr char GET_VOLUME[]         = "player/get_volume";
    constexpr char SET_VOLUME[]         = "player/set_volume";
    constexpr char VOLUME_UP[]          = "player/volume_up";
    constexpr char VOLUME_DOWN[]        = "player/volume_down";
    constexpr char GET_MUTE[]           = "player/get_mute";
    constexpr char SET_MUTE[]           = "player/set_mute";
    constexpr char TOGGLE_MUTE[]        = "player/toggle_mute";
    constexpr char GET_PLAY_MODE[]      = "player/get_play_mode";
    constexpr char SET_PLAY_MODE[]      = "player/set_play_mode";
    constexpr char PLAY_NEXT[]          = "player/play_next";
    constexpr char PLAY_PREVIOUS[]      = "player/play_previous";

    constexpr char GET_GROUPS[]         = "group/get_groups";
    constexpr char SET_GROUP[]          = "group/set_group";
    constexpr char GET_GROUP_VOLUME[]   = "group/get_volume";
    constexpr char SET_GROUP_VOLUME[]   = "group/set_volume";
    constexpr char GET_GROUP_MUTE[]     = "group/get_mute";
    constexpr char SET_GROUP_MUTE[]     = "group/set_mute";

    constexpr char GET_MUSIC_SOURCES[]  = "browse/get_music_sources";
    constexpr char BROWSE[]             = "browse/browse";
    constexpr char PLAY_STREAM[]        = "browse/play_stream";
    constexpr char PLAY_PRESET[]        = "browse/play_preset";
    constexpr char PLAY_INPUT[]         = "browse/play_input";
    constexpr char ADD_TO_QUEUE[]       = "browse/add_to_queue";
}

// HEOS error ids carried as eid=<n> in failed responses
namespace HeosEid {
    constexpr int UNRECOGNIZED_COMMAND = 1;
    constexpr int INVALID_ID           = 2;
    constexpr int WRONG_ARGUMENTS      = 3;
    constexpr int DATA_NOT_AVAILABLE   = 4;
    constexpr int RESOURCE_UNAVAILABLE = 5;
    constexpr int INVALID_CREDENTIALS  = 6;
    constexpr int NOT_EXECUTED         = 7;
    constexpr int NOT_LOGGED_IN        = 8;
    constexpr int OUT_OF_RANGE         = 9;
    constexpr int USER_NOT_FOUND       = 10;
    constexpr int INTERNAL_ERROR       = 11;
    constexpr int SYSTEM_ERROR         = 12;
    constexpr int PROCESSING_PREVIOUS  = 13;
    constexpr int MEDIA_CANT_PLAY      = 14;
    constexpr int OPTION_NOT_SUPPORTED = 15;
}

using AttributeMap = std::map<std::string, std::string>;

// ============================================
// Outbound: command
// ============================================

class HeosCommand {
public:
    explicit HeosCommand(std::string name) : m_name(std::move(name)) {}

    HeosCommand& with(const std::string& key, const std::string& value);
    HeosCommand& with(const std::string& key, int value);

    const std::string& name() const { return m_name; }
    const std::vector<std::pair<std::string, std::string>>& attributes() const { return m_attributes; }

    // "heos://group/command?k=v&..." without the line terminator
    std::string toWire() const;

    // Wire form with credential values masked, for logging
    std::string toLogString() const;

    // "pid=<id>", "gid=<id>", "sid=<id>" or empty
    std::string target() const;

    // Commands sharing a key are serialized by the correlator
    std::string correlationKey() const;

private:
    std::string m_name;
    std::vector<std::pair<std::string, std::string>> m_attributes;
};

// ============================================
// Inbound: response or event
// ============================================

enum class MessageKind { Response, Event };

struct HeosMessage {
    MessageKind kind = MessageKind::Response;
    std::string command;        // "player/get_players", "event/players_changed"
    std::string result;         // "success" / "fail" (responses only)
    std::string message;        // raw message attribute string
    AttributeMap attributes;    // decoded message attributes
    Json::Value payload;
    Json::Value options;

    bool isEvent() const { return kind == MessageKind::Event; }
    bool isSuccess() const { return result == "success"; }
    bool isFailure() const { return result == "fail"; }
    bool isUnderProcess() const;

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& fallback = std::string()) const;
    bool getInt(const std::string& key, int& out) const;

    std::string target() const;
    std::string eventName() const;  // command without the "event/" prefix

    int errorId() const;            // eid, or 0
    std::string errorText() const;
};

/**
 * @brief Decode one protocol line
 * @return false if the line is not a HEOS JSON object
 */
bool parseHeosMessage(const std::string& line, HeosMessage& out);

AttributeMap parseAttributes(const std::string& message);
std::string urlEncode(const std::string& value);
std::string urlDecode(const std::string& value);
bool parseInt(const std::string& text, int& out);

// ============================================
// Events
// ============================================

enum class EventType {
    PlayerStateChanged,
    NowPlayingChanged,
    VolumeChanged,
    GroupChanged,
    PlayerAdded,
    PlayerRemoved,
    SourcesChanged,
    SystemError,
    PlayersChanged,
    QueueChanged,
    UserChanged
};

constexpr size_t EVENT_TYPE_COUNT = 11;

const char* toString(EventType type);

struct HeosEvent {
    EventType type = EventType::SystemError;
    std::string name;           // wire event name, empty for derived events

    bool hasPid = false;
    int pid = 0;
    bool hasGid = false;
    int gid = 0;

    // PlayerStateChanged
    bool hasState = false;
    PlayState state = PlayState::Stopped;
    bool hasRepeat = false;
    RepeatMode repeat = RepeatMode::Off;
    bool hasShuffle = false;
    bool shuffle = false;

    // VolumeChanged
    bool hasLevel = false;
    int level = 0;
    bool hasMute = false;
    bool mute = false;

    // NowPlayingChanged (progress variant)
    bool hasProgress = false;
    uint32_t positionMs = 0;
    uint32_t durationMs = 0;

    // SystemError
    std::string error;

    // UserChanged
    bool signedIn = false;
    std::string username;
};

/**
 * @brief Decode an event message into the closed event set
 * @return false for unknown event names or missing identity attributes
 */
bool decodeEvent(const HeosMessage& message, HeosEvent& out);

HeosEvent makePlayerEvent(EventType type, int pid);

#endif // HEOSLINK_HEOS_MESSAGES_H
