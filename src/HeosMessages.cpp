/**
 * @file HeosMessages.cpp
 * @brief HEOS CLI message encoding and decoding
 */

#include "HeosMessages.h"
#include "LogLevel.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>

namespace {

// Attributes that identify the target of a command, in precedence order
const char* const TARGET_KEYS[] = {"pid", "gid", "sid"};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool parseOnOff(const std::string& value, bool& out) {
    if (value == "on") {
        out = true;
    } else if (value == "off") {
        out = false;
    } else {
        return false;
    }
    return true;
}

bool startsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::strlen(prefix), prefix) == 0;
}

} // namespace

// ============================================
// URL encoding
// ============================================

std::string urlEncode(const std::string& value) {
    // The CLI only requires the attribute delimiters and '%' to be escaped
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': out += "%26"; break;
            case '=': out += "%3D"; break;
            case '%': out += "%25"; break;
            default:  out += c; break;
        }
    }
    return out;
}

std::string urlDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                out += c;
                continue;
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

bool parseInt(const std::string& text, int& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    if (value < INT_MIN || value > INT_MAX) return false;
    out = static_cast<int>(value);
    return true;
}

AttributeMap parseAttributes(const std::string& message) {
    AttributeMap attributes;
    size_t start = 0;
    while (start <= message.size()) {
        size_t amp = message.find('&', start);
        std::string token = message.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!token.empty()) {
            size_t eq = token.find('=');
            if (eq == std::string::npos) {
                // Flag token ("signed_in", "command under process")
                attributes[token] = std::string();
            } else {
                attributes[token.substr(0, eq)] = urlDecode(token.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return attributes;
}

// ============================================
// HeosCommand
// ============================================

HeosCommand& HeosCommand::with(const std::string& key, const std::string& value) {
    m_attributes.emplace_back(key, value);
    return *this;
}

HeosCommand& HeosCommand::with(const std::string& key, int value) {
    m_attributes.emplace_back(key, std::to_string(value));
    return *this;
}

std::string HeosCommand::toWire() const {
    std::string wire = HEOS_SCHEME + m_name;
    for (size_t i = 0; i < m_attributes.size(); i++) {
        wire += (i == 0) ? '?' : '&';
        wire += m_attributes[i].first;
        wire += '=';
        wire += urlEncode(m_attributes[i].second);
    }
    return wire;
}

std::string HeosCommand::toLogString() const {
    std::string wire = HEOS_SCHEME + m_name;
    for (size_t i = 0; i < m_attributes.size(); i++) {
        wire += (i == 0) ? '?' : '&';
        wire += m_attributes[i].first;
        wire += '=';
        wire += (m_attributes[i].first == "pw") ? "***" : m_attributes[i].second;
    }
    return wire;
}

std::string HeosCommand::target() const {
    for (const char* key : TARGET_KEYS) {
        for (const auto& attr : m_attributes) {
            if (attr.first == key) {
                return attr.first + "=" + attr.second;
            }
        }
    }
    return std::string();
}

std::string HeosCommand::correlationKey() const {
    std::string t = target();
    return t.empty() ? m_name : m_name + "?" + t;
}

// ============================================
// HeosMessage
// ============================================

bool HeosMessage::isUnderProcess() const {
    return attributes.count(HEOS_UNDER_PROCESS) != 0;
}

bool HeosMessage::has(const std::string& key) const {
    return attributes.count(key) != 0;
}

std::string HeosMessage::get(const std::string& key, const std::string& fallback) const {
    auto it = attributes.find(key);
    return it == attributes.end() ? fallback : it->second;
}

bool HeosMessage::getInt(const std::string& key, int& out) const {
    auto it = attributes.find(key);
    if (it == attributes.end()) return false;
    return parseInt(it->second, out);
}

std::string HeosMessage::target() const {
    for (const char* key : TARGET_KEYS) {
        auto it = attributes.find(key);
        if (it != attributes.end()) {
            return it->first + "=" + it->second;
        }
    }
    return std::string();
}

std::string HeosMessage::eventName() const {
    if (!startsWith(command, HEOS_EVENT_PREFIX)) return command;
    return command.substr(std::strlen(HEOS_EVENT_PREFIX));
}

int HeosMessage::errorId() const {
    int eid = 0;
    if (!getInt("eid", eid)) return 0;
    return eid;
}

std::string HeosMessage::errorText() const {
    std::string text = get("text", "Unknown error");
    if (has("syserrno")) {
        text += " (syserrno " + get("syserrno") + ")";
    }
    return text;
}

bool parseHeosMessage(const std::string& line, HeosMessage& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errs)) {
        LOG_DEBUG("[Protocol] JSON parse failed: " << errs);
        return false;
    }
    if (!root.isObject()) return false;

    const Json::Value& heos = root["heos"];
    if (!heos.isObject() || !heos["command"].isString()) return false;

    out = HeosMessage();
    out.command = heos["command"].asString();
    out.kind = startsWith(out.command, HEOS_EVENT_PREFIX) ? MessageKind::Event : MessageKind::Response;
    if (heos["result"].isString()) {
        out.result = heos["result"].asString();
    }
    if (heos["message"].isString()) {
        out.message = heos["message"].asString();
        out.attributes = parseAttributes(out.message);
    }
    if (root.isMember("payload")) {
        out.payload = root["payload"];
    }
    if (root.isMember("options")) {
        out.options = root["options"];
    }
    return true;
}

// ============================================
// Events
// ============================================

const char* toString(EventType type) {
    switch (type) {
        case EventType::PlayerStateChanged: return "player-state-changed";
        case EventType::NowPlayingChanged:  return "now-playing-changed";
        case EventType::VolumeChanged:      return "volume-changed";
        case EventType::GroupChanged:       return "group-changed";
        case EventType::PlayerAdded:        return "player-added";
        case EventType::PlayerRemoved:      return "player-removed";
        case EventType::SourcesChanged:     return "sources-changed";
        case EventType::SystemError:        return "system-error";
        case EventType::PlayersChanged:     return "players-changed";
        case EventType::QueueChanged:       return "queue-changed";
        case EventType::UserChanged:        return "user-changed";
    }
    return "unknown";
}

HeosEvent makePlayerEvent(EventType type, int pid) {
    HeosEvent event;
    event.type = type;
    event.hasPid = true;
    event.pid = pid;
    return event;
}

bool decodeEvent(const HeosMessage& message, HeosEvent& out) {
    if (!message.isEvent()) return false;

    out = HeosEvent();
    out.name = message.eventName();
    out.hasPid = message.getInt("pid", out.pid);
    out.hasGid = message.getInt("gid", out.gid);

    const std::string& name = out.name;

    if (name == "player_state_changed") {
        out.type = EventType::PlayerStateChanged;
        out.hasState = parsePlayState(message.get("state"), out.state);
        return out.hasPid && out.hasState;
    }
    if (name == "repeat_mode_changed") {
        out.type = EventType::PlayerStateChanged;
        out.hasRepeat = parseRepeatMode(message.get("repeat"), out.repeat);
        return out.hasPid && out.hasRepeat;
    }
    if (name == "shuffle_mode_changed") {
        out.type = EventType::PlayerStateChanged;
        out.hasShuffle = parseOnOff(message.get("shuffle"), out.shuffle);
        return out.hasPid && out.hasShuffle;
    }
    if (name == "player_now_playing_changed") {
        out.type = EventType::NowPlayingChanged;
        return out.hasPid;
    }
    if (name == "player_now_playing_progress") {
        out.type = EventType::NowPlayingChanged;
        int cur = 0;
        int duration = 0;
        if (!message.getInt("cur_pos", cur)) return false;
        message.getInt("duration", duration);
        out.hasProgress = true;
        out.positionMs = cur > 0 ? static_cast<uint32_t>(cur) : 0;
        out.durationMs = duration > 0 ? static_cast<uint32_t>(duration) : 0;
        return out.hasPid;
    }
    if (name == "player_volume_changed" || name == "group_volume_changed") {
        out.type = EventType::VolumeChanged;
        out.hasLevel = message.getInt("level", out.level);
        out.hasMute = parseOnOff(message.get("mute"), out.mute);
        bool identified = (name == "player_volume_changed") ? out.hasPid : out.hasGid;
        if (name == "group_volume_changed") out.hasPid = false;
        return identified && (out.hasLevel || out.hasMute);
    }
    if (name == "groups_changed") {
        out.type = EventType::GroupChanged;
        return true;
    }
    if (name == "players_changed") {
        out.type = EventType::PlayersChanged;
        return true;
    }
    if (name == "sources_changed") {
        out.type = EventType::SourcesChanged;
        return true;
    }
    if (name == "player_playback_error") {
        out.type = EventType::SystemError;
        out.error = message.get("error", "playback error");
        return true;
    }
    if (name == "player_queue_changed") {
        out.type = EventType::QueueChanged;
        return out.hasPid;
    }
    if (name == "user_changed") {
        out.type = EventType::UserChanged;
        out.signedIn = message.has("signed_in");
        out.username = message.get("un");
        return true;
    }

    return false;
}
