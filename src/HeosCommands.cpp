/**
 * @file HeosCommands.cpp
 * @brief Typed HEOS command implementation
 */

#include "HeosCommands.h"
#include "LogLevel.h"

#include <json/json.h>

#include <set>

namespace {

bool jsonInt(const Json::Value& value, int& out) {
    if (value.isInt()) {
        out = value.asInt();
        return true;
    }
    if (value.isString()) {
        return parseInt(value.asString(), out);
    }
    return false;
}

std::string jsonText(const Json::Value& value) {
    if (value.isString()) return value.asString();
    if (value.isIntegral()) return std::to_string(value.asLargestInt());
    return std::string();
}

// "yes"/"true" or a JSON boolean
bool jsonFlag(const Json::Value& value, bool fallback) {
    if (value.isBool()) return value.asBool();
    if (!value.isString()) return fallback;
    const std::string text = value.asString();
    return text == "yes" || text == "true";
}

bool parseOnOff(const std::string& value, bool& out) {
    if (value == "on") {
        out = true;
        return true;
    }
    if (value == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string joinIds(const std::vector<int>& ids) {
    std::string text;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) text += ',';
        text += std::to_string(ids[i]);
    }
    return text;
}

CommandResult invalidArgument(const std::string& text) {
    LOG_WARN("[Commands] " << text);
    return CommandResult::failure(HeosError::InvalidArgument, text);
}

CommandResult invalidGroup(const std::string& text) {
    LOG_WARN("[Commands] Rejected grouping: " << text);
    return CommandResult::failure(HeosError::InvalidGroup, text);
}

CommandResult malformed(const std::string& command, const std::string& what) {
    LOG_WARN("[Commands] " << command << ": " << what);
    return CommandResult::failure(HeosError::ProtocolError, command + ": " + what);
}

SourceEntry parseSourceEntry(const Json::Value& node, int sid, int parentSid) {
    SourceEntry entry;
    entry.sourceId = sid;
    entry.parentSourceId = parentSid;
    int ownSid = 0;
    if (jsonInt(node["sid"], ownSid)) entry.sourceId = ownSid;
    entry.containerId = jsonText(node["cid"]);
    entry.mediaId = jsonText(node["mid"]);
    entry.name = jsonText(node["name"]);
    entry.type = jsonText(node["type"]);
    entry.imageUrl = jsonText(node["image_url"]);
    entry.browsable = jsonFlag(node["container"], false);
    entry.playable = jsonFlag(node["playable"], false);
    entry.available = jsonFlag(node["available"], true);
    return entry;
}

} // namespace

HeosCommands::HeosCommands(CommandCorrelator& correlator, PlayerRegistry& registry, const Config& config)
    : m_correlator(correlator)
    , m_registry(registry)
    , m_timeout(config.commandTimeoutMs)
    , m_groupGrace(config.groupGracePeriodMs)
{
}

CommandResult HeosCommands::submit(const HeosCommand& command) {
    return m_correlator.submit(command, m_timeout);
}

// ============================================
// Playback
// ============================================

CommandResult HeosCommands::setPlayState(int pid, PlayState state) {
    return submit(HeosCommand(HeosCmd::SET_PLAY_STATE).with("pid", pid).with("state", wireValue(state)));
}

CommandResult HeosCommands::playNext(int pid) {
    return submit(HeosCommand(HeosCmd::PLAY_NEXT).with("pid", pid));
}

CommandResult HeosCommands::playPrevious(int pid) {
    return submit(HeosCommand(HeosCmd::PLAY_PREVIOUS).with("pid", pid));
}

CommandResult HeosCommands::setPlayMode(int pid, RepeatMode repeat, bool shuffle) {
    return submit(HeosCommand(HeosCmd::SET_PLAY_MODE)
                      .with("pid", pid)
                      .with("repeat", wireValue(repeat))
                      .with("shuffle", shuffle ? "on" : "off"));
}

// ============================================
// Volume
// ============================================

CommandResult HeosCommands::setVolume(int pid, int level) {
    if (level < 0 || level > 100) {
        return invalidArgument("Volume " + std::to_string(level) + " out of range 0-100");
    }
    return submit(HeosCommand(HeosCmd::SET_VOLUME).with("pid", pid).with("level", level));
}

CommandResult HeosCommands::setGroupVolume(int gid, int level) {
    if (level < 0 || level > 100) {
        return invalidArgument("Group volume " + std::to_string(level) + " out of range 0-100");
    }
    return submit(HeosCommand(HeosCmd::SET_GROUP_VOLUME).with("gid", gid).with("level", level));
}

CommandResult HeosCommands::volumeUp(int pid, int step) {
    if (step < 1 || step > 10) {
        return invalidArgument("Volume step " + std::to_string(step) + " out of range 1-10");
    }
    return submit(HeosCommand(HeosCmd::VOLUME_UP).with("pid", pid).with("step", step));
}

CommandResult HeosCommands::volumeDown(int pid, int step) {
    if (step < 1 || step > 10) {
        return invalidArgument("Volume step " + std::to_string(step) + " out of range 1-10");
    }
    return submit(HeosCommand(HeosCmd::VOLUME_DOWN).with("pid", pid).with("step", step));
}

CommandResult HeosCommands::setMute(int pid, bool mute) {
    return submit(HeosCommand(HeosCmd::SET_MUTE).with("pid", pid).with("state", mute ? "on" : "off"));
}

CommandResult HeosCommands::toggleMute(int pid) {
    return submit(HeosCommand(HeosCmd::TOGGLE_MUTE).with("pid", pid));
}

CommandResult HeosCommands::setGroupMute(int gid, bool mute) {
    return submit(HeosCommand(HeosCmd::SET_GROUP_MUTE).with("gid", gid).with("state", mute ? "on" : "off"));
}

// ============================================
// Grouping
// ============================================

CommandResult HeosCommands::createGroup(int leaderId, const std::vector<int>& memberIds) {
    auto snap = m_registry.snapshot();

    if (memberIds.empty()) {
        return invalidGroup("no members for leader " + std::to_string(leaderId));
    }
    if (!snap->findPlayer(leaderId)) {
        return invalidGroup("unknown leader " + std::to_string(leaderId));
    }
    const Group* leaderGroup = snap->groupOf(leaderId);
    if (leaderGroup && leaderGroup->leaderId != leaderId) {
        return invalidGroup("leader " + std::to_string(leaderId) + " is a member of group "
                            + std::to_string(leaderGroup->gid));
    }

    std::set<int> seen{leaderId};
    for (int pid : memberIds) {
        if (!seen.insert(pid).second) {
            return invalidGroup("player " + std::to_string(pid) + " listed twice");
        }
        if (!snap->findPlayer(pid)) {
            return invalidGroup("unknown player " + std::to_string(pid));
        }
        const Group* current = snap->groupOf(pid);
        if (current && current->leaderId != leaderId) {
            return invalidGroup("player " + std::to_string(pid) + " already in group "
                                + std::to_string(current->gid));
        }
    }

    std::vector<int> ids{leaderId};
    ids.insert(ids.end(), memberIds.begin(), memberIds.end());

    const uint64_t since = m_registry.groupVersion();
    LOG_INFO("[Commands] Grouping " << joinIds(ids) << " (leader " << leaderId << ")");
    CommandResult result = submit(HeosCommand(HeosCmd::SET_GROUP).with("pid", joinIds(ids)));
    if (!result.ok()) {
        return result;
    }

    CommandResult confirmed = waitForGroups(since);
    return confirmed.ok() ? result : confirmed;
}

CommandResult HeosCommands::dissolveGroup(int gid) {
    Group group;
    if (!m_registry.findGroup(gid, group)) {
        return invalidGroup("unknown group " + std::to_string(gid));
    }

    const uint64_t since = m_registry.groupVersion();
    LOG_INFO("[Commands] Dissolving group " << gid << " (leader " << group.leaderId << ")");
    CommandResult result = submit(HeosCommand(HeosCmd::SET_GROUP).with("pid", group.leaderId));
    if (!result.ok()) {
        return result;
    }

    CommandResult confirmed = waitForGroups(since);
    return confirmed.ok() ? result : confirmed;
}

CommandResult HeosCommands::waitForGroups(uint64_t since) {
    if (m_registry.waitForGroupChange(since, m_groupGrace)) {
        LOG_DEBUG("[Commands] Group change confirmed by device");
        return CommandResult();
    }
    LOG_INFO("[Commands] No group change within " << m_groupGrace.count()
             << " ms, refetching groups");
    CommandResult refreshed = refreshGroups();
    if (!refreshed.ok()) {
        LOG_WARN("[Commands] Group refetch failed: " << refreshed.errorText);
    }
    return refreshed;
}

// ============================================
// Enumeration
// ============================================

CommandResult HeosCommands::getPlayers(std::vector<Player>& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_PLAYERS));
    if (!result.ok()) return result;

    const Json::Value& payload = result.response.payload;
    if (!payload.isArray()) {
        return malformed(HeosCmd::GET_PLAYERS, "payload is not a list");
    }

    out.clear();
    for (const Json::Value& node : payload) {
        if (!node.isObject()) continue;
        Player player;
        if (!jsonInt(node["pid"], player.pid)) {
            LOG_WARN("[Commands] Skipping player entry without pid");
            continue;
        }
        player.name = jsonText(node["name"]);
        player.model = jsonText(node["model"]);
        player.version = jsonText(node["version"]);
        player.ip = jsonText(node["ip"]);
        player.network = jsonText(node["network"]);
        out.push_back(player);
    }
    return result;
}

CommandResult HeosCommands::getGroups(std::vector<Group>& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_GROUPS));
    if (!result.ok()) return result;

    const Json::Value& payload = result.response.payload;
    if (payload.isNull()) {
        out.clear();
        return result;
    }
    if (!payload.isArray()) {
        return malformed(HeosCmd::GET_GROUPS, "payload is not a list");
    }

    out.clear();
    for (const Json::Value& node : payload) {
        if (!node.isObject()) continue;
        Group group;
        if (!jsonInt(node["gid"], group.gid)) {
            LOG_WARN("[Commands] Skipping group entry without gid");
            continue;
        }
        group.name = jsonText(node["name"]);

        bool haveLeader = false;
        for (const Json::Value& member : node["players"]) {
            int pid = 0;
            if (!member.isObject() || !jsonInt(member["pid"], pid)) continue;
            if (jsonText(member["role"]) == "leader" && !haveLeader) {
                group.leaderId = pid;
                haveLeader = true;
            } else {
                group.memberIds.push_back(pid);
            }
        }
        if (!haveLeader) {
            LOG_WARN("[Commands] Skipping group " << group.gid << " without leader");
            continue;
        }
        out.push_back(group);
    }
    return result;
}

CommandResult HeosCommands::getPlayState(int pid, PlayState& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_PLAY_STATE).with("pid", pid));
    if (result.ok() && !parsePlayState(result.response.get("state"), out)) {
        return malformed(HeosCmd::GET_PLAY_STATE, "bad state '" + result.response.get("state") + "'");
    }
    return result;
}

CommandResult HeosCommands::getVolume(int pid, int& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_VOLUME).with("pid", pid));
    if (result.ok() && !result.response.getInt("level", out)) {
        return malformed(HeosCmd::GET_VOLUME, "missing level");
    }
    return result;
}

CommandResult HeosCommands::getMute(int pid, bool& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_MUTE).with("pid", pid));
    if (result.ok() && !parseOnOff(result.response.get("state"), out)) {
        return malformed(HeosCmd::GET_MUTE, "bad state '" + result.response.get("state") + "'");
    }
    return result;
}

CommandResult HeosCommands::getPlayMode(int pid, RepeatMode& repeat, bool& shuffle) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_PLAY_MODE).with("pid", pid));
    if (!result.ok()) return result;
    if (!parseRepeatMode(result.response.get("repeat"), repeat)
        || !parseOnOff(result.response.get("shuffle"), shuffle)) {
        return malformed(HeosCmd::GET_PLAY_MODE, "bad play mode '" + result.response.message + "'");
    }
    return result;
}

CommandResult HeosCommands::getNowPlaying(int pid, NowPlaying& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_NOW_PLAYING).with("pid", pid));
    if (!result.ok()) return result;

    // Empty payload: nothing loaded
    out = NowPlaying();
    const Json::Value& payload = result.response.payload;
    if (!payload.isObject()) return result;

    out.type = jsonText(payload["type"]);
    out.title = jsonText(payload["song"]);
    out.artist = jsonText(payload["artist"]);
    out.album = jsonText(payload["album"]);
    out.artworkUrl = jsonText(payload["image_url"]);
    out.mediaId = jsonText(payload["mid"]);
    out.albumId = jsonText(payload["album_id"]);
    out.station = jsonText(payload["station"]);
    jsonInt(payload["sid"], out.sourceId);
    return result;
}

CommandResult HeosCommands::getGroupVolume(int gid, int& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_GROUP_VOLUME).with("gid", gid));
    if (result.ok() && !result.response.getInt("level", out)) {
        return malformed(HeosCmd::GET_GROUP_VOLUME, "missing level");
    }
    return result;
}

CommandResult HeosCommands::getGroupMute(int gid, bool& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_GROUP_MUTE).with("gid", gid));
    if (result.ok() && !parseOnOff(result.response.get("state"), out)) {
        return malformed(HeosCmd::GET_GROUP_MUTE, "bad state '" + result.response.get("state") + "'");
    }
    return result;
}

CommandResult HeosCommands::enumeratePlayer(Player& player) {
    // A player the device refuses to describe keeps defaults for that field;
    // anything else aborts the refresh
    int answered = 0;
    auto fatal = [&](const CommandResult& result, const char* what) {
        if (result.ok()) {
            answered++;
            return false;
        }
        if (result.error == HeosError::CommandError) {
            LOG_WARN("[Commands] Player " << player.pid << " " << what << " unavailable: "
                     << result.errorText);
            return false;
        }
        return true;
    };

    CommandResult result = getPlayState(player.pid, player.state);
    if (fatal(result, "play state")) return result;

    result = getVolume(player.pid, player.volume);
    if (fatal(result, "volume")) return result;

    result = getMute(player.pid, player.muted);
    if (fatal(result, "mute")) return result;

    result = getPlayMode(player.pid, player.repeat, player.shuffle);
    if (fatal(result, "play mode")) return result;

    result = getNowPlaying(player.pid, player.nowPlaying);
    if (fatal(result, "now playing")) return result;

    // Listed but unable to answer anything: powered down or off the network
    player.online = answered > 0;
    if (!player.online) {
        LOG_WARN("[Commands] Player " << player.pid << " (" << player.name << ") is offline");
    }
    return CommandResult();
}

CommandResult HeosCommands::enumerate(std::vector<Player>& players, std::vector<Group>& groups) {
    CommandResult result = getPlayers(players);
    if (!result.ok()) {
        return CommandResult::failure(HeosError::RefreshError,
                                      std::string("players: ") + toString(result.error) + " " + result.errorText);
    }

    for (Player& player : players) {
        result = enumeratePlayer(player);
        if (!result.ok()) {
            return CommandResult::failure(HeosError::RefreshError,
                                          "player " + std::to_string(player.pid) + ": "
                                          + toString(result.error) + " " + result.errorText);
        }
    }

    result = getGroups(groups);
    if (!result.ok()) {
        return CommandResult::failure(HeosError::RefreshError,
                                      std::string("groups: ") + toString(result.error) + " " + result.errorText);
    }

    for (Group& group : groups) {
        result = getGroupVolume(group.gid, group.volume);
        if (result.ok()) {
            result = getGroupMute(group.gid, group.muted);
        }
        if (!result.ok() && result.error != HeosError::CommandError) {
            return CommandResult::failure(HeosError::RefreshError,
                                          "group " + std::to_string(group.gid) + ": "
                                          + toString(result.error) + " " + result.errorText);
        }
    }

    LOG_DEBUG("[Commands] Enumerated " << players.size() << " player(s), "
              << groups.size() << " group(s)");
    return CommandResult();
}

// ============================================
// Browse
// ============================================

CommandResult HeosCommands::getMusicSources(std::vector<SourceEntry>& out) {
    CommandResult result = submit(HeosCommand(HeosCmd::GET_MUSIC_SOURCES));
    if (!result.ok()) return result;

    const Json::Value& payload = result.response.payload;
    if (!payload.isArray()) {
        return malformed(HeosCmd::GET_MUSIC_SOURCES, "payload is not a list");
    }

    out.clear();
    for (const Json::Value& node : payload) {
        if (!node.isObject()) continue;
        SourceEntry entry = parseSourceEntry(node, 0, 0);
        if (entry.sourceId == 0) {
            LOG_WARN("[Commands] Skipping music source without sid");
            continue;
        }
        entry.browsable = true;
        out.push_back(entry);
    }
    return result;
}

CommandResult HeosCommands::browse(int sid, const std::string& cid, std::vector<SourceEntry>& out) {
    HeosCommand command(HeosCmd::BROWSE);
    command.with("sid", sid);
    if (!cid.empty()) command.with("cid", cid);

    CommandResult result = submit(command);
    if (!result.ok()) return result;

    out.clear();
    const Json::Value& payload = result.response.payload;
    if (payload.isNull()) return result;
    if (!payload.isArray()) {
        return malformed(HeosCmd::BROWSE, "payload is not a list");
    }
    for (const Json::Value& node : payload) {
        if (node.isObject()) out.push_back(parseSourceEntry(node, sid, sid));
    }
    return result;
}

CommandResult HeosCommands::getFavorites(std::vector<SourceEntry>& out) {
    return browse(HEOS_FAVORITES_SID, std::string(), out);
}

CommandResult HeosCommands::playPreset(int pid, int preset) {
    if (preset < 1) {
        return invalidArgument("Preset " + std::to_string(preset) + " must be 1 or higher");
    }
    return submit(HeosCommand(HeosCmd::PLAY_PRESET).with("pid", pid).with("preset", preset));
}

CommandResult HeosCommands::playInput(int pid, const std::string& input, int sourcePid) {
    if (input.empty()) {
        return invalidArgument("Input name is empty");
    }
    HeosCommand command(HeosCmd::PLAY_INPUT);
    command.with("pid", pid);
    if (sourcePid != 0) command.with("spid", sourcePid);
    command.with("input", input);
    return submit(command);
}

CommandResult HeosCommands::playStream(int pid, int sid, const std::string& mid,
                                       const std::string& cid, const std::string& name) {
    if (mid.empty()) {
        return invalidArgument("Stream media id is empty");
    }
    HeosCommand command(HeosCmd::PLAY_STREAM);
    command.with("pid", pid).with("sid", sid);
    if (!cid.empty()) command.with("cid", cid);
    command.with("mid", mid);
    if (!name.empty()) command.with("name", name);
    return submit(command);
}

CommandResult HeosCommands::addToQueue(int pid, int sid, const std::string& cid, const std::string& mid,
                                       QueueAction action) {
    if (cid.empty()) {
        return invalidArgument("Container id is empty");
    }
    HeosCommand command(HeosCmd::ADD_TO_QUEUE);
    command.with("pid", pid).with("sid", sid).with("cid", cid);
    if (!mid.empty()) command.with("mid", mid);
    command.with("aid", static_cast<int>(action));
    return submit(command);
}

// ============================================
// System
// ============================================

CommandResult HeosCommands::heartBeat() {
    return submit(HeosCommand(HeosCmd::HEART_BEAT));
}

CommandResult HeosCommands::registerForChangeEvents(bool enable) {
    return submit(HeosCommand(HeosCmd::REGISTER_EVENTS).with("enable", enable ? "on" : "off"));
}

CommandResult HeosCommands::checkAccount(bool& signedIn, std::string& username) {
    CommandResult result = submit(HeosCommand(HeosCmd::CHECK_ACCOUNT));
    if (!result.ok()) return result;
    signedIn = result.response.has("signed_in");
    username = result.response.get("un");
    return result;
}

CommandResult HeosCommands::signIn(const std::string& username, const std::string& password) {
    if (username.empty()) {
        return invalidArgument("Sign-in without a username");
    }
    return submit(HeosCommand(HeosCmd::SIGN_IN).with("un", username).with("pw", password));
}

CommandResult HeosCommands::signOut() {
    return submit(HeosCommand(HeosCmd::SIGN_OUT));
}

// ============================================
// Registry fetches
// ============================================

CommandResult HeosCommands::refreshGroups() {
    std::vector<Group> groups;
    CommandResult result = getGroups(groups);
    if (!result.ok()) return result;

    for (Group& group : groups) {
        CommandResult volume = getGroupVolume(group.gid, group.volume);
        if (volume.ok()) {
            volume = getGroupMute(group.gid, group.muted);
        }
        if (!volume.ok() && volume.error != HeosError::CommandError) {
            return volume;
        }
    }
    m_registry.replaceGroups(groups);
    return result;
}

CommandResult HeosCommands::refreshNowPlaying(int pid) {
    NowPlaying media;
    CommandResult result = getNowPlaying(pid, media);
    if (!result.ok()) return result;
    if (!m_registry.updateNowPlaying(pid, media)) {
        LOG_DEBUG("[Commands] Now playing for unknown player " << pid << " ignored");
    }
    return result;
}

CommandResult HeosCommands::refreshFavorites() {
    // Favorites belong to the HEOS account
    if (!m_registry.snapshot()->signedIn) {
        if (!m_registry.listFavorites().empty()) {
            m_registry.replaceFavorites(std::vector<SourceEntry>());
        }
        return CommandResult();
    }

    std::vector<SourceEntry> favorites;
    CommandResult result = getFavorites(favorites);
    if (!result.ok()) return result;
    m_registry.replaceFavorites(favorites);
    return result;
}

CommandResult HeosCommands::refreshSources() {
    std::vector<SourceEntry> sources;
    CommandResult result = getMusicSources(sources);
    if (!result.ok()) return result;
    m_registry.replaceSources(sources);
    return result;
}
