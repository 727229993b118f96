/**
 * @file PlayerRegistry.cpp
 * @brief Player/group model implementation
 */

#include "PlayerRegistry.h"
#include "LogLevel.h"

#include <json/json.h>

#include <algorithm>
#include <set>
#include <utility>

// ============================================
// RegistrySnapshot
// ============================================

const Player* RegistrySnapshot::findPlayer(int pid) const {
    auto it = players.find(pid);
    return it == players.end() ? nullptr : &it->second;
}

const Group* RegistrySnapshot::findGroup(int gid) const {
    auto it = groups.find(gid);
    return it == groups.end() ? nullptr : &it->second;
}

const Group* RegistrySnapshot::groupOf(int pid) const {
    for (const auto& entry : groups) {
        if (entry.second.contains(pid)) return &entry.second;
    }
    return nullptr;
}

// ============================================
// Reads
// ============================================

PlayerRegistry::PlayerRegistry()
    : m_current(std::make_shared<RegistrySnapshot>())
{
}

std::shared_ptr<const RegistrySnapshot> PlayerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_current;
}

std::vector<Player> PlayerRegistry::listPlayers() const {
    auto snap = snapshot();
    std::vector<Player> players;
    players.reserve(snap->players.size());
    for (const auto& entry : snap->players) {
        players.push_back(entry.second);
    }
    return players;
}

std::vector<Group> PlayerRegistry::listGroups() const {
    auto snap = snapshot();
    std::vector<Group> groups;
    groups.reserve(snap->groups.size());
    for (const auto& entry : snap->groups) {
        groups.push_back(entry.second);
    }
    return groups;
}

std::vector<SourceEntry> PlayerRegistry::listSources() const {
    return snapshot()->sources;
}

std::vector<SourceEntry> PlayerRegistry::listFavorites() const {
    return snapshot()->favorites;
}

bool PlayerRegistry::findPlayer(int pid, Player& out) const {
    auto snap = snapshot();
    const Player* player = snap->findPlayer(pid);
    if (!player) return false;
    out = *player;
    return true;
}

bool PlayerRegistry::findGroup(int gid, Group& out) const {
    auto snap = snapshot();
    const Group* group = snap->findGroup(gid);
    if (!group) return false;
    out = *group;
    return true;
}

// ============================================
// Writes
// ============================================

std::shared_ptr<RegistrySnapshot> PlayerRegistry::beginWrite() const {
    auto next = std::make_shared<RegistrySnapshot>(*snapshot());
    next->version++;
    return next;
}

void PlayerRegistry::publish(std::shared_ptr<RegistrySnapshot> next, bool groupsReplaced) {
    {
        std::lock_guard<std::mutex> lock(m_snapshotMutex);
        m_current = std::move(next);
        if (groupsReplaced) m_groupVersion++;
    }
    if (groupsReplaced) m_groupCv.notify_all();
}

std::map<int, Group> PlayerRegistry::sanitizeGroups(const std::map<int, Player>& players,
                                                    const std::vector<Group>& groups) {
    std::map<int, Group> result;
    std::set<int> grouped;

    for (const Group& group : groups) {
        if (players.count(group.leaderId) == 0) {
            LOG_WARN("[Registry] Dropping group " << group.gid << ": leader "
                     << group.leaderId << " is not a known player");
            continue;
        }
        if (grouped.count(group.leaderId) != 0) {
            LOG_WARN("[Registry] Dropping group " << group.gid << ": leader "
                     << group.leaderId << " already grouped");
            continue;
        }

        Group clean = group;
        clean.memberIds.clear();
        for (int pid : group.memberIds) {
            if (pid == group.leaderId) continue;
            if (players.count(pid) == 0 || grouped.count(pid) != 0
                || std::find(clean.memberIds.begin(), clean.memberIds.end(), pid) != clean.memberIds.end()) {
                LOG_WARN("[Registry] Group " << group.gid << ": ignoring member " << pid);
                continue;
            }
            clean.memberIds.push_back(pid);
        }

        grouped.insert(clean.leaderId);
        grouped.insert(clean.memberIds.begin(), clean.memberIds.end());
        result[clean.gid] = std::move(clean);
    }
    return result;
}

void PlayerRegistry::resolveSourceName(const std::vector<SourceEntry>& sources, NowPlaying& media) {
    if (media.sourceId == 0 || !media.sourceName.empty()) return;
    for (const SourceEntry& source : sources) {
        if (source.sourceId == media.sourceId) {
            media.sourceName = source.name;
            return;
        }
    }
}

void PlayerRegistry::beginRefresh() {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    if (m_refreshes++ == 0) m_journal.clear();
}

void PlayerRegistry::abandonRefresh() {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    if (m_refreshes > 0 && --m_refreshes == 0) m_journal.clear();
}

void PlayerRegistry::replace(const std::vector<Player>& players, const std::vector<Group>& groups,
                             RegistryDiff* diff) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    auto next = beginWrite();

    std::map<int, Player> updated;
    for (const Player& incoming : players) {
        Player player = incoming;
        resolveSourceName(next->sources, player.nowPlaying);

        // Enumeration carries no progress; keep it while the track is unchanged
        const Player* existing = next->findPlayer(player.pid);
        if (existing && existing->nowPlaying.mediaId == player.nowPlaying.mediaId
            && existing->nowPlaying.title == player.nowPlaying.title
            && player.nowPlaying.durationMs == 0) {
            player.nowPlaying.durationMs = existing->nowPlaying.durationMs;
            player.nowPlaying.positionMs = existing->nowPlaying.positionMs;
        }
        updated[player.pid] = std::move(player);
    }

    if (diff) {
        diff->added.clear();
        diff->removed.clear();
        for (const auto& entry : updated) {
            if (next->players.count(entry.first) == 0) diff->added.push_back(entry.first);
        }
        for (const auto& entry : next->players) {
            if (updated.count(entry.first) == 0) diff->removed.push_back(entry.first);
        }
    }

    next->players = std::move(updated);
    next->groups = sanitizeGroups(next->players, groups);

    if (m_refreshes > 0) {
        size_t replayed = 0;
        for (const HeosEvent& event : m_journal) {
            if (applyFields(*next, event)) replayed++;
        }
        if (replayed > 0) {
            LOG_DEBUG("[Registry] Replayed " << replayed << " event(s) received during refresh");
        }
        if (--m_refreshes == 0) m_journal.clear();
    }

    LOG_DEBUG("[Registry] Replaced model: " << next->players.size() << " player(s), "
              << next->groups.size() << " group(s)");
    publish(std::move(next), true);
}

void PlayerRegistry::replaceGroups(const std::vector<Group>& groups) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    auto next = beginWrite();
    next->groups = sanitizeGroups(next->players, groups);
    LOG_DEBUG("[Registry] Replaced groups: " << next->groups.size() << " group(s)");
    publish(std::move(next), true);
}

void PlayerRegistry::replaceSources(const std::vector<SourceEntry>& sources) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    auto next = beginWrite();
    next->sources = sources;
    for (auto& entry : next->players) {
        entry.second.nowPlaying.sourceName.clear();
        resolveSourceName(next->sources, entry.second.nowPlaying);
    }
    publish(std::move(next), false);
}

void PlayerRegistry::replaceFavorites(const std::vector<SourceEntry>& favorites) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    auto next = beginWrite();
    next->favorites = favorites;
    publish(std::move(next), false);
}

bool PlayerRegistry::updateNowPlaying(int pid, const NowPlaying& media) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    if (!snapshot()->findPlayer(pid)) return false;

    auto next = beginWrite();
    Player& player = next->players[pid];
    NowPlaying fresh = media;
    resolveSourceName(next->sources, fresh);
    if (player.nowPlaying.mediaId == fresh.mediaId && player.nowPlaying.title == fresh.title
        && fresh.durationMs == 0) {
        fresh.durationMs = player.nowPlaying.durationMs;
        fresh.positionMs = player.nowPlaying.positionMs;
    }
    player.nowPlaying = std::move(fresh);
    publish(std::move(next), false);
    return true;
}

void PlayerRegistry::setAccount(bool signedIn, const std::string& username) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    auto next = beginWrite();
    next->signedIn = signedIn;
    next->username = signedIn ? username : std::string();
    publish(std::move(next), false);
}

void PlayerRegistry::clear() {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    auto next = std::make_shared<RegistrySnapshot>();
    next->version = snapshot()->version + 1;
    publish(std::move(next), true);
}

// ============================================
// Event application
// ============================================

ApplyResult PlayerRegistry::applyEvent(const HeosEvent& event) {
    switch (event.type) {
        case EventType::GroupChanged:
        case EventType::PlayersChanged:
        case EventType::SourcesChanged:
            return ApplyResult::NeedsFetch;

        case EventType::PlayerAdded:
        case EventType::PlayerRemoved:
        case EventType::SystemError:
            return ApplyResult::Ignored;

        case EventType::UserChanged:
            setAccount(event.signedIn, event.username);
            return ApplyResult::Applied;

        default:
            break;
    }

    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    ApplyResult result = classify(*snapshot(), event);

    // Unknown entities are kept too: the enumeration may still add them
    if (m_refreshes > 0
        && (result == ApplyResult::Applied || result == ApplyResult::UnknownEntity)) {
        m_journal.push_back(event);
    }
    if (result != ApplyResult::Applied) return result;

    auto next = beginWrite();
    applyFields(*next, event);
    publish(std::move(next), false);
    return ApplyResult::Applied;
}

ApplyResult PlayerRegistry::classify(const RegistrySnapshot& snapshot, const HeosEvent& event) {
    // Group volume
    if (event.type == EventType::VolumeChanged && !event.hasPid) {
        return event.hasGid && snapshot.findGroup(event.gid)
            ? ApplyResult::Applied : ApplyResult::UnknownEntity;
    }

    if (!event.hasPid || !snapshot.findPlayer(event.pid)) {
        return ApplyResult::UnknownEntity;
    }

    switch (event.type) {
        case EventType::PlayerStateChanged:
        case EventType::VolumeChanged:
            return ApplyResult::Applied;
        case EventType::NowPlayingChanged:
            return event.hasProgress ? ApplyResult::Applied : ApplyResult::NeedsFetch;
        default:
            return ApplyResult::Ignored;
    }
}

bool PlayerRegistry::applyFields(RegistrySnapshot& snapshot, const HeosEvent& event) {
    if (event.type == EventType::VolumeChanged && !event.hasPid) {
        auto group = snapshot.groups.find(event.gid);
        if (!event.hasGid || group == snapshot.groups.end()) return false;
        if (event.hasLevel) group->second.volume = event.level;
        if (event.hasMute) group->second.muted = event.mute;
        return true;
    }

    auto it = snapshot.players.find(event.pid);
    if (!event.hasPid || it == snapshot.players.end()) return false;
    Player& player = it->second;

    switch (event.type) {
        case EventType::PlayerStateChanged:
            if (event.hasState) player.state = event.state;
            if (event.hasRepeat) player.repeat = event.repeat;
            if (event.hasShuffle) player.shuffle = event.shuffle;
            break;

        case EventType::VolumeChanged:
            if (event.hasLevel) player.volume = std::max(0, std::min(100, event.level));
            if (event.hasMute) player.muted = event.mute;
            break;

        case EventType::NowPlayingChanged:
            if (!event.hasProgress) return false;
            player.nowPlaying.positionMs = event.positionMs;
            player.nowPlaying.durationMs = event.durationMs;
            break;

        default:
            return false;
    }

    // Only a reachable player reports changes
    player.online = true;
    return true;
}

// ============================================
// Group confirmation
// ============================================

uint64_t PlayerRegistry::groupVersion() const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    return m_groupVersion;
}

bool PlayerRegistry::waitForGroupChange(uint64_t since, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_snapshotMutex);
    return m_groupCv.wait_for(lock, timeout, [&]() { return m_groupVersion > since; });
}

// ============================================
// Serialization
// ============================================

std::string PlayerRegistry::serialize() const {
    return serialize(*snapshot());
}

std::string PlayerRegistry::serialize(const RegistrySnapshot& snapshot) {
    Json::Value root(Json::objectValue);

    Json::Value players(Json::arrayValue);
    for (const auto& entry : snapshot.players) {
        const Player& p = entry.second;
        Json::Value node(Json::objectValue);
        node["pid"] = p.pid;
        node["name"] = p.name;
        node["model"] = p.model;
        node["version"] = p.version;
        node["ip"] = p.ip;
        node["network"] = p.network;
        node["online"] = p.online;
        node["volume"] = p.volume;
        node["muted"] = p.muted;
        node["state"] = toString(p.state);
        node["repeat"] = toString(p.repeat);
        node["shuffle"] = p.shuffle;

        Json::Value media(Json::objectValue);
        media["type"] = p.nowPlaying.type;
        media["title"] = p.nowPlaying.title;
        media["artist"] = p.nowPlaying.artist;
        media["album"] = p.nowPlaying.album;
        media["artwork"] = p.nowPlaying.artworkUrl;
        media["mid"] = p.nowPlaying.mediaId;
        media["album_id"] = p.nowPlaying.albumId;
        media["station"] = p.nowPlaying.station;
        media["sid"] = p.nowPlaying.sourceId;
        media["source"] = p.nowPlaying.sourceName;
        media["duration_ms"] = p.nowPlaying.durationMs;
        media["position_ms"] = p.nowPlaying.positionMs;
        node["now_playing"] = media;

        players.append(node);
    }
    root["players"] = players;

    Json::Value groups(Json::arrayValue);
    for (const auto& entry : snapshot.groups) {
        const Group& g = entry.second;
        Json::Value node(Json::objectValue);
        node["gid"] = g.gid;
        node["name"] = g.name;
        node["leader"] = g.leaderId;
        Json::Value members(Json::arrayValue);
        for (int pid : g.memberIds) members.append(pid);
        node["members"] = members;
        node["volume"] = g.volume;
        node["muted"] = g.muted;
        groups.append(node);
    }
    root["groups"] = groups;

    Json::Value sources(Json::arrayValue);
    for (const SourceEntry& s : snapshot.sources) {
        Json::Value node(Json::objectValue);
        node["sid"] = s.sourceId;
        node["name"] = s.name;
        node["type"] = s.type;
        node["available"] = s.available;
        sources.append(node);
    }
    root["sources"] = sources;

    Json::Value favorites(Json::arrayValue);
    for (const SourceEntry& f : snapshot.favorites) {
        Json::Value node(Json::objectValue);
        node["name"] = f.name;
        node["type"] = f.type;
        node["mid"] = f.mediaId;
        node["cid"] = f.containerId;
        node["playable"] = f.playable;
        favorites.append(node);
    }
    root["favorites"] = favorites;
    root["signed_in"] = snapshot.signedIn;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}
