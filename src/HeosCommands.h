/**
 * @file HeosCommands.h
 * @brief Typed command API on top of the correlator
 *
 * Each method builds the wire command, submits it and parses the result.
 * Mutating commands never touch the registry: their effect shows up once
 * the device confirms it with an event or a refresh. The refresh helpers
 * at the bottom are the only writers here, and they write fetch results.
 */

#ifndef HEOSLINK_HEOS_COMMANDS_H
#define HEOSLINK_HEOS_COMMANDS_H

#include "CommandCorrelator.h"
#include "Config.h"
#include "HeosTypes.h"
#include "PlayerRegistry.h"

#include <chrono>
#include <string>
#include <vector>

// browse/add_to_queue "aid" values
enum class QueueAction {
    PlayNow = 1,
    PlayNext = 2,
    AddToEnd = 3,
    ReplaceAndPlay = 4
};

class HeosCommands {
public:
    HeosCommands(CommandCorrelator& correlator, PlayerRegistry& registry, const Config& config);

    // Non-copyable
    HeosCommands(const HeosCommands&) = delete;
    HeosCommands& operator=(const HeosCommands&) = delete;

    // ========== Playback ==========
    CommandResult play(int pid) { return setPlayState(pid, PlayState::Playing); }
    CommandResult pause(int pid) { return setPlayState(pid, PlayState::Paused); }
    CommandResult stop(int pid) { return setPlayState(pid, PlayState::Stopped); }
    CommandResult setPlayState(int pid, PlayState state);
    CommandResult playNext(int pid);
    CommandResult playPrevious(int pid);
    CommandResult setPlayMode(int pid, RepeatMode repeat, bool shuffle);

    // ========== Volume ==========
    CommandResult setVolume(int pid, int level);
    CommandResult setGroupVolume(int gid, int level);
    CommandResult volumeUp(int pid, int step = 5);
    CommandResult volumeDown(int pid, int step = 5);
    CommandResult setMute(int pid, bool mute);
    CommandResult toggleMute(int pid);
    CommandResult setGroupMute(int gid, bool mute);

    // ========== Grouping ==========

    /**
     * @brief Group members under leaderId
     *
     * Validated against the registry first (InvalidGroup, nothing sent).
     * After the device accepts, waits up to the grace period for the group
     * list to change; if it does not, the group list is refetched.
     */
    CommandResult createGroup(int leaderId, const std::vector<int>& memberIds);
    CommandResult dissolveGroup(int gid);

    // ========== Enumeration ==========
    CommandResult getPlayers(std::vector<Player>& out);
    CommandResult getGroups(std::vector<Group>& out);
    CommandResult getPlayState(int pid, PlayState& out);
    CommandResult getVolume(int pid, int& out);
    CommandResult getMute(int pid, bool& out);
    CommandResult getPlayMode(int pid, RepeatMode& repeat, bool& shuffle);
    CommandResult getNowPlaying(int pid, NowPlaying& out);
    CommandResult getGroupVolume(int gid, int& out);
    CommandResult getGroupMute(int gid, bool& out);

    // Players with their full state, and groups with volume/mute.
    // Any failure other than a per-entity rejection yields RefreshError.
    CommandResult enumerate(std::vector<Player>& players, std::vector<Group>& groups);

    // ========== Browse ==========
    CommandResult getMusicSources(std::vector<SourceEntry>& out);
    CommandResult browse(int sid, const std::string& cid, std::vector<SourceEntry>& out);
    CommandResult getFavorites(std::vector<SourceEntry>& out);
    CommandResult playPreset(int pid, int preset);
    CommandResult playInput(int pid, const std::string& input, int sourcePid = 0);
    CommandResult playStream(int pid, int sid, const std::string& mid,
                             const std::string& cid = std::string(), const std::string& name = std::string());
    CommandResult addToQueue(int pid, int sid, const std::string& cid, const std::string& mid,
                             QueueAction action);

    // ========== System ==========
    CommandResult heartBeat();
    CommandResult registerForChangeEvents(bool enable);
    CommandResult checkAccount(bool& signedIn, std::string& username);
    CommandResult signIn(const std::string& username, const std::string& password);
    CommandResult signOut();

    // ========== Registry fetches ==========
    CommandResult refreshGroups();
    CommandResult refreshNowPlaying(int pid);
    CommandResult refreshSources();
    CommandResult refreshFavorites();   // empties the list when signed out

    std::chrono::milliseconds commandTimeout() const { return m_timeout; }

private:
    CommandCorrelator& m_correlator;
    PlayerRegistry& m_registry;
    std::chrono::milliseconds m_timeout;
    std::chrono::milliseconds m_groupGrace;

    CommandResult submit(const HeosCommand& command);
    CommandResult enumeratePlayer(Player& player);
    CommandResult waitForGroups(uint64_t since);
};

#endif // HEOSLINK_HEOS_COMMANDS_H
