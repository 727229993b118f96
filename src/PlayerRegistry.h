/**
 * @file PlayerRegistry.h
 * @brief Authoritative in-memory model of HEOS players and groups
 *
 * Readers take immutable snapshots; writers (event application on the
 * reader thread, refresh and fetch results on the supervisor or a caller
 * thread) are serialized and publish a new snapshot each time.
 * Command callers never write here: a command's effect becomes visible
 * only once the device confirms it by event or by refresh.
 */

#ifndef HEOSLINK_PLAYER_REGISTRY_H
#define HEOSLINK_PLAYER_REGISTRY_H

#include "HeosMessages.h"
#include "HeosTypes.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct RegistrySnapshot {
    std::map<int, Player> players;      // by pid
    std::map<int, Group> groups;        // by gid
    std::vector<SourceEntry> sources;   // top-level music sources
    std::vector<SourceEntry> favorites;
    bool signedIn = false;
    std::string username;
    uint64_t version = 0;

    const Player* findPlayer(int pid) const;
    const Group* findGroup(int gid) const;
    const Group* groupOf(int pid) const;
};

struct RegistryDiff {
    std::vector<int> added;
    std::vector<int> removed;
};

enum class ApplyResult {
    Applied,        // registry updated from the event payload
    UnknownEntity,  // referenced pid/gid not known, nothing changed
    NeedsFetch,     // event only signals a change; state must be fetched
    Ignored         // event carries nothing the registry models
};

class PlayerRegistry {
public:
    PlayerRegistry();

    // Non-copyable
    PlayerRegistry(const PlayerRegistry&) = delete;
    PlayerRegistry& operator=(const PlayerRegistry&) = delete;

    // Reads (any thread)
    std::shared_ptr<const RegistrySnapshot> snapshot() const;
    std::vector<Player> listPlayers() const;
    std::vector<Group> listGroups() const;
    std::vector<SourceEntry> listSources() const;
    std::vector<SourceEntry> listFavorites() const;
    bool findPlayer(int pid, Player& out) const;
    bool findGroup(int gid, Group& out) const;

    // Events applied between beginRefresh() and replace() are replayed on top
    // of the enumerated model, so an answer older than an event never wins.
    // abandonRefresh() drops the record when the enumeration fails.
    void beginRefresh();
    void abandonRefresh();

    // Full refresh result: players/groups not listed are removed
    void replace(const std::vector<Player>& players, const std::vector<Group>& groups,
                 RegistryDiff* diff = nullptr);

    // Targeted fetch results
    void replaceGroups(const std::vector<Group>& groups);
    void replaceSources(const std::vector<SourceEntry>& sources);
    void replaceFavorites(const std::vector<SourceEntry>& favorites);
    bool updateNowPlaying(int pid, const NowPlaying& media);
    void setAccount(bool signedIn, const std::string& username);
    void clear();

    // Event application (reader thread)
    ApplyResult applyEvent(const HeosEvent& event);

    // Group confirmation for grouping commands
    uint64_t groupVersion() const;
    bool waitForGroupChange(uint64_t since, std::chrono::milliseconds timeout) const;

    // Deterministic JSON rendering, sorted by id
    std::string serialize() const;
    static std::string serialize(const RegistrySnapshot& snapshot);

private:
    mutable std::mutex m_snapshotMutex;     // guards m_current and m_groupVersion
    mutable std::condition_variable m_groupCv;
    std::shared_ptr<const RegistrySnapshot> m_current;
    uint64_t m_groupVersion = 0;

    std::mutex m_writeMutex;                // one writer at a time
    unsigned int m_refreshes = 0;           // enumerations in flight, guarded by m_writeMutex
    std::vector<HeosEvent> m_journal;       // events seen since the first of them began

    std::shared_ptr<RegistrySnapshot> beginWrite() const;
    void publish(std::shared_ptr<RegistrySnapshot> next, bool groupsReplaced);

    static ApplyResult classify(const RegistrySnapshot& snapshot, const HeosEvent& event);
    static bool applyFields(RegistrySnapshot& snapshot, const HeosEvent& event);
    static std::map<int, Group> sanitizeGroups(const std::map<int, Player>& players,
                                               const std::vector<Group>& groups);
    static void resolveSourceName(const std::vector<SourceEntry>& sources, NowPlaying& media);
};

#endif // HEOSLINK_PLAYER_REGISTRY_H
