/**
 * @file SessionManager.h
 * @brief Owns the HEOS connection and keeps the registry primed
 *
 * State machine:
 *   disconnected -> connecting -> authenticating -> ready
 *   ready -> degraded -> connecting ... (backoff 1 s doubling to 30 s)
 *
 * A supervisor thread runs the connect loop, the heartbeat and all fetch
 * work the event path asks for. A reader thread per connection drains the
 * transport into the dispatcher. Every transition into ready starts with a
 * full refresh, since events may have been lost while disconnected.
 */

#ifndef HEOSLINK_SESSION_MANAGER_H
#define HEOSLINK_SESSION_MANAGER_H

#include "CommandCorrelator.h"
#include "Config.h"
#include "EventDispatcher.h"
#include "HeosCommands.h"
#include "HeosMessages.h"
#include "HeosTypes.h"
#include "PlayerRegistry.h"
#include "Transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class SessionState {
    Disconnected,
    Connecting,
    Authenticating,
    Ready,
    Degraded
};

const char* toString(SessionState state);

class SessionManager {
public:
    using StateCallback = std::function<void(SessionState state, HeosError error)>;
    using EventCallback = EventDispatcher::EventCallback;
    using SubscriptionId = EventDispatcher::SubscriptionId;

    explicit SessionManager(const Config& config);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Called on the supervisor thread (set before start()). The callback may
    // call shutdown() but must not destroy the session.
    void onStateChanged(StateCallback cb) { m_stateCb = std::move(cb); }

    /**
     * @brief Start the supervisor for the configured endpoint and credentials
     * @return false if already running, shut down, or no host is set
     */
    bool start();
    bool start(const std::string& host, uint16_t port,
               const std::string& username, const std::string& password);

    // Terminal: releases the transport, fails outstanding commands. From the
    // supervisor thread the join is left to the destructor or a later call.
    void shutdown();

    SessionState state() const;
    HeosError lastError() const;
    bool waitForState(SessionState state, std::chrono::milliseconds timeout) const;

    // Registry queries
    std::vector<Player> listPlayers() const { return m_registry.listPlayers(); }
    std::vector<Group> listGroups() const { return m_registry.listGroups(); }
    std::vector<SourceEntry> listSources() const { return m_registry.listSources(); }
    std::vector<SourceEntry> listFavorites() const { return m_registry.listFavorites(); }
    const PlayerRegistry& registry() const { return m_registry; }

    HeosCommands& commands() { return m_commands; }

    SubscriptionId subscribe(EventType type, EventCallback callback);
    SubscriptionId subscribe(const std::vector<EventType>& types, EventCallback callback);
    bool unsubscribe(SubscriptionId id);

    // Full enumeration replacing the registry (any caller thread)
    CommandResult refresh();

    uint64_t droppedEvents() const { return m_dispatcher.droppedEvents(); }

private:
    enum class WorkKind { RefreshAll, RefreshGroups, RefreshNowPlaying, RefreshSources, RefreshFavorites };

    struct DeferredWork {
        WorkKind kind;
        int pid;
        int gid;    // RefreshAll for an unknown group
    };

    Config m_config;

    // Declaration order is construction order
    Transport m_transport;
    CommandCorrelator m_correlator;
    EventDispatcher m_dispatcher;
    PlayerRegistry m_registry;
    HeosCommands m_commands;

    StateCallback m_stateCb;

    mutable std::mutex m_stateMutex;
    mutable std::condition_variable m_stateCv;
    SessionState m_state = SessionState::Disconnected;
    HeosError m_lastError = HeosError::None;

    // Supervisor wakeups: shutdown, connection loss, deferred work
    std::mutex m_workMutex;
    std::condition_variable m_workCv;
    std::deque<DeferredWork> m_work;
    bool m_connectionLost = false;
    bool m_stopping = false;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_shutdown{false};
    std::atomic<bool> m_finished{false};
    std::atomic<std::thread::id> m_supervisorId{};
    std::thread m_supervisor;
    std::thread m_reader;
    std::mutex m_refreshMutex;  // one enumeration at a time

    void setState(SessionState state, HeosError error = HeosError::None);

    void runSupervisor();
    void runReader();
    bool runConnected(bool refreshPending);
    HeosError authenticate();
    void teardownConnection();

    void handleEvent(const HeosEvent& event);
    void queueWork(WorkKind kind, int pid = 0, int gid = 0);
    void dropSettledWork();
    void runWork(const DeferredWork& work);

    bool interruptibleWait(std::chrono::steady_clock::duration duration);
    bool stopping();
};

#endif // HEOSLINK_SESSION_MANAGER_H
