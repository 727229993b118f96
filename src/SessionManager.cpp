/**
 * @file SessionManager.cpp
 * @brief Connection supervision, authentication and registry priming
 */

#include "SessionManager.h"
#include "LogLevel.h"

#include <algorithm>
#include <utility>

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected:   return "disconnected";
        case SessionState::Connecting:     return "connecting";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Ready:          return "ready";
        case SessionState::Degraded:       return "degraded";
    }
    return "unknown";
}

SessionManager::SessionManager(const Config& config)
    : m_config(config)
    , m_transport(config.maxMessageBytes)
    , m_correlator([this](const std::string& line) { return m_transport.send(line); })
    , m_dispatcher(m_correlator, config.subscriberQueueCapacity)
    , m_commands(m_correlator, m_registry, config)
{
    // Nothing can be submitted until a connection exists
    m_correlator.failAll(HeosError::Disconnected);
    m_dispatcher.setInternalHandler([this](const HeosEvent& event) { handleEvent(event); });
}

SessionManager::~SessionManager() {
    shutdown();
}

// ============================================
// Lifecycle
// ============================================

bool SessionManager::start() {
    return start(m_config.host, m_config.port, m_config.username, m_config.password);
}

bool SessionManager::start(const std::string& host, uint16_t port,
                           const std::string& username, const std::string& password) {
    if (m_shutdown.load(std::memory_order_acquire)) {
        LOG_ERROR("[Session] Cannot start after shutdown");
        return false;
    }
    if (m_running.load(std::memory_order_acquire)) {
        LOG_WARN("[Session] Already running");
        return false;
    }
    if (host.empty()) {
        LOG_ERROR("[Session] No HEOS device address given");
        return false;
    }

    // Supervisor from a previous run stopped on its own (credentials rejected)
    if (m_supervisor.joinable()) {
        m_supervisor.join();
    }

    m_config.host = host;
    m_config.port = port;
    m_config.username = username;
    m_config.password = password;

    {
        std::lock_guard<std::mutex> lock(m_workMutex);
        m_stopping = false;
        m_connectionLost = false;
        m_work.clear();
    }

    m_running.store(true, std::memory_order_release);
    m_supervisor = std::thread(&SessionManager::runSupervisor, this);
    return true;
}

void SessionManager::shutdown() {
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(m_workMutex);
        first = !m_shutdown.load(std::memory_order_acquire);
        m_shutdown.store(true, std::memory_order_release);
        m_stopping = true;
    }

    if (first) {
        m_workCv.notify_all();
        LOG_DEBUG("[Session] Shutting down");

        // Unblock the reader and every waiting caller
        m_transport.close();
        m_correlator.failAll(HeosError::Disconnected);
    }

    // Called from a state callback: the supervisor leaves its loop by itself
    // and cannot join its own thread
    if (m_supervisorId.load() == std::this_thread::get_id()) {
        return;
    }

    if (m_supervisor.joinable()) {
        m_supervisor.join();
    }
    if (m_reader.joinable() && m_reader.get_id() != std::this_thread::get_id()) {
        m_reader.join();
    }

    if (m_finished.exchange(true)) return;
    m_dispatcher.stop();
    setState(SessionState::Disconnected);
    LOG_INFO("[Session] Stopped");
}

// ============================================
// State
// ============================================

void SessionManager::setState(SessionState state, HeosError error) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == state && error == HeosError::None) return;
        m_state = state;
        if (error != HeosError::None) m_lastError = error;
    }
    m_stateCv.notify_all();

    if (error != HeosError::None) {
        LOG_INFO("[Session] State: " << toString(state) << " (" << toString(error) << ")");
    } else {
        LOG_INFO("[Session] State: " << toString(state));
    }

    if (m_stateCb) {
        m_stateCb(state, error);
    }
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

HeosError SessionManager::lastError() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastError;
}

bool SessionManager::waitForState(SessionState state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_stateMutex);
    return m_stateCv.wait_for(lock, timeout, [&]() { return m_state == state; });
}

// ============================================
// Subscriptions
// ============================================

SessionManager::SubscriptionId SessionManager::subscribe(EventType type, EventCallback callback) {
    return m_dispatcher.subscribe(type, std::move(callback));
}

SessionManager::SubscriptionId SessionManager::subscribe(const std::vector<EventType>& types,
                                                         EventCallback callback) {
    return m_dispatcher.subscribe(types, std::move(callback));
}

bool SessionManager::unsubscribe(SubscriptionId id) {
    return m_dispatcher.unsubscribe(id);
}

// ============================================
// Supervisor
// ============================================

bool SessionManager::stopping() {
    std::lock_guard<std::mutex> lock(m_workMutex);
    return m_stopping;
}

bool SessionManager::interruptibleWait(std::chrono::steady_clock::duration duration) {
    std::unique_lock<std::mutex> lock(m_workMutex);
    return !m_workCv.wait_for(lock, duration, [this]() { return m_stopping; });
}

void SessionManager::runSupervisor() {
    const std::chrono::seconds initialBackoff(std::max(1u, m_config.initialBackoffS));
    const std::chrono::seconds maxBackoff(std::max(m_config.initialBackoffS, m_config.maxBackoffS));
    std::chrono::seconds backoff = initialBackoff;
    bool retry = false;

    m_supervisorId.store(std::this_thread::get_id());
    LOG_INFO("[Session] Using HEOS device " << m_config.host << ":" << m_config.port);

    while (!stopping()) {
        // Wait before reconnection (skip on first attempt)
        if (retry) {
            LOG_WARN("[Session] Reconnecting in " << backoff.count() << "s...");
            if (!interruptibleWait(backoff)) break;
            backoff = std::min(backoff * 2, maxBackoff);
        }
        retry = true;

        setState(SessionState::Connecting);
        if (stopping()) break;
        HeosError error = m_transport.connect(m_config.host, m_config.port, m_config.connectTimeoutMs);
        if (error != HeosError::None) {
            if (stopping()) break;
            setState(SessionState::Disconnected, error);
            continue;
        }
        if (stopping()) {
            m_transport.close();
            break;
        }

        {
            std::lock_guard<std::mutex> lock(m_workMutex);
            m_connectionLost = false;
            m_work.clear();
        }
        m_correlator.reopen();
        m_reader = std::thread(&SessionManager::runReader, this);

        setState(SessionState::Authenticating);
        error = authenticate();
        if (error != HeosError::None) {
            teardownConnection();
            if (stopping()) break;
            setState(SessionState::Disconnected, error);
            if (error == HeosError::AuthError) {
                LOG_ERROR("[Session] HEOS account rejected the credentials, not retrying");
                break;
            }
            continue;
        }

        // Events may have been missed while disconnected: rebuild everything
        CommandResult primed = refresh();

        // Connected and primed, reset backoff
        backoff = initialBackoff;
        setState(SessionState::Ready);

        bool lost = runConnected(!primed.ok());
        teardownConnection();
        if (stopping()) break;

        if (lost) {
            LOG_WARN("[Session] Lost connection to HEOS device");
        } else {
            LOG_WARN("[Session] HEOS device stopped answering");
        }
        setState(SessionState::Degraded, HeosError::Disconnected);
    }

    m_running.store(false, std::memory_order_release);
    if (m_shutdown.load(std::memory_order_acquire)) {
        setState(SessionState::Disconnected);
    }
    LOG_DEBUG("[Session] Supervisor exiting");
    m_supervisorId.store(std::thread::id());
}

HeosError SessionManager::authenticate() {
    CommandResult result = m_commands.registerForChangeEvents(true);
    if (!result.ok()) {
        LOG_WARN("[Session] Event registration failed: " << toString(result.error)
                 << " " << result.errorText);
        return result.error == HeosError::CommandError ? HeosError::ProtocolError : result.error;
    }

    bool signedIn = false;
    std::string account;
    result = m_commands.checkAccount(signedIn, account);
    if (!result.ok()) {
        LOG_WARN("[Session] Account check failed: " << toString(result.error) << " " << result.errorText);
        return result.error == HeosError::CommandError ? HeosError::ProtocolError : result.error;
    }

    if (!m_config.username.empty() && !(signedIn && account == m_config.username)) {
        LOG_INFO("[Session] Signing in as " << m_config.username);
        result = m_commands.signIn(m_config.username, m_config.password);
        if (!result.ok()) {
            if (result.error == HeosError::CommandError) {
                LOG_ERROR("[Session] Sign-in failed (eid " << result.errorId << "): " << result.errorText);
                return HeosError::AuthError;
            }
            return result.error;
        }
        signedIn = true;
        account = m_config.username;
    }

    if (signedIn) {
        LOG_INFO("[Session] Signed in as " << account);
    } else {
        LOG_INFO("[Session] Not signed in to a HEOS account");
    }
    m_registry.setAccount(signedIn, account);
    return HeosError::None;
}

bool SessionManager::runConnected(bool refreshPending) {
    const auto heartbeatInterval = std::chrono::seconds(std::max(1u, m_config.heartbeatIntervalS));
    const auto refreshRetry = std::chrono::seconds(std::max(1u, m_config.refreshRetryS));
    const unsigned int failureLimit = std::max(1u, m_config.heartbeatFailureLimit);

    auto now = std::chrono::steady_clock::now();
    auto nextHeartbeat = now + heartbeatInterval;
    auto refreshAt = now + refreshRetry;
    unsigned int heartbeatFailures = 0;

    while (true) {
        std::deque<DeferredWork> work;
        {
            std::unique_lock<std::mutex> lock(m_workMutex);
            auto wakeAt = refreshPending ? std::min(nextHeartbeat, refreshAt) : nextHeartbeat;
            m_workCv.wait_until(lock, wakeAt, [this]() {
                return m_stopping || m_connectionLost || !m_work.empty();
            });
            if (m_stopping) return false;
            if (m_connectionLost) return true;
            work.swap(m_work);
        }
        now = std::chrono::steady_clock::now();

        for (const DeferredWork& item : work) {
            if (item.kind == WorkKind::RefreshAll) {
                refreshPending = true;
                refreshAt = now;
            } else if (!refreshPending) {
                runWork(item);
            }
        }

        if (refreshPending && std::chrono::steady_clock::now() >= refreshAt) {
            if (refresh().ok()) {
                refreshPending = false;
            } else {
                refreshAt = std::chrono::steady_clock::now() + refreshRetry;
                LOG_WARN("[Session] Retrying refresh in " << refreshRetry.count() << "s");
            }
        }

        if (std::chrono::steady_clock::now() >= nextHeartbeat) {
            CommandResult beat = m_commands.heartBeat();
            nextHeartbeat = std::chrono::steady_clock::now() + heartbeatInterval;
            if (beat.ok()) {
                heartbeatFailures = 0;
            } else {
                heartbeatFailures++;
                LOG_WARN("[Session] Heartbeat failed (" << heartbeatFailures << "/" << failureLimit
                         << "): " << toString(beat.error));
                if (heartbeatFailures >= failureLimit) {
                    return false;
                }
            }
        }
    }
}

void SessionManager::teardownConnection() {
    m_transport.close();
    if (m_reader.joinable()) {
        m_reader.join();
    }
    m_correlator.failAll(HeosError::Disconnected);

    std::lock_guard<std::mutex> lock(m_workMutex);
    m_work.clear();
    m_connectionLost = false;
}

// ============================================
// Reader
// ============================================

void SessionManager::runReader() {
    std::string line;
    while (true) {
        ReceiveStatus status = m_transport.receive(line);
        if (status == ReceiveStatus::Message) {
            m_dispatcher.dispatch(line);
            continue;
        }
        if (status == ReceiveStatus::ProtocolError) {
            LOG_ERROR("[Session] Framing error on HEOS connection, dropping it");
        }
        break;
    }

    m_correlator.failAll(HeosError::Disconnected);
    {
        std::lock_guard<std::mutex> lock(m_workMutex);
        m_connectionLost = true;
    }
    m_workCv.notify_all();
}

// ============================================
// Event application and deferred fetches
// ============================================

void SessionManager::handleEvent(const HeosEvent& event) {
    switch (m_registry.applyEvent(event)) {
        case ApplyResult::Applied:
            // Favorites follow the signed-in account
            if (event.type == EventType::UserChanged) {
                queueWork(WorkKind::RefreshFavorites);
            }
            return;

        case ApplyResult::Ignored:
            return;

        case ApplyResult::UnknownEntity:
            LOG_DEBUG("[Session] " << event.name << " references an unknown "
                      << (event.hasPid ? "player" : "group") << ", scheduling refresh");
            if (event.hasPid) {
                queueWork(WorkKind::RefreshAll, event.pid);
            } else {
                queueWork(WorkKind::RefreshAll, 0, event.gid);
            }
            return;

        case ApplyResult::NeedsFetch:
            break;
    }

    switch (event.type) {
        case EventType::GroupChanged:
            queueWork(WorkKind::RefreshGroups);
            break;
        case EventType::PlayersChanged:
            queueWork(WorkKind::RefreshAll);
            break;
        case EventType::SourcesChanged:
            queueWork(WorkKind::RefreshSources);
            queueWork(WorkKind::RefreshFavorites);
            break;
        case EventType::NowPlayingChanged:
            queueWork(WorkKind::RefreshNowPlaying, event.pid);
            break;
        default:
            break;
    }
}

void SessionManager::queueWork(WorkKind kind, int pid, int gid) {
    {
        std::lock_guard<std::mutex> lock(m_workMutex);
        for (const DeferredWork& queued : m_work) {
            if (queued.kind == kind && queued.pid == pid && queued.gid == gid) return;
        }
        m_work.push_back(DeferredWork{kind, pid, gid});
    }
    m_workCv.notify_all();
}

void SessionManager::dropSettledWork() {
    auto snap = m_registry.snapshot();
    std::lock_guard<std::mutex> lock(m_workMutex);

    // The events behind these were replayed onto the refreshed model
    auto settled = [&](const DeferredWork& work) {
        if (work.kind != WorkKind::RefreshAll) return false;
        return (work.pid != 0 && snap->findPlayer(work.pid))
            || (work.gid != 0 && snap->findGroup(work.gid));
    };
    const size_t before = m_work.size();
    m_work.erase(std::remove_if(m_work.begin(), m_work.end(), settled), m_work.end());
    if (m_work.size() != before) {
        LOG_DEBUG("[Session] Dropped " << (before - m_work.size()) << " refresh request(s) settled by refresh");
    }
}

void SessionManager::runWork(const DeferredWork& work) {
    CommandResult result;
    switch (work.kind) {
        case WorkKind::RefreshAll:
            result = refresh();
            break;
        case WorkKind::RefreshGroups:
            result = m_commands.refreshGroups();
            break;
        case WorkKind::RefreshNowPlaying:
            result = m_commands.refreshNowPlaying(work.pid);
            break;
        case WorkKind::RefreshSources:
            result = m_commands.refreshSources();
            break;
        case WorkKind::RefreshFavorites:
            result = m_commands.refreshFavorites();
            break;
    }
    if (!result.ok()) {
        LOG_WARN("[Session] Deferred fetch failed: " << toString(result.error) << " " << result.errorText);
    }
}

CommandResult SessionManager::refresh() {
    std::lock_guard<std::mutex> lock(m_refreshMutex);

    // Events arriving from here on are replayed over the enumerated state
    m_registry.beginRefresh();

    std::vector<Player> players;
    std::vector<Group> groups;
    CommandResult result = m_commands.enumerate(players, groups);
    if (!result.ok()) {
        m_registry.abandonRefresh();
        LOG_WARN("[Session] Refresh failed, keeping previous state: " << result.errorText);
        return result;
    }

    std::vector<SourceEntry> sources;
    CommandResult sourceResult = m_commands.getMusicSources(sources);
    if (sourceResult.ok()) {
        m_registry.replaceSources(sources);
    } else if (sourceResult.error == HeosError::CommandError) {
        LOG_WARN("[Session] Music sources unavailable: " << sourceResult.errorText);
    } else {
        m_registry.abandonRefresh();
        LOG_WARN("[Session] Refresh failed, keeping previous state: " << sourceResult.errorText);
        return CommandResult::failure(HeosError::RefreshError,
                                      std::string("sources: ") + toString(sourceResult.error));
    }

    CommandResult favoriteResult = m_commands.refreshFavorites();
    if (favoriteResult.error == HeosError::CommandError) {
        LOG_WARN("[Session] Favorites unavailable: " << favoriteResult.errorText);
    } else if (!favoriteResult.ok()) {
        m_registry.abandonRefresh();
        LOG_WARN("[Session] Refresh failed, keeping previous state: " << favoriteResult.errorText);
        return CommandResult::failure(HeosError::RefreshError,
                                      std::string("favorites: ") + toString(favoriteResult.error));
    }

    RegistryDiff diff;
    m_registry.replace(players, groups, &diff);
    dropSettledWork();

    for (int pid : diff.added) {
        m_dispatcher.publish(makePlayerEvent(EventType::PlayerAdded, pid));
    }
    for (int pid : diff.removed) {
        m_dispatcher.publish(makePlayerEvent(EventType::PlayerRemoved, pid));
    }

    LOG_INFO("[Session] Registry refreshed: " << players.size() << " player(s), "
             << groups.size() << " group(s)"
             << (diff.added.empty() ? "" : ", " + std::to_string(diff.added.size()) + " added")
             << (diff.removed.empty() ? "" : ", " + std::to_string(diff.removed.size()) + " removed"));
    return CommandResult();
}
