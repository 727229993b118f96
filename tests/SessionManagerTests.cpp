//
//  SessionManagerTests.cpp
//  heoslink Tests
//
//  End-to-end session behaviour against the loopback device: priming,
//  event-driven updates, grouping, reconnection and shutdown.
//

#include <gtest/gtest.h>

#include "SessionManager.h"
#include "mocks/MockHeosDevice.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

class StateLog {
public:
    void add(SessionState state, HeosError error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back({state, error});
        m_cv.notify_all();
    }

    bool waitFor(SessionState state, size_t times, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]() { return count(state) >= times; });
    }

    bool waitForError(HeosError error, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]() {
            for (const auto& entry : m_entries) {
                if (entry.second == error) return true;
            }
            return false;
        });
    }

    size_t countOf(SessionState state) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return count(state);
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<std::pair<SessionState, HeosError>> m_entries;

    size_t count(SessionState state) const {
        size_t n = 0;
        for (const auto& entry : m_entries) {
            if (entry.first == state) n++;
        }
        return n;
    }
};

class EventLog {
public:
    void add(const HeosEvent& event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
        m_cv.notify_all();
    }

    bool waitFor(EventType type, int pid, std::chrono::milliseconds timeout = 3000ms) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [&]() {
            for (const auto& event : m_events) {
                if (event.type == type && event.pid == pid) return true;
            }
            return false;
        });
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<HeosEvent> m_events;
};

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

} // namespace

class SessionManagerTests : public ::testing::Test {
protected:
    MockHeosDevice device;
    Config config;
    StateLog states;
    EventLog events;
    std::unique_ptr<SessionManager> session;

    void SetUp() override {
        device.addPlayer(1, "Kitchen", 20);
        device.addPlayer(2, "Living", 30);
        device.addPlayer(3, "Office", 40);
        device.addGroup(1, {2});
        ASSERT_TRUE(device.start());

        config.host = "127.0.0.1";
        config.port = device.port();
        config.connectTimeoutMs = 1000;
        config.commandTimeoutMs = 500;
        config.groupGracePeriodMs = 300;
        config.heartbeatIntervalS = 1;
        config.heartbeatFailureLimit = 2;
        config.initialBackoffS = 1;
        config.maxBackoffS = 2;
        config.refreshRetryS = 1;
    }

    void TearDown() override {
        if (session) session->shutdown();
        device.stop();
    }

    void startSession() {
        session.reset(new SessionManager(config));
        session->onStateChanged([this](SessionState state, HeosError error) { states.add(state, error); });
        ASSERT_TRUE(session->start());
    }

    void startReady() {
        startSession();
        ASSERT_TRUE(session->waitForState(SessionState::Ready, 5000ms));
    }

    int volumeOf(int pid) {
        Player p;
        return session->registry().findPlayer(pid, p) ? p.volume : -1;
    }
};

//==============================================================================
// Lifecycle
//==============================================================================

TEST_F(SessionManagerTests, ReadyImpliesPopulatedRegistry) {
    startReady();

    auto players = session->listPlayers();
    ASSERT_EQ(players.size(), 3u);
    EXPECT_EQ(players[1].name, "Living");
    EXPECT_EQ(players[1].volume, 30);

    auto groups = session->listGroups();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].leaderId, 1);
    EXPECT_EQ(groups[0].memberIds, std::vector<int>{2});
    EXPECT_EQ(groups[0].volume, 20);

    EXPECT_EQ(session->listSources().size(), 2u);
    EXPECT_EQ(device.requestCount("system/register_for_change_events"), 1u);
    EXPECT_EQ(session->lastError(), HeosError::None);
}

TEST_F(SessionManagerTests, StartRequiresHost) {
    config.host.clear();
    session.reset(new SessionManager(config));
    EXPECT_FALSE(session->start());
    EXPECT_EQ(session->state(), SessionState::Disconnected);
}

TEST_F(SessionManagerTests, CommandsBeforeConnectAreDisconnected) {
    session.reset(new SessionManager(config));
    EXPECT_EQ(session->commands().heartBeat().error, HeosError::Disconnected);
}

TEST_F(SessionManagerTests, SignsInWithCredentials) {
    config.username = "me@example.com";
    config.password = "secret";
    startReady();

    EXPECT_EQ(device.requestCount("system/sign_in"), 1u);
    EXPECT_TRUE(session->registry().snapshot()->signedIn);
    EXPECT_EQ(session->registry().snapshot()->username, "me@example.com");
}

TEST_F(SessionManagerTests, RejectedCredentialsAreTerminal) {
    config.username = "me@example.com";
    config.password = "wrong";
    device.setAcceptSignIn(false);
    startSession();

    ASSERT_TRUE(states.waitForError(HeosError::AuthError, 5000ms));
    EXPECT_TRUE(eventually([&]() { return session->state() == SessionState::Disconnected; }));
    EXPECT_EQ(session->lastError(), HeosError::AuthError);

    // Backoff is one second; no retry may follow
    std::this_thread::sleep_for(2500ms);
    EXPECT_EQ(device.connectionCount(), 1);
    EXPECT_EQ(states.countOf(SessionState::Ready), 0u);
}

TEST_F(SessionManagerTests, ShutdownFromReady) {
    startReady();
    session->shutdown();

    EXPECT_EQ(session->state(), SessionState::Disconnected);
    EXPECT_EQ(session->commands().heartBeat().error, HeosError::Disconnected);
    EXPECT_FALSE(session->start());
    session->shutdown();
}

TEST_F(SessionManagerTests, ShutdownFromStateCallback) {
    session.reset(new SessionManager(config));
    SessionManager* raw = session.get();
    std::atomic<bool> requested{false};
    session->onStateChanged([this, raw, &requested](SessionState state, HeosError error) {
        states.add(state, error);
        if (state == SessionState::Ready && !requested.exchange(true)) {
            raw->shutdown();
        }
    });
    ASSERT_TRUE(session->start());

    ASSERT_TRUE(states.waitFor(SessionState::Ready, 1, 5000ms));
    ASSERT_TRUE(states.waitFor(SessionState::Disconnected, 1, 3000ms));
    EXPECT_EQ(session->commands().heartBeat().error, HeosError::Disconnected);
    EXPECT_FALSE(session->start());

    // Destruction joins the supervisor that stopped itself
    session.reset();
    EXPECT_EQ(device.connectionCount(), 1);
    EXPECT_EQ(states.countOf(SessionState::Disconnected), 1u);
}

//==============================================================================
// Events
//==============================================================================

TEST_F(SessionManagerTests, CommandEffectVisibleOnlyAfterEvent) {
    startReady();
    device.setEmitVolumeEvents(false);

    session->subscribe(EventType::VolumeChanged, [&](const HeosEvent& e) { events.add(e); });

    ASSERT_TRUE(session->commands().setVolume(1, 55).ok());
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(volumeOf(1), 20);

    device.sendEvent("player_volume_changed", "pid=1&level=55&mute=off");
    ASSERT_TRUE(events.waitFor(EventType::VolumeChanged, 1));
    EXPECT_EQ(volumeOf(1), 55);
}

TEST_F(SessionManagerTests, UnknownPlayerEventTriggersRefresh) {
    startReady();
    const size_t before = device.requestCount("player/get_players");

    device.addPlayer(4, "Porch", 10);
    device.sendEvent("player_volume_changed", "pid=4&level=10&mute=off");

    ASSERT_TRUE(device.waitForRequests("player/get_players", before + 1, 3000ms));
    EXPECT_TRUE(eventually([&]() { return volumeOf(4) == 10; }));
}

TEST_F(SessionManagerTests, NowPlayingEventFetchesMedia) {
    startReady();
    device.setPlayerSong(3, "Blue in Green");
    device.sendEvent("player_now_playing_changed", "pid=3");

    EXPECT_TRUE(eventually([&]() {
        Player p;
        return session->registry().findPlayer(3, p) && p.nowPlaying.title == "Blue in Green";
    }));
    Player p;
    ASSERT_TRUE(session->registry().findPlayer(3, p));
    EXPECT_EQ(p.nowPlaying.sourceName, "Pandora");
}

TEST_F(SessionManagerTests, PlayersChangedPublishesAddAndRemove) {
    startReady();
    session->subscribe({EventType::PlayerAdded, EventType::PlayerRemoved},
                       [&](const HeosEvent& e) { events.add(e); });

    device.addPlayer(5, "Garage");
    device.removePlayer(3);
    device.sendEvent("players_changed", "");

    EXPECT_TRUE(events.waitFor(EventType::PlayerAdded, 5));
    EXPECT_TRUE(events.waitFor(EventType::PlayerRemoved, 3));
    Player p;
    EXPECT_FALSE(session->registry().findPlayer(3, p));
}

//==============================================================================
// Refresh
//==============================================================================

TEST_F(SessionManagerTests, RefreshIsExactAndIdempotent) {
    startReady();
    const std::string first = session->registry().serialize();

    ASSERT_TRUE(session->refresh().ok());
    EXPECT_EQ(session->registry().serialize(), first);

    device.removePlayer(2);
    ASSERT_TRUE(session->refresh().ok());
    auto players = session->listPlayers();
    ASSERT_EQ(players.size(), 2u);
    EXPECT_EQ(players[0].pid, 1);
    EXPECT_EQ(players[1].pid, 3);
    EXPECT_TRUE(session->listGroups().empty());
}

TEST_F(SessionManagerTests, EventDuringRefreshSurvivesIt) {
    startReady();
    ASSERT_EQ(volumeOf(1), 20);

    // Player 1 changes after its get_volume answer, before the refresh ends
    device.changeVolumeBefore("group/get_groups", 1, 55);
    ASSERT_TRUE(session->refresh().ok());
    EXPECT_EQ(volumeOf(1), 55);

    ASSERT_TRUE(session->refresh().ok());
    EXPECT_EQ(volumeOf(1), 55);
}

TEST_F(SessionManagerTests, EventsDuringPrimingNeedNoSecondRefresh) {
    device.changeVolumeBefore("group/get_groups", 1, 55);
    startReady();

    EXPECT_EQ(volumeOf(1), 55);

    // Past at least one heartbeat, where queued work would have run
    ASSERT_TRUE(device.waitForRequests("system/heart_beat", 1, 3000ms));
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(device.requestCount("player/get_players"), 1u);
}

TEST_F(SessionManagerTests, FavoritesFollowAccount) {
    config.username = "me@example.com";
    config.password = "secret";
    startReady();

    auto favorites = session->listFavorites();
    ASSERT_EQ(favorites.size(), 1u);
    EXPECT_EQ(favorites[0].name, "Jazz Radio");
    EXPECT_TRUE(favorites[0].playable);

    device.sendEvent("user_changed", "signed_out");
    EXPECT_TRUE(eventually([&]() { return session->listFavorites().empty(); }));
    EXPECT_FALSE(session->registry().snapshot()->signedIn);
}

TEST_F(SessionManagerTests, NoFavoritesWithoutAccount) {
    startReady();
    EXPECT_TRUE(session->listFavorites().empty());
    EXPECT_EQ(device.requestCount("browse/browse"), 0u);
}

TEST_F(SessionManagerTests, SourcesChangedReloadsFavorites) {
    config.username = "me@example.com";
    config.password = "secret";
    startReady();
    const size_t before = device.requestCount("browse/browse");

    device.sendEvent("sources_changed", "");
    ASSERT_TRUE(device.waitForRequests("browse/browse", before + 1, 3000ms));
    EXPECT_TRUE(device.waitForRequests("browse/get_music_sources", 2, 3000ms));
}

TEST_F(SessionManagerTests, FailedRefreshKeepsRegistry) {
    startReady();
    const std::string before = session->registry().serialize();

    device.setSilent("player/get_players", true);
    CommandResult r = session->refresh();
    EXPECT_EQ(r.error, HeosError::RefreshError);
    EXPECT_EQ(session->registry().serialize(), before);
}

//==============================================================================
// Grouping
//==============================================================================

TEST_F(SessionManagerTests, InvalidGroupSendsNothing) {
    startReady();
    const std::string before = session->registry().serialize();

    EXPECT_EQ(session->commands().createGroup(3, {2}).error, HeosError::InvalidGroup);
    EXPECT_EQ(session->commands().createGroup(3, {99}).error, HeosError::InvalidGroup);

    EXPECT_EQ(device.requestCount("group/set_group"), 0u);
    EXPECT_EQ(session->registry().serialize(), before);
}

TEST_F(SessionManagerTests, CreateGroupConfirmedByEvent) {
    device.addPlayer(4, "Porch");
    config.groupGracePeriodMs = 3000;
    startReady();
    const size_t before = device.requestCount("group/get_groups");

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(session->commands().createGroup(3, {4}).ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2500ms);

    Group g;
    ASSERT_TRUE(session->registry().findGroup(3, g));
    EXPECT_EQ(g.memberIds, std::vector<int>{4});
    EXPECT_EQ(session->listGroups().size(), 2u);
    EXPECT_GT(device.requestCount("group/get_groups"), before);
}

TEST_F(SessionManagerTests, CreateGroupWithoutEventRefetches) {
    device.addPlayer(4, "Porch");
    startReady();
    device.setEmitGroupEvents(false);
    const size_t before = device.requestCount("group/get_groups");

    ASSERT_TRUE(session->commands().createGroup(3, {4}).ok());

    EXPECT_EQ(device.requestCount("group/get_groups"), before + 1);
    Group g;
    ASSERT_TRUE(session->registry().findGroup(3, g));
    EXPECT_EQ(g.memberIds, std::vector<int>{4});
}

TEST_F(SessionManagerTests, LeaderMayExtendItsGroup) {
    device.addPlayer(4, "Porch");
    startReady();

    ASSERT_TRUE(session->commands().createGroup(1, {2, 4}).ok());
    Group g;
    ASSERT_TRUE(session->registry().findGroup(1, g));
    EXPECT_EQ(g.memberIds, (std::vector<int>{2, 4}));
}

TEST_F(SessionManagerTests, DissolveGroup) {
    startReady();
    ASSERT_TRUE(session->commands().dissolveGroup(1).ok());
    EXPECT_TRUE(session->listGroups().empty());
}

//==============================================================================
// Connection loss
//==============================================================================

TEST_F(SessionManagerTests, DropResolvesOutstandingAndReconnects) {
    startReady();
    device.setSilent("player/set_volume", true);

    std::vector<std::future<CommandResult>> results;
    for (int pid = 1; pid <= 3; ++pid) {
        results.push_back(std::async(std::launch::async, [this, pid]() {
            return session->commands().setVolume(pid, 50);
        }));
    }
    ASSERT_TRUE(device.waitForRequests("player/set_volume", 3, 2000ms));

    device.dropConnection();

    for (auto& result : results) {
        ASSERT_EQ(result.wait_for(2000ms), std::future_status::ready);
        EXPECT_EQ(result.get().error, HeosError::Disconnected);
    }

    ASSERT_TRUE(states.waitFor(SessionState::Degraded, 1, 3000ms));
    ASSERT_TRUE(states.waitFor(SessionState::Ready, 2, 6000ms));
    EXPECT_EQ(device.connectionCount(), 2);
    EXPECT_EQ(session->listPlayers().size(), 3u);
}

TEST_F(SessionManagerTests, MissedHeartbeatsForceReconnect) {
    startReady();
    device.setSilent("system/heart_beat", true);

    ASSERT_TRUE(states.waitFor(SessionState::Degraded, 1, 6000ms));
    EXPECT_TRUE(device.waitForConnections(2, 4000ms));
    EXPECT_GE(device.requestCount("system/heart_beat"), 2u);
}
