//
//  MockHeosDevice.cpp
//  heoslink Tests
//

#include "MockHeosDevice.h"
#include "HeosMessages.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>

#include <algorithm>
#include <cerrno>

namespace {

int attrInt(const AttributeMap& attrs, const std::string& key, int fallback = 0) {
    auto it = attrs.find(key);
    int value = fallback;
    if (it == attrs.end() || !parseInt(it->second, value)) return fallback;
    return value;
}

std::vector<int> idList(const std::string& text) {
    std::vector<int> ids;
    size_t start = 0;
    while (start < text.size()) {
        size_t comma = text.find(',', start);
        int id = 0;
        if (parseInt(text.substr(start, comma == std::string::npos ? std::string::npos : comma - start), id)) {
            ids.push_back(id);
        }
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return ids;
}

} // namespace

MockHeosDevice::MockHeosDevice() = default;

MockHeosDevice::~MockHeosDevice() {
    stop();
}

//==============================================================================
// Lifecycle
//==============================================================================

bool MockHeosDevice::start() {
    m_listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (m_listenFd < 0) return false;

    int reuse = 1;
    setsockopt(m_listenFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(m_listenFd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0
        || listen(m_listenFd, 4) < 0) {
        ::close(m_listenFd);
        m_listenFd = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    getsockname(m_listenFd, reinterpret_cast<struct sockaddr*>(&addr), &len);
    m_port = ntohs(addr.sin_port);

    m_running = true;
    m_thread = std::thread(&MockHeosDevice::run, this);
    return true;
}

void MockHeosDevice::stop() {
    m_running = false;
    if (m_thread.joinable()) m_thread.join();
    closeClient();
    if (m_listenFd >= 0) {
        ::close(m_listenFd);
        m_listenFd = -1;
    }
}

void MockHeosDevice::closeClient() {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_clientFd >= 0) {
        ::close(m_clientFd);
        m_clientFd = -1;
    }
}

void MockHeosDevice::run() {
    std::string buffer;

    while (m_running) {
        int client = -1;
        {
            std::lock_guard<std::mutex> lock(m_writeMutex);
            client = m_clientFd;
        }

        struct pollfd fds[2] = {{m_listenFd, POLLIN, 0}, {client, POLLIN, 0}};
        int rc = poll(fds, client >= 0 ? 2 : 1, 20);
        if (rc <= 0) continue;

        if (fds[0].revents & POLLIN) {
            int fd = accept(m_listenFd, nullptr, nullptr);
            if (fd >= 0) {
                closeClient();
                buffer.clear();
                {
                    std::lock_guard<std::mutex> lock(m_writeMutex);
                    m_clientFd = fd;
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                m_connections++;
                m_cv.notify_all();
            }
            continue;
        }

        if (client < 0 || !(fds[1].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        char chunk[4096];
        ssize_t n = recv(client, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            closeClient();
            buffer.clear();
            continue;
        }
        buffer.append(chunk, static_cast<size_t>(n));

        size_t nl;
        while ((nl = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, nl);
            buffer.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) handleRequest(line);
        }
    }
}

//==============================================================================
// Simulated system
//==============================================================================

void MockHeosDevice::addPlayer(int pid, const std::string& name, int volume) {
    std::lock_guard<std::mutex> lock(m_mutex);
    MockPlayer player;
    player.pid = pid;
    player.name = name;
    player.volume = volume;
    m_players[pid] = player;
}

void MockHeosDevice::removePlayer(int pid) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ungroup(pid);
    m_players.erase(pid);
}

void MockHeosDevice::setPlayerSong(int pid, const std::string& song) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_players[pid].song = song;
}

void MockHeosDevice::addGroup(int leader, const std::vector<int>& members) {
    std::lock_guard<std::mutex> lock(m_mutex);
    MockGroup group;
    group.gid = leader;
    group.leader = leader;
    group.members = members;
    m_groups[leader] = group;
}

void MockHeosDevice::ungroup(int pid) {
    for (auto it = m_groups.begin(); it != m_groups.end();) {
        MockGroup& group = it->second;
        if (group.leader == pid) {
            it = m_groups.erase(it);
            continue;
        }
        group.members.erase(std::remove(group.members.begin(), group.members.end(), pid),
                            group.members.end());
        if (group.members.empty()) {
            it = m_groups.erase(it);
        } else {
            ++it;
        }
    }
}

void MockHeosDevice::setAcceptSignIn(bool accept) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_acceptSignIn = accept;
}

void MockHeosDevice::setSilent(const std::string& command, bool silent) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (silent) {
        m_silent.insert(command);
    } else {
        m_silent.erase(command);
    }
}

void MockHeosDevice::setEmitGroupEvents(bool emit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_emitGroupEvents = emit;
}

void MockHeosDevice::setEmitVolumeEvents(bool emit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_emitVolumeEvents = emit;
}

void MockHeosDevice::setBrowseUnderProcess(bool interim) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_browseUnderProcess = interim;
}

void MockHeosDevice::changeVolumeBefore(const std::string& command, int pid, int level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_volumeChange.command = command;
    m_volumeChange.pid = pid;
    m_volumeChange.level = level;
}

//==============================================================================
// Raw access
//==============================================================================

void MockHeosDevice::sendRaw(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_clientFd < 0) return;
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(m_clientFd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

void MockHeosDevice::sendLine(const std::string& line) {
    sendRaw(line + "\r\n");
}

void MockHeosDevice::sendEvent(const std::string& name, const std::string& message) {
    sendLine(event(name, message));
}

void MockHeosDevice::dropConnection() {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    if (m_clientFd >= 0) {
        shutdown(m_clientFd, SHUT_RDWR);
    }
}

//==============================================================================
// Observation
//==============================================================================

size_t MockHeosDevice::requestCount(const std::string& command) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_counts.find(command);
    return it == m_counts.end() ? 0 : it->second;
}

std::vector<std::string> MockHeosDevice::requests() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests;
}

bool MockHeosDevice::waitForRequests(const std::string& command, size_t count,
                                     std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [&]() {
        auto it = m_counts.find(command);
        return it != m_counts.end() && it->second >= count;
    });
}

int MockHeosDevice::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connections;
}

bool MockHeosDevice::waitForConnections(int count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [&]() { return m_connections >= count; });
}

//==============================================================================
// Protocol
//==============================================================================

std::string MockHeosDevice::toLine(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string MockHeosDevice::reply(const std::string& command, const std::string& message,
                                  const Json::Value* payload) {
    Json::Value root;
    root["heos"]["command"] = command;
    root["heos"]["result"] = "success";
    root["heos"]["message"] = message;
    if (payload) root["payload"] = *payload;
    return toLine(root);
}

std::string MockHeosDevice::fail(const std::string& command, int eid, const std::string& text,
                                 const std::string& target) {
    Json::Value root;
    root["heos"]["command"] = command;
    root["heos"]["result"] = "fail";
    std::string message = "eid=" + std::to_string(eid) + "&text=" + text;
    if (!target.empty()) message += "&" + target;
    root["heos"]["message"] = message;
    return toLine(root);
}

std::string MockHeosDevice::event(const std::string& name, const std::string& message) {
    Json::Value root;
    root["heos"]["command"] = "event/" + name;
    root["heos"]["message"] = message;
    return toLine(root);
}

Json::Value MockHeosDevice::playersPayload() const {
    Json::Value list(Json::arrayValue);
    for (const auto& entry : m_players) {
        Json::Value node;
        node["name"] = entry.second.name;
        node["pid"] = entry.second.pid;
        node["model"] = "HEOS 1";
        node["version"] = "1.520.200";
        node["ip"] = "127.0.0.1";
        node["network"] = "wired";
        list.append(node);
    }
    return list;
}

Json::Value MockHeosDevice::groupsPayload() const {
    Json::Value list(Json::arrayValue);
    for (const auto& entry : m_groups) {
        const MockGroup& group = entry.second;
        Json::Value node;
        node["gid"] = std::to_string(group.gid);
        std::string name;
        Json::Value players(Json::arrayValue);

        Json::Value leader;
        auto it = m_players.find(group.leader);
        leader["name"] = it == m_players.end() ? "" : it->second.name;
        leader["pid"] = group.leader;
        leader["role"] = "leader";
        players.append(leader);
        name = leader["name"].asString();

        for (int pid : group.members) {
            Json::Value member;
            auto m = m_players.find(pid);
            member["name"] = m == m_players.end() ? "" : m->second.name;
            member["pid"] = pid;
            member["role"] = "member";
            players.append(member);
            name += " + " + member["name"].asString();
        }
        node["name"] = name;
        node["players"] = players;
        list.append(node);
    }
    return list;
}

void MockHeosDevice::handleRequest(const std::string& line) {
    const std::string scheme = HEOS_SCHEME;
    if (line.compare(0, scheme.size(), scheme) != 0) return;

    std::string rest = line.substr(scheme.size());
    size_t q = rest.find('?');
    std::string command = rest.substr(0, q);
    std::string query = (q == std::string::npos) ? std::string() : rest.substr(q + 1);

    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_requests.push_back(line);
        m_counts[command]++;
        m_cv.notify_all();
        if (m_silent.count(command)) return;
        out = respond(command, query);
    }
    for (const std::string& response : out) {
        sendLine(response);
    }
}

std::vector<std::string> MockHeosDevice::respond(const std::string& command, const std::string& query) {
    const AttributeMap attrs = parseAttributes(query);
    const int pid = attrInt(attrs, "pid");
    const std::string pidTarget = "pid=" + std::to_string(pid);
    std::vector<std::string> out;

    if (!m_volumeChange.command.empty() && m_volumeChange.command == command) {
        auto changed = m_players.find(m_volumeChange.pid);
        if (changed != m_players.end()) {
            changed->second.volume = m_volumeChange.level;
            out.push_back(event("player_volume_changed",
                                "pid=" + std::to_string(changed->first) + "&level="
                                + std::to_string(changed->second.volume) + "&mute="
                                + (changed->second.muted ? "on" : "off")));
        }
        m_volumeChange = VolumeChange();
    }

    auto player = m_players.find(pid);
    const bool playerCommand = command.compare(0, 7, "player/") == 0 && command != HeosCmd::GET_PLAYERS;
    if (playerCommand && player == m_players.end()) {
        out.push_back(fail(command, HeosEid::INVALID_ID, "ID Not Valid", pidTarget));
        return out;
    }

    if (command == HeosCmd::HEART_BEAT || command == HeosCmd::REGISTER_EVENTS) {
        out.push_back(reply(command, query));
    } else if (command == HeosCmd::CHECK_ACCOUNT) {
        out.push_back(reply(command, m_signedIn ? "signed_in&un=" + m_account : "signed_out"));
    } else if (command == HeosCmd::SIGN_IN) {
        if (!m_acceptSignIn) {
            out.push_back(fail(command, HeosEid::USER_NOT_FOUND, "User not found", ""));
        } else {
            auto un = attrs.find("un");
            m_signedIn = true;
            m_account = un == attrs.end() ? "" : un->second;
            out.push_back(reply(command, "signed_in&un=" + m_account));
        }
    } else if (command == HeosCmd::SIGN_OUT) {
        m_signedIn = false;
        out.push_back(reply(command, "signed_out"));
    } else if (command == HeosCmd::GET_PLAYERS) {
        Json::Value payload = playersPayload();
        out.push_back(reply(command, "", &payload));
    } else if (command == HeosCmd::GET_PLAY_STATE) {
        out.push_back(reply(command, pidTarget + "&state=" + player->second.state));
    } else if (command == HeosCmd::SET_PLAY_STATE) {
        auto state = attrs.find("state");
        player->second.state = state == attrs.end() ? "stop" : state->second;
        out.push_back(reply(command, query));
        out.push_back(event("player_state_changed", pidTarget + "&state=" + player->second.state));
    } else if (command == HeosCmd::GET_VOLUME) {
        out.push_back(reply(command, pidTarget + "&level=" + std::to_string(player->second.volume)));
    } else if (command == HeosCmd::SET_VOLUME) {
        player->second.volume = attrInt(attrs, "level", player->second.volume);
        out.push_back(reply(command, query));
        if (m_emitVolumeEvents) {
            out.push_back(event("player_volume_changed",
                                pidTarget + "&level=" + std::to_string(player->second.volume)
                                + "&mute=" + (player->second.muted ? "on" : "off")));
        }
    } else if (command == HeosCmd::GET_MUTE) {
        out.push_back(reply(command, pidTarget + "&state=" + (player->second.muted ? "on" : "off")));
    } else if (command == HeosCmd::GET_PLAY_MODE) {
        out.push_back(reply(command, pidTarget + "&repeat=off&shuffle=off"));
    } else if (command == HeosCmd::GET_NOW_PLAYING) {
        Json::Value payload(Json::objectValue);
        if (!player->second.song.empty()) {
            payload["type"] = "song";
            payload["song"] = player->second.song;
            payload["artist"] = "Artist";
            payload["album"] = "Album";
            payload["image_url"] = "";
            payload["mid"] = "m-" + player->second.song;
            payload["sid"] = 1;
        }
        out.push_back(reply(command, pidTarget, &payload));
    } else if (command.compare(0, 7, "player/") == 0) {
        out.push_back(reply(command, query));
    } else if (command == HeosCmd::GET_GROUPS) {
        Json::Value payload = groupsPayload();
        out.push_back(reply(command, "", &payload));
    } else if (command == HeosCmd::SET_GROUP) {
        auto ids = idList(attrs.count("pid") ? attrs.at("pid") : std::string());
        if (ids.empty()) {
            out.push_back(fail(command, HeosEid::WRONG_ARGUMENTS, "Missing pid", ""));
            return out;
        }
        const int leader = ids.front();
        ungroup(leader);
        if (ids.size() == 1) {
            out.push_back(reply(command, query));
        } else {
            MockGroup group;
            group.gid = leader;
            group.leader = leader;
            for (size_t i = 1; i < ids.size(); i++) {
                ungroup(ids[i]);
                group.members.push_back(ids[i]);
            }
            m_groups[leader] = group;
            out.push_back(reply(command, "gid=" + std::to_string(leader) + "&name=group&" + query));
        }
        if (m_emitGroupEvents) {
            out.push_back(event("groups_changed", ""));
        }
    } else if (command == HeosCmd::GET_GROUP_VOLUME || command == HeosCmd::GET_GROUP_MUTE) {
        const int gid = attrInt(attrs, "gid");
        const std::string gidTarget = "gid=" + std::to_string(gid);
        if (m_groups.count(gid) == 0) {
            out.push_back(fail(command, HeosEid::INVALID_ID, "ID Not Valid", gidTarget));
        } else if (command == HeosCmd::GET_GROUP_VOLUME) {
            auto leader = m_players.find(m_groups[gid].leader);
            int level = leader == m_players.end() ? 0 : leader->second.volume;
            out.push_back(reply(command, gidTarget + "&level=" + std::to_string(level)));
        } else {
            out.push_back(reply(command, gidTarget + "&state=off"));
        }
    } else if (command.compare(0, 6, "group/") == 0) {
        out.push_back(reply(command, query));
    } else if (command == HeosCmd::GET_MUSIC_SOURCES) {
        Json::Value payload(Json::arrayValue);
        Json::Value pandora;
        pandora["name"] = "Pandora";
        pandora["image_url"] = "";
        pandora["type"] = "music_service";
        pandora["sid"] = 1;
        pandora["available"] = "true";
        payload.append(pandora);
        Json::Value favorites;
        favorites["name"] = "Favorites";
        favorites["image_url"] = "";
        favorites["type"] = "heos_service";
        favorites["sid"] = HEOS_FAVORITES_SID;
        favorites["available"] = "true";
        payload.append(favorites);
        out.push_back(reply(command, "", &payload));
    } else if (command == HeosCmd::BROWSE) {
        const int sid = attrInt(attrs, "sid");
        const std::string sidTarget = "sid=" + std::to_string(sid);
        if (m_browseUnderProcess) {
            out.push_back(reply(command, std::string(HEOS_UNDER_PROCESS) + "&" + sidTarget));
        }
        if (sid == HEOS_FAVORITES_SID && !m_signedIn) {
            out.push_back(fail(command, HeosEid::NOT_LOGGED_IN, "User not logged in", sidTarget));
            return out;
        }
        Json::Value payload(Json::arrayValue);
        if (sid == HEOS_FAVORITES_SID) {
            Json::Value station;
            station["container"] = "no";
            station["mid"] = "s6707";
            station["type"] = "station";
            station["playable"] = "yes";
            station["name"] = "Jazz Radio";
            station["image_url"] = "";
            payload.append(station);
        }
        out.push_back(reply(command, sidTarget + "&returned=" + std::to_string(payload.size())
                                     + "&count=" + std::to_string(payload.size()), &payload));
    } else if (command.compare(0, 7, "browse/") == 0) {
        out.push_back(reply(command, query));
    } else {
        out.push_back(fail(command, HeosEid::UNRECOGNIZED_COMMAND, "Unrecognized Command", ""));
    }
    return out;
}
