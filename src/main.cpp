/**
 * @file main.cpp
 * @brief Main entry point for heoslink
 *
 * Command-line front end for the HEOS session core: lists players and
 * groups, runs one control action, or follows the event stream.
 */

#include "Config.h"
#include "HeosDiscovery.h"
#include "HeosMessages.h"
#include "LogLevel.h"
#include "SessionManager.h"

#include <iostream>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <iomanip>
#include <cstdlib>
#include <string>
#include <vector>

#define HEOSLINK_VERSION "0.1.0"

// ============================================
// Signal Handling
// ============================================

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\nSignal " << signal << " received, shutting down..." << std::endl;
    g_running.store(false, std::memory_order_release);
}

// ============================================
// CLI Parsing
// ============================================

namespace {

int requireInt(const char* option, const char* value) {
    int result = 0;
    if (!parseInt(value, result)) {
        std::cerr << "Invalid number for " << option << ": " << value << std::endl;
        exit(1);
    }
    return result;
}

std::vector<int> parseIdList(const char* option, const std::string& text) {
    std::vector<int> ids;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string item = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        ids.push_back(requireInt(option, item.c_str()));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return ids;
}

void printUsage(const char* argv0) {
    std::cout << "heoslink - HEOS multi-room audio control\n\n"
              << "Usage: " << argv0 << " [options]\n\n"
              << "HEOS Connection:\n"
              << "  -s, --server <ip>        HEOS device address (auto-discover if omitted)\n"
              << "  -p, --port <port>        CLI port (default: 1255)\n"
              << "  -u, --user <name>        HEOS account (default: stay signed out)\n"
              << "  -w, --password <pw>      HEOS account password\n"
              << "  --timeout <ms>           Command timeout (default: 10000)\n"
              << "\n"
              << "Actions:\n"
              << "  -l, --list               List players and groups and exit\n"
              << "  --volume <pid> <level>   Set player volume (0-100)\n"
              << "  --play <pid>             Start playback\n"
              << "  --pause <pid>            Pause playback\n"
              << "  --stop <pid>             Stop playback\n"
              << "  --group <leader> <pids>  Group players (comma-separated members)\n"
              << "  --ungroup <gid>          Dissolve a group\n"
              << "  (no action: follow events until Ctrl+C)\n"
              << "\n"
              << "Logging:\n"
              << "  -v, --verbose            Debug output (log level: DEBUG)\n"
              << "  -q, --quiet              Errors and warnings only (log level: WARN)\n"
              << "\n"
              << "Other:\n"
              << "  -V, --version            Show version information\n"
              << "  -h, --help               Show this help\n"
              << "\n"
              << "Examples:\n"
              << "  " << argv0 << "                                   # Discover and follow events\n"
              << "  " << argv0 << " -s 192.168.1.20 --list\n"
              << "  " << argv0 << " -s 192.168.1.20 --group 101 102,103\n"
              << std::endl;
}

} // namespace

Config parseArguments(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if ((arg == "--server" || arg == "-s") && i + 1 < argc) {
            config.host = argv[++i];
        }
        else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            int port = requireInt("--port", argv[++i]);
            if (port < 1 || port > 65535) {
                std::cerr << "Invalid port. Must be 1-65535" << std::endl;
                exit(1);
            }
            config.port = static_cast<uint16_t>(port);
        }
        else if ((arg == "--user" || arg == "-u") && i + 1 < argc) {
            config.username = argv[++i];
        }
        else if ((arg == "--password" || arg == "-w") && i + 1 < argc) {
            config.password = argv[++i];
        }
        else if (arg == "--timeout" && i + 1 < argc) {
            int timeout = requireInt("--timeout", argv[++i]);
            if (timeout < 100) {
                std::cerr << "Invalid timeout. Must be >= 100 ms" << std::endl;
                exit(1);
            }
            config.commandTimeoutMs = static_cast<unsigned int>(timeout);
        }
        else if (arg == "--list" || arg == "-l") {
            config.listOnly = true;
        }
        else if (arg == "--volume" && i + 2 < argc) {
            config.action = "volume";
            config.actionTarget = requireInt("--volume", argv[++i]);
            config.actionLevel = requireInt("--volume", argv[++i]);
        }
        else if ((arg == "--play" || arg == "--pause" || arg == "--stop") && i + 1 < argc) {
            config.action = arg.substr(2);
            config.actionTarget = requireInt(arg.c_str(), argv[++i]);
        }
        else if (arg == "--group" && i + 2 < argc) {
            config.action = "group";
            config.actionTarget = requireInt("--group", argv[++i]);
            config.actionMembers = parseIdList("--group", argv[++i]);
        }
        else if (arg == "--ungroup" && i + 1 < argc) {
            config.action = "ungroup";
            config.actionTarget = requireInt("--ungroup", argv[++i]);
        }
        else if (arg == "--version" || arg == "-V") {
            config.showVersion = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--quiet" || arg == "-q") {
            config.quiet = true;
        }
        else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            exit(0);
        }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            exit(1);
        }
    }

    return config;
}

// ============================================
// Output
// ============================================

void printSystem(const SessionManager& session) {
    auto snap = session.registry().snapshot();

    std::cout << "\nPlayers (" << snap->players.size() << "):\n";
    for (const auto& entry : snap->players) {
        const Player& p = entry.second;
        std::cout << "  " << std::setw(12) << p.pid << "  " << p.name
                  << " [" << p.model << "]"
                  << (p.online ? "" : "  offline")
                  << "  " << toString(p.state)
                  << "  vol " << p.volume << (p.muted ? " (muted)" : "");
        if (!p.nowPlaying.title.empty()) {
            std::cout << "  \"" << p.nowPlaying.title << "\"";
            if (!p.nowPlaying.artist.empty()) std::cout << " - " << p.nowPlaying.artist;
        }
        std::cout << "\n";
    }

    std::cout << "\nGroups (" << snap->groups.size() << "):\n";
    for (const auto& entry : snap->groups) {
        const Group& g = entry.second;
        std::cout << "  " << std::setw(12) << g.gid << "  " << g.name
                  << "  leader " << g.leaderId << ", members";
        for (int pid : g.memberIds) std::cout << " " << pid;
        std::cout << "  vol " << g.volume << (g.muted ? " (muted)" : "") << "\n";
    }

    if (!snap->sources.empty()) {
        std::cout << "\nMusic sources (" << snap->sources.size() << "):\n";
        for (const SourceEntry& s : snap->sources) {
            std::cout << "  " << std::setw(12) << s.sourceId << "  " << s.name
                      << (s.available ? "" : " (unavailable)") << "\n";
        }
    }

    if (!snap->favorites.empty()) {
        std::cout << "\nFavorites (" << snap->favorites.size() << "):\n";
        for (const SourceEntry& f : snap->favorites) {
            std::cout << "  " << std::setw(12) << (f.mediaId.empty() ? f.containerId : f.mediaId)
                      << "  " << f.name << "\n";
        }
    }
    std::cout << std::endl;
}

void logEvent(const HeosEvent& event) {
    std::string detail;
    if (event.hasPid) detail += " pid=" + std::to_string(event.pid);
    if (event.hasGid) detail += " gid=" + std::to_string(event.gid);
    if (event.hasState) detail += std::string(" state=") + toString(event.state);
    if (event.hasRepeat) detail += std::string(" repeat=") + toString(event.repeat);
    if (event.hasShuffle) detail += std::string(" shuffle=") + (event.shuffle ? "on" : "off");
    if (event.hasLevel) detail += " level=" + std::to_string(event.level);
    if (event.hasMute) detail += std::string(" mute=") + (event.mute ? "on" : "off");
    if (event.hasProgress) {
        detail += " pos=" + std::to_string(event.positionMs / 1000) + "s/"
                + std::to_string(event.durationMs / 1000) + "s";
    }
    if (!event.error.empty()) detail += " error=" + event.error;
    LOG_INFO("[Event] " << toString(event.type) << detail);
}

// ============================================
// Actions
// ============================================

bool waitUntilReady(SessionManager& session, std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (g_running.load(std::memory_order_acquire)) {
        if (session.waitForState(SessionState::Ready, std::chrono::milliseconds(200))) {
            return true;
        }
        if (session.lastError() == HeosError::AuthError) {
            std::cerr << "Error: HEOS account sign-in rejected" << std::endl;
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "Error: HEOS device did not become ready" << std::endl;
            return false;
        }
    }
    return false;
}

int runAction(SessionManager& session, const Config& config) {
    HeosCommands& commands = session.commands();
    CommandResult result;

    if (config.action == "volume") {
        result = commands.setVolume(config.actionTarget, config.actionLevel);
    } else if (config.action == "play") {
        result = commands.play(config.actionTarget);
    } else if (config.action == "pause") {
        result = commands.pause(config.actionTarget);
    } else if (config.action == "stop") {
        result = commands.stop(config.actionTarget);
    } else if (config.action == "group") {
        result = commands.createGroup(config.actionTarget, config.actionMembers);
    } else if (config.action == "ungroup") {
        result = commands.dissolveGroup(config.actionTarget);
    } else {
        std::cerr << "Unknown action: " << config.action << std::endl;
        return 1;
    }

    if (!result.ok()) {
        std::cerr << "Error: " << config.action << " failed: " << toString(result.error);
        if (!result.errorText.empty()) std::cerr << " (" << result.errorText << ")";
        std::cerr << std::endl;
        return 1;
    }
    std::cout << config.action << ": ok" << std::endl;
    return 0;
}

// ============================================
// Main
// ============================================

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Config config = parseArguments(argc, argv);

    // Apply log level
    if (config.verbose) {
        g_logLevel = LogLevel::DEBUG;
        LOG_INFO("Verbose mode enabled (log level: DEBUG)");
    } else if (config.quiet) {
        g_logLevel = LogLevel::WARN;
    }

    if (config.showVersion) {
        std::cout << "heoslink " << HEOSLINK_VERSION << std::endl;
        std::cout << "Build:    " << __DATE__ << " " << __TIME__ << std::endl;
        return 0;
    }

    // Autodiscover a HEOS device if not specified
    if (config.host.empty()) {
        std::cout << "No HEOS device specified, searching..." << std::endl;
        config.host = discoverHeosDevice(config.discoveryTimeoutS, config.discoveryRetries);
        if (config.host.empty()) {
            std::cerr << "Error: Could not discover a HEOS device" << std::endl;
            std::cerr << "Specify manually with -s <ip>" << std::endl;
            return 1;
        }
    }

    SessionManager session(config);
    if (!session.start()) {
        return 1;
    }

    const auto readyTimeout = std::chrono::seconds(config.connectTimeoutMs / 1000 + 30);
    const bool oneShot = config.listOnly || !config.action.empty();

    int exitCode = 0;
    if (oneShot) {
        if (!waitUntilReady(session, readyTimeout)) {
            session.shutdown();
            return 1;
        }
        if (!config.action.empty()) {
            exitCode = runAction(session, config);
        }
        if (config.listOnly) {
            printSystem(session);
        }
        session.shutdown();
        return exitCode;
    }

    // Follow mode: log everything until Ctrl+C
    session.subscribe(std::vector<EventType>{
        EventType::PlayerStateChanged, EventType::NowPlayingChanged, EventType::VolumeChanged,
        EventType::GroupChanged, EventType::PlayerAdded, EventType::PlayerRemoved,
        EventType::SourcesChanged, EventType::SystemError, EventType::PlayersChanged,
        EventType::QueueChanged, EventType::UserChanged}, logEvent);

    bool printed = false;
    std::cout << "(Press Ctrl+C to stop)" << std::endl;
    while (g_running.load(std::memory_order_acquire)) {
        if (session.waitForState(SessionState::Ready, std::chrono::milliseconds(200))) {
            if (!printed) {
                printSystem(session);
                printed = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        } else if (session.lastError() == HeosError::AuthError
                   && session.state() == SessionState::Disconnected) {
            std::cerr << "Error: HEOS account sign-in rejected" << std::endl;
            exitCode = 1;
            break;
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    session.shutdown();
    return exitCode;
}
