/**
 * @file HeosDiscovery.cpp
 * @brief SSDP discovery of HEOS devices
 */

#include "HeosDiscovery.h"
#include "LogLevel.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace {

std::string toLower(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::string();
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string buildSearch() {
    std::string request = "M-SEARCH * HTTP/1.1\r\n";
    request += "HOST: ";
    request += SSDP_MULTICAST_ADDR;
    request += ":" + std::to_string(SSDP_PORT) + "\r\n";
    request += "MAN: \"ssdp:discover\"\r\n";
    request += "MX: 2\r\n";
    request += "ST: ";
    request += HEOS_SSDP_TARGET;
    request += "\r\n\r\n";
    return request;
}

} // namespace

std::string ssdpHeader(const std::string& response, const std::string& name) {
    const std::string wanted = toLower(name);
    size_t pos = 0;
    while (pos < response.size()) {
        size_t eol = response.find('\n', pos);
        std::string line = response.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos && toLower(trim(line.substr(0, colon))) == wanted) {
            return trim(line.substr(colon + 1));
        }
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return std::string();
}

std::string hostFromLocation(const std::string& location) {
    size_t start = location.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    size_t end = location.find_first_of(":/", start);
    return location.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string discoverHeosDevice(int timeoutSec, int retries) {
    const std::string request = buildSearch();

    for (int attempt = 0; attempt < retries; attempt++) {
        int sock = socket(AF_INET, SOCK_DGRAM, 0);
        if (sock < 0) {
            LOG_ERROR("[Discovery] Failed to create socket: " << strerror(errno));
            return "";
        }

        int ttl = 2;
        setsockopt(sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

        struct sockaddr_in groupAddr{};
        groupAddr.sin_family = AF_INET;
        groupAddr.sin_port = htons(SSDP_PORT);
        inet_pton(AF_INET, SSDP_MULTICAST_ADDR, &groupAddr.sin_addr);

        ssize_t sent = sendto(sock, request.data(), request.size(), 0,
                              reinterpret_cast<struct sockaddr*>(&groupAddr), sizeof(groupAddr));
        if (sent < 0) {
            LOG_WARN("[Discovery] M-SEARCH send failed: " << strerror(errno));
        }

        // Collect answers until one is a HEOS device or the attempt times out
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSec);
        while (sent >= 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) break;

            struct pollfd pfd = {sock, POLLIN, 0};
            if (poll(&pfd, 1, static_cast<int>(remaining)) <= 0) break;

            char buf[2048];
            struct sockaddr_in deviceAddr{};
            socklen_t slen = sizeof(deviceAddr);
            ssize_t n = recvfrom(sock, buf, sizeof(buf) - 1, 0,
                                 reinterpret_cast<struct sockaddr*>(&deviceAddr), &slen);
            if (n <= 0) continue;

            std::string response(buf, static_cast<size_t>(n));
            if (ssdpHeader(response, "ST") != HEOS_SSDP_TARGET) {
                LOG_DEBUG("[Discovery] Ignoring non-HEOS SSDP answer");
                continue;
            }

            std::string ip = hostFromLocation(ssdpHeader(response, "LOCATION"));
            if (ip.empty()) {
                char addr[INET_ADDRSTRLEN] = {};
                inet_ntop(AF_INET, &deviceAddr.sin_addr, addr, sizeof(addr));
                ip = addr;
            }
            ::close(sock);
            LOG_INFO("[Discovery] Found HEOS device at " << ip
                     << " (attempt " << (attempt + 1) << ")");
            return ip;
        }
        ::close(sock);

        if (attempt < retries - 1) {
            LOG_DEBUG("[Discovery] Attempt " << (attempt + 1) << " timed out, retrying...");
        }
    }
    return "";
}
