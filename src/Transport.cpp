/**
 * @file Transport.cpp
 * @brief Line-framed TCP transport implementation
 */

#include "Transport.h"
#include "LogLevel.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>

#include <cerrno>
#include <cstring>

Transport::Transport(size_t maxMessageBytes)
    : m_maxMessageBytes(maxMessageBytes)
{
}

Transport::~Transport() {
    close();
    releaseSocket();
}

// ============================================
// Connection Management
// ============================================

HeosError Transport::connect(const std::string& host, uint16_t port, unsigned int timeoutMs) {
    close();
    releaseSocket();

    m_host = host;
    m_port = port;
    m_buffer.clear();
    m_scanPos = 0;

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        LOG_ERROR("[Transport] Cannot resolve " << host << ": " << gai_strerror(rc));
        return HeosError::ConnectError;
    }

    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        LOG_ERROR("[Transport] Failed to create socket: " << strerror(errno));
        freeaddrinfo(res);
        return HeosError::ConnectError;
    }

    // Low latency for short command lines
    int flag = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));

    // Non-blocking connect so the timeout is honoured
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);

    LOG_DEBUG("[Transport] Connecting to " << host << ":" << port);

    rc = ::connect(sock, res->ai_addr, res->ai_addrlen);
    freeaddrinfo(res);

    if (rc < 0 && errno != EINPROGRESS) {
        LOG_WARN("[Transport] Connect to " << host << ":" << port << " failed: " << strerror(errno));
        ::close(sock);
        return HeosError::ConnectError;
    }

    if (rc < 0) {
        struct pollfd pfd = {sock, POLLOUT, 0};
        int ready = poll(&pfd, 1, static_cast<int>(timeoutMs));
        if (ready <= 0) {
            LOG_WARN("[Transport] Connect to " << host << ":" << port << " timed out");
            ::close(sock);
            return HeosError::ConnectError;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0) {
            LOG_WARN("[Transport] Connect to " << host << ":" << port << " failed: " << strerror(soError));
            ::close(sock);
            return HeosError::ConnectError;
        }
    }

    // Back to blocking mode for the reader thread
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);

    {
        std::lock_guard<std::mutex> lock(m_sendMutex);
        m_socket = sock;
        m_connected.store(true, std::memory_order_release);
    }

    LOG_INFO("[Transport] Connected to " << host << ":" << port);
    return HeosError::None;
}

void Transport::close() {
    std::lock_guard<std::mutex> lock(m_sendMutex);
    m_connected.store(false, std::memory_order_release);
    if (m_socket >= 0) {
        // Shutdown the socket to unblock any pending read
        shutdown(m_socket, SHUT_RDWR);
    }
}

void Transport::releaseSocket() {
    std::lock_guard<std::mutex> lock(m_sendMutex);
    if (m_socket >= 0) {
        ::close(m_socket);
        m_socket = -1;
    }
}

bool Transport::isConnected() const {
    return m_connected.load(std::memory_order_acquire);
}

// ============================================
// Send
// ============================================

bool Transport::send(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_sendMutex);
    if (!m_connected.load(std::memory_order_acquire) || m_socket < 0) {
        return false;
    }

    // Line and terminator in one write to avoid small packets
    std::string frame = line;
    frame += "\r\n";
    if (!sendAll(frame.data(), frame.size())) {
        LOG_WARN("[Transport] Send failed: " << strerror(errno));
        m_connected.store(false, std::memory_order_release);
        shutdown(m_socket, SHUT_RDWR);
        return false;
    }
    return true;
}

bool Transport::sendAll(const void* buf, size_t len) {
    const uint8_t* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        ssize_t n = ::send(m_socket, ptr, remaining, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= n;
    }
    return true;
}

// ============================================
// Receive
// ============================================

bool Transport::extractLine(std::string& line, bool& oversize) {
    oversize = false;
    while (true) {
        size_t nl = m_buffer.find('\n', m_scanPos);
        if (nl == std::string::npos) {
            m_scanPos = m_buffer.size();
            oversize = m_buffer.size() > m_maxMessageBytes;
            return false;
        }

        size_t end = nl;
        if (end > 0 && m_buffer[end - 1] == '\r') end--;
        if (end > m_maxMessageBytes) {
            oversize = true;
            return false;
        }
        line.assign(m_buffer, 0, end);
        m_buffer.erase(0, nl + 1);
        m_scanPos = 0;

        // Blank keep-alive lines carry nothing
        if (!line.empty()) return true;
    }
}

ReceiveStatus Transport::receive(std::string& line) {
    char chunk[8192];

    while (true) {
        bool oversize = false;
        if (extractLine(line, oversize)) {
            return ReceiveStatus::Message;
        }
        if (oversize) {
            LOG_ERROR("[Transport] Message exceeds " << m_maxMessageBytes
                      << " bytes without terminator, closing connection");
            m_buffer.clear();
            m_scanPos = 0;
            close();
            return ReceiveStatus::ProtocolError;
        }

        int sock = m_socket;
        if (sock < 0 || !m_connected.load(std::memory_order_acquire)) {
            return ReceiveStatus::Closed;
        }

        ssize_t n = recv(sock, chunk, sizeof(chunk), 0);
        if (n > 0) {
            m_buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;

        if (n == 0) {
            LOG_DEBUG("[Transport] Connection closed by peer");
        } else if (m_connected.load(std::memory_order_acquire)) {
            LOG_WARN("[Transport] Read error: " << strerror(errno));
        }
        m_connected.store(false, std::memory_order_release);
        return ReceiveStatus::Closed;
    }
}
