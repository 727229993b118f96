/**
 * @file Transport.h
 * @brief Line-framed TCP transport to one HEOS device
 *
 * Owns the socket to the device's CLI port. Outbound lines get the CRLF
 * terminator appended; inbound bytes are buffered until a full line is
 * available. One thread calls receive() in a loop, any thread may send().
 */

#ifndef HEOSLINK_TRANSPORT_H
#define HEOSLINK_TRANSPORT_H

#include "HeosTypes.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

enum class ReceiveStatus {
    Message,        // one complete line stored in the output argument
    Closed,         // peer closed, read error, or close() called
    ProtocolError   // line exceeded the framing limit, connection shut down
};

class Transport {
public:
    explicit Transport(size_t maxMessageBytes = 1024 * 1024);
    ~Transport();

    // Non-copyable
    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    /**
     * @brief Open the TCP connection
     * @return HeosError::None or HeosError::ConnectError
     */
    HeosError connect(const std::string& host, uint16_t port, unsigned int timeoutMs);

    // Shut the socket down; unblocks a pending receive()
    void close();

    bool isConnected() const;

    // Send one message (terminator appended). Fails if not connected.
    bool send(const std::string& line);

    /**
     * @brief Block until the next complete message arrives
     *
     * Not restartable: once Closed or ProtocolError is returned the
     * connection is gone and connect() must be called again.
     */
    ReceiveStatus receive(std::string& line);

    const std::string& host() const { return m_host; }
    uint16_t port() const { return m_port; }

private:
    int m_socket = -1;
    std::atomic<bool> m_connected{false};
    std::mutex m_sendMutex;  // Protects socket writes and shutdown

    std::string m_host;
    uint16_t m_port = 0;
    size_t m_maxMessageBytes;

    // Inbound framing state (reader thread only)
    std::string m_buffer;
    size_t m_scanPos = 0;

    bool extractLine(std::string& line, bool& oversize);
    bool sendAll(const void* buf, size_t len);
    void releaseSocket();
};

#endif // HEOSLINK_TRANSPORT_H
