/**
 * @file CommandCorrelator.h
 * @brief Matches HEOS responses to outstanding commands
 *
 * submit() sends a command and blocks the calling thread until the
 * structurally matching response arrives, the timeout elapses, or the
 * connection drops. Commands with different correlation keys may be
 * outstanding at the same time; a command whose key is already outstanding
 * queues behind it (inside its own timeout budget).
 */

#ifndef HEOSLINK_COMMAND_CORRELATOR_H
#define HEOSLINK_COMMAND_CORRELATOR_H

#include "HeosMessages.h"
#include "HeosTypes.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

struct CommandResult {
    HeosError error = HeosError::None;
    int errorId = 0;            // HEOS eid for CommandError
    std::string errorText;
    HeosMessage response;       // valid when ok()

    bool ok() const { return error == HeosError::None; }

    static CommandResult failure(HeosError error, std::string text = std::string());
};

class CommandCorrelator {
public:
    // Writes one line to the transport; false if the line could not be sent
    using SendFunction = std::function<bool(const std::string& line)>;

    explicit CommandCorrelator(SendFunction send);
    ~CommandCorrelator();

    // Non-copyable
    CommandCorrelator(const CommandCorrelator&) = delete;
    CommandCorrelator& operator=(const CommandCorrelator&) = delete;

    /**
     * @brief Send a command and wait for its response
     *
     * Resolves exactly once: success, CommandError (device said fail),
     * ProtocolError (response unusable), Timeout, or Disconnected.
     */
    CommandResult submit(const HeosCommand& command, std::chrono::milliseconds timeout);

    /**
     * @brief Offer an inbound response (reader thread)
     * @return true if it matched an outstanding command and was consumed
     */
    bool offer(const HeosMessage& response);

    // Resolve every outstanding and queued command with the given error and
    // refuse new submissions until reopen()
    void failAll(HeosError error);
    void reopen();

    bool isOpen() const;
    size_t outstanding() const;

private:
    struct PendingCommand {
        std::string name;
        std::string target;
        uint64_t sequence = 0;
        std::chrono::steady_clock::time_point issued;
        bool done = false;
        CommandResult result;
    };

    SendFunction m_send;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, std::shared_ptr<PendingCommand>> m_pending;  // by correlation key
    std::map<std::string, std::deque<std::shared_ptr<PendingCommand>>> m_queues;
    bool m_open = true;
    uint64_t m_epoch = 0;       // bumped by failAll()
    uint64_t m_nextSequence = 1;

    std::shared_ptr<PendingCommand> findMatch(const HeosMessage& response) const;
    static void resolve(PendingCommand& pending, const HeosMessage& response);
};

#endif // HEOSLINK_COMMAND_CORRELATOR_H
