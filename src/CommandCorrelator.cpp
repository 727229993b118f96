/**
 * @file CommandCorrelator.cpp
 * @brief Command/response correlation implementation
 */

#include "CommandCorrelator.h"
#include "LogLevel.h"

#include <algorithm>
#include <utility>

CommandResult CommandResult::failure(HeosError error, std::string text) {
    CommandResult result;
    result.error = error;
    result.errorText = std::move(text);
    return result;
}

CommandCorrelator::CommandCorrelator(SendFunction send)
    : m_send(std::move(send))
{
}

CommandCorrelator::~CommandCorrelator() {
    failAll(HeosError::Disconnected);
}

// ============================================
// Submit
// ============================================

CommandResult CommandCorrelator::submit(const HeosCommand& command, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string key = command.correlationKey();

    auto pending = std::make_shared<PendingCommand>();
    pending->name = command.name();
    pending->target = command.target();

    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_open) {
        return CommandResult::failure(HeosError::Disconnected, "not connected");
    }

    const uint64_t epoch = m_epoch;

    // Same-key commands run one at a time, in submission order
    m_queues[key].push_back(pending);
    bool admitted = m_cv.wait_until(lock, deadline, [&]() {
        return !m_open || m_epoch != epoch
            || (m_pending.count(key) == 0 && m_queues[key].front() == pending);
    });

    auto& waiting = m_queues[key];
    waiting.erase(std::find(waiting.begin(), waiting.end(), pending));
    if (waiting.empty()) m_queues.erase(key);

    if (!m_open || m_epoch != epoch) {
        m_cv.notify_all();
        return CommandResult::failure(HeosError::Disconnected, "connection lost");
    }
    if (!admitted) {
        LOG_WARN("[Correlator] " << key << " still busy, gave up waiting");
        m_cv.notify_all();
        return CommandResult::failure(HeosError::Timeout, "timed out waiting behind " + key);
    }

    pending->sequence = m_nextSequence++;
    pending->issued = std::chrono::steady_clock::now();
    m_pending[key] = pending;
    lock.unlock();

    LOG_DEBUG("[Correlator] -> " << command.toLogString());
    bool sent = m_send(command.toWire());

    lock.lock();
    if (!sent && !pending->done) {
        pending->done = true;
        pending->result = CommandResult::failure(HeosError::Disconnected, "send failed");
    }

    m_cv.wait_until(lock, deadline, [&]() { return pending->done; });
    if (!pending->done) {
        pending->done = true;
        pending->result = CommandResult::failure(HeosError::Timeout, "no response to " + command.name());
        LOG_WARN("[Correlator] Timeout waiting for " << key);
    }

    auto it = m_pending.find(key);
    if (it != m_pending.end() && it->second == pending) {
        m_pending.erase(it);
    }
    m_cv.notify_all();

    if (pending->result.ok()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pending->issued);
        LOG_DEBUG("[Correlator] <- " << key << " (" << elapsed.count() << " ms)");
    }
    return pending->result;
}

// ============================================
// Inbound
// ============================================

std::shared_ptr<CommandCorrelator::PendingCommand>
CommandCorrelator::findMatch(const HeosMessage& response) const {
    const std::string target = response.target();
    std::shared_ptr<PendingCommand> untargeted;
    std::shared_ptr<PendingCommand> oldest;

    for (const auto& entry : m_pending) {
        const auto& pending = entry.second;
        if (pending->done || pending->name != response.command) continue;

        if (!target.empty()) {
            if (pending->target == target) return pending;
            if (pending->target.empty() && !untargeted) untargeted = pending;
            continue;
        }
        if (!oldest || pending->sequence < oldest->sequence) {
            oldest = pending;
        }
    }
    return target.empty() ? oldest : untargeted;
}

void CommandCorrelator::resolve(PendingCommand& pending, const HeosMessage& response) {
    pending.done = true;
    if (response.isSuccess()) {
        pending.result = CommandResult();
        pending.result.response = response;
    } else if (response.isFailure()) {
        pending.result = CommandResult::failure(HeosError::CommandError, response.errorText());
        pending.result.errorId = response.errorId();
        pending.result.response = response;
    } else {
        pending.result = CommandResult::failure(HeosError::ProtocolError,
                                                "unexpected result '" + response.result + "'");
    }
}

bool CommandCorrelator::offer(const HeosMessage& response) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto match = findMatch(response);
    if (!match) {
        return false;
    }

    if (response.isUnderProcess()) {
        // Interim answer, the real one follows on the same key
        LOG_DEBUG("[Correlator] " << response.command << " under process");
        return true;
    }

    resolve(*match, response);
    if (!match->result.ok()) {
        LOG_DEBUG("[Correlator] " << response.command << " failed: "
                  << toString(match->result.error) << " " << match->result.errorText);
    }
    m_cv.notify_all();
    return true;
}

// ============================================
// Lifecycle
// ============================================

void CommandCorrelator::failAll(HeosError error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = false;
    m_epoch++;

    size_t failed = 0;
    for (auto& entry : m_pending) {
        auto& pending = entry.second;
        if (pending->done) continue;
        pending->done = true;
        pending->result = CommandResult::failure(error, "connection lost");
        failed++;
    }
    if (failed > 0) {
        LOG_DEBUG("[Correlator] Resolved " << failed << " outstanding command(s): " << toString(error));
    }
    m_cv.notify_all();
}

void CommandCorrelator::reopen() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = true;
}

bool CommandCorrelator::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_open;
}

size_t CommandCorrelator::outstanding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}
