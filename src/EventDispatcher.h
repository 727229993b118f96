/**
 * @file EventDispatcher.h
 * @brief Demultiplexes the inbound HEOS message stream
 *
 * The reader thread hands every line to dispatch(). Responses go to the
 * correlator; events are decoded into HeosEvent, applied by the internal
 * handler (registry) on the reader thread, then queued to subscribers.
 *
 * Each subscriber owns a bounded queue drained by its own worker thread,
 * so it sees events in wire order and can never stall the reader. When a
 * queue is full the new event is dropped for that subscriber only.
 */

#ifndef HEOSLINK_EVENT_DISPATCHER_H
#define HEOSLINK_EVENT_DISPATCHER_H

#include "CommandCorrelator.h"
#include "HeosMessages.h"

#include <atomic>
#include <bitset>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class DispatchResult {
    Response,           // consumed by the correlator
    UnmatchedResponse,  // response with no outstanding command, discarded
    Event,              // decoded and routed
    UnknownEvent,       // event name outside the known set, dropped
    Malformed           // not a HEOS message, dropped
};

class EventDispatcher {
public:
    using EventCallback = std::function<void(const HeosEvent& event)>;
    using SubscriptionId = uint64_t;

    EventDispatcher(CommandCorrelator& correlator, size_t queueCapacity);
    ~EventDispatcher();

    // Non-copyable
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Runs on the reader thread before subscribers are queued
    void setInternalHandler(EventCallback handler) { m_internalHandler = std::move(handler); }

    // Classify and route one inbound line (reader thread)
    DispatchResult dispatch(const std::string& line);

    // Queue an event to subscribers only (derived events such as PlayerAdded)
    void publish(const HeosEvent& event);

    SubscriptionId subscribe(EventType type, EventCallback callback);
    SubscriptionId subscribe(const std::vector<EventType>& types, EventCallback callback);
    bool unsubscribe(SubscriptionId id);

    // Stop and join all subscriber workers
    void stop();

    uint64_t droppedEvents() const { return m_dropped.load(std::memory_order_relaxed); }
    size_t subscriberCount() const;

private:
    struct Subscriber {
        SubscriptionId id = 0;
        std::bitset<EVENT_TYPE_COUNT> types;
        EventCallback callback;

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<HeosEvent> queue;
        bool stopping = false;
        std::thread worker;
    };

    CommandCorrelator& m_correlator;
    size_t m_queueCapacity;
    EventCallback m_internalHandler;

    mutable std::mutex m_subscribersMutex;
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> m_subscribers;
    SubscriptionId m_nextId = 1;
    std::atomic<uint64_t> m_dropped{0};

    void enqueue(Subscriber& subscriber, const HeosEvent& event);
    static void runWorker(std::shared_ptr<Subscriber> subscriber);
    static void stopWorker(Subscriber& subscriber);
};

#endif // HEOSLINK_EVENT_DISPATCHER_H
