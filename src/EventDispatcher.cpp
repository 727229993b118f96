/**
 * @file EventDispatcher.cpp
 * @brief Inbound message routing and subscriber queues
 */

#include "EventDispatcher.h"
#include "LogLevel.h"

#include <exception>
#include <utility>

EventDispatcher::EventDispatcher(CommandCorrelator& correlator, size_t queueCapacity)
    : m_correlator(correlator)
    , m_queueCapacity(queueCapacity > 0 ? queueCapacity : 1)
{
}

EventDispatcher::~EventDispatcher() {
    stop();
}

// ============================================
// Routing (reader thread)
// ============================================

DispatchResult EventDispatcher::dispatch(const std::string& line) {
    HeosMessage message;
    if (!parseHeosMessage(line, message)) {
        LOG_WARN("[Dispatch] Dropping unparseable message: " << line.substr(0, 160));
        return DispatchResult::Malformed;
    }

    if (!message.isEvent()) {
        if (m_correlator.offer(message)) {
            return DispatchResult::Response;
        }
        LOG_DEBUG("[Dispatch] Discarding unmatched response: " << message.command
                  << (message.message.empty() ? "" : " ") << message.message);
        return DispatchResult::UnmatchedResponse;
    }

    HeosEvent event;
    if (!decodeEvent(message, event)) {
        LOG_DEBUG("[Dispatch] Dropping unknown or incomplete event: " << message.command
                  << " " << message.message);
        return DispatchResult::UnknownEvent;
    }

    LOG_DEBUG("[Dispatch] Event " << event.name << " (" << toString(event.type) << ")"
              << (message.message.empty() ? "" : " ") << message.message);

    if (m_internalHandler) {
        m_internalHandler(event);
    }
    publish(event);
    return DispatchResult::Event;
}

void EventDispatcher::publish(const HeosEvent& event) {
    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    const size_t bit = static_cast<size_t>(event.type);
    for (auto& entry : m_subscribers) {
        if (entry.second->types.test(bit)) {
            enqueue(*entry.second, event);
        }
    }
}

void EventDispatcher::enqueue(Subscriber& subscriber, const HeosEvent& event) {
    {
        std::lock_guard<std::mutex> lock(subscriber.mutex);
        if (subscriber.stopping) return;
        if (subscriber.queue.size() >= m_queueCapacity) {
            uint64_t dropped = m_dropped.fetch_add(1, std::memory_order_relaxed) + 1;
            LOG_WARN("[Dispatch] Subscriber " << subscriber.id << " queue full, dropped "
                     << toString(event.type) << " (total dropped " << dropped << ")");
            return;
        }
        subscriber.queue.push_back(event);
    }
    subscriber.cv.notify_one();
}

// ============================================
// Subscriptions
// ============================================

EventDispatcher::SubscriptionId EventDispatcher::subscribe(EventType type, EventCallback callback) {
    return subscribe(std::vector<EventType>{type}, std::move(callback));
}

EventDispatcher::SubscriptionId EventDispatcher::subscribe(const std::vector<EventType>& types,
                                                           EventCallback callback) {
    auto subscriber = std::make_shared<Subscriber>();
    for (EventType type : types) {
        subscriber->types.set(static_cast<size_t>(type));
    }
    subscriber->callback = std::move(callback);

    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    subscriber->id = m_nextId++;
    subscriber->worker = std::thread(&EventDispatcher::runWorker, subscriber);
    m_subscribers[subscriber->id] = subscriber;

    LOG_DEBUG("[Dispatch] Subscriber " << subscriber->id << " registered for "
              << types.size() << " event type(s)");
    return subscriber->id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id) {
    std::shared_ptr<Subscriber> subscriber;
    {
        std::lock_guard<std::mutex> lock(m_subscribersMutex);
        auto it = m_subscribers.find(id);
        if (it == m_subscribers.end()) return false;
        subscriber = it->second;
        m_subscribers.erase(it);
    }
    stopWorker(*subscriber);
    return true;
}

void EventDispatcher::stop() {
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_subscribersMutex);
        subscribers.swap(m_subscribers);
    }
    for (auto& entry : subscribers) {
        stopWorker(*entry.second);
    }
}

size_t EventDispatcher::subscriberCount() const {
    std::lock_guard<std::mutex> lock(m_subscribersMutex);
    return m_subscribers.size();
}

// ============================================
// Workers
// ============================================

void EventDispatcher::stopWorker(Subscriber& subscriber) {
    {
        std::lock_guard<std::mutex> lock(subscriber.mutex);
        subscriber.stopping = true;
        subscriber.queue.clear();
    }
    subscriber.cv.notify_all();

    if (!subscriber.worker.joinable()) return;
    if (subscriber.worker.get_id() == std::this_thread::get_id()) {
        // Unsubscribed from inside its own callback
        subscriber.worker.detach();
    } else {
        subscriber.worker.join();
    }
}

void EventDispatcher::runWorker(std::shared_ptr<Subscriber> subscriber) {
    while (true) {
        HeosEvent event;
        {
            std::unique_lock<std::mutex> lock(subscriber->mutex);
            subscriber->cv.wait(lock, [&]() {
                return subscriber->stopping || !subscriber->queue.empty();
            });
            if (subscriber->stopping) break;
            event = std::move(subscriber->queue.front());
            subscriber->queue.pop_front();
        }

        try {
            subscriber->callback(event);
        } catch (const std::exception& e) {
            LOG_ERROR("[Dispatch] Subscriber " << subscriber->id << " failed on "
                      << toString(event.type) << ": " << e.what());
        } catch (...) {
            LOG_ERROR("[Dispatch] Subscriber " << subscriber->id << " failed on "
                      << toString(event.type) << ": unknown exception");
        }
    }
}
