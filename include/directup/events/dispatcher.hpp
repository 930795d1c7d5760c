/**
 * @file dispatcher.hpp
 * @brief Fire-and-forget delivery of events onto an EventBus
 *
 * The upload pipeline posts events here instead of emitting directly, so a
 * slow observer never stalls a transfer worker. One background thread
 * drains the queue in posting order.
 */

#pragma once

#include "directup/events/event_bus.hpp"
#include "directup/events/event_queue.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace directup::events {

class EventDispatcher {
public:
    explicit EventDispatcher(EventBus& bus);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief Queue an event for delivery; never waits on handlers
     *
     * After stop() the event is delivered synchronously instead of dropped.
     */
    template<typename EventType>
    void post(EventType event) {
        {
            std::lock_guard lock(mutex_);
            ++pending_;
        }
        auto job = [this, e = std::move(event)]() { bus_.emit(e); };
        if (!queue_.push(job)) {
            job();
            finish_one();
        }
    }

    /// Blocks until every event posted so far has been delivered.
    void flush();

    /// Delivers what is queued, then joins the worker. Idempotent.
    void stop();

    EventBus& bus() noexcept { return bus_; }

private:
    void run();
    void finish_one();

    EventBus& bus_;
    ThreadSafeQueue<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::size_t pending_ = 0;
    std::thread worker_;
};

} // namespace directup::events
