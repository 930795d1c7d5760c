/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe hub for pipeline and authority events
 *
 * Producers (scheduler, reconciler, authority) emit events without knowing
 * who listens; the logger, metrics and observer bridge subscribe without
 * knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<FileCompletedEvent>([](const FileCompletedEvent& e) { ... });
 * bus.emit(FileCompletedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace directup::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit/subscribe/unsubscribe may be called from any thread
 * - Handlers run synchronously on the emitting thread; use EventDispatcher
 *   when the emitter must not wait on handlers
 */
class EventBus {
public:
    using SubscriptionId = std::size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Registers `handler` for EventType; the id is what unsubscribe() takes.
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        SubscriptionId id = next_id_++;
        subscriptions_[key_of<EventType>()].push_back(
            Subscription{id, std::make_shared<TypedHandler<EventType>>(std::move(handler))});
        return id;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto slot = subscriptions_.find(key_of<EventType>());
        if (slot == subscriptions_.end()) {
            return;
        }
        auto& list = slot->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   list.end());
        if (list.empty()) {
            subscriptions_.erase(slot);
        }
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * The handler list is snapshotted first, so a handler may subscribe or
     * unsubscribe while being called. A throwing handler is logged and the
     * remaining handlers still run.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        for (const auto& handler : snapshot(key_of<EventType>())) {
            try {
                handler->invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto slot = subscriptions_.find(key_of<EventType>());
        return slot == subscriptions_.end() ? 0 : slot->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscriptions_.clear();
    }

private:
    struct Handler {
        virtual ~Handler() = default;
        virtual void invoke(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : Handler {
        explicit TypedHandler(std::function<void(const EventType&)> f) : fn(std::move(f)) {}

        // Stored only under key_of<EventType>(), so the cast is exact.
        void invoke(const void* event) override { fn(*static_cast<const EventType*>(event)); }

        std::function<void(const EventType&)> fn;
    };

    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<Handler> handler;
    };

    template<typename EventType>
    static std::type_index key_of() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<Handler>> snapshot(std::type_index key) const {
        std::shared_lock lock(mutex_);
        std::vector<std::shared_ptr<Handler>> handlers;
        auto slot = subscriptions_.find(key);
        if (slot != subscriptions_.end()) {
            handlers.reserve(slot->second.size());
            for (const auto& subscription : slot->second) {
                handlers.push_back(subscription.handler);
            }
        }
        return handlers;
    }

    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace directup::events
