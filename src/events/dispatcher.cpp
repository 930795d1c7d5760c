#include "directup/events/dispatcher.hpp"

namespace directup::events {

EventDispatcher::EventDispatcher(EventBus& bus)
    : bus_(bus),
      worker_([this]() { run(); }) {}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::flush() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return pending_ == 0; });
}

void EventDispatcher::stop() {
    queue_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void EventDispatcher::run() {
    while (auto job = queue_.pop()) {
        (*job)();
        finish_one();
    }
}

void EventDispatcher::finish_one() {
    {
        std::lock_guard lock(mutex_);
        --pending_;
    }
    idle_cv_.notify_all();
}

} // namespace directup::events
