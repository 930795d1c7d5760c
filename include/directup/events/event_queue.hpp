/**
 * @file event_queue.hpp
 * @brief Blocking FIFO handing work from producers to a consumer thread
 *
 * EXAMPLE:
 * ThreadSafeQueue<Job> queue;
 * queue.push(job);            // producer, never blocks
 * while (auto job = queue.pop()) { (*job)(); }  // consumer
 * queue.shutdown();           // consumer drains what is left, then exits
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace directup::events {

/**
 * @brief Unbounded FIFO shared between threads
 *
 * pop() sleeps on a condition variable until an item arrives or the queue
 * is shut down; items pushed before shutdown() are still handed out.
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /// Returns false once shutdown() has been called; the item is dropped.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /// Waits for an item. nullopt means shut down and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return take_front();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    // Caller holds mutex_.
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace directup::events
