/**
 * @file cancellation.hpp
 * @brief Single-signal cancellation for an upload batch
 *
 * A CancellationSource owns the signal; CancellationTokens are cheap copies
 * handed to the scheduler and to each in-flight transfer. Transfers register
 * an abort callback so blocking socket I/O can be interrupted instead of
 * polled.
 *
 * EXAMPLE:
 * CancellationSource source;
 * uploader.upload_files(files, "session-42", source.token());
 * // from another thread:
 * source.cancel();
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace directup {

class CancellationToken {
public:
    using Callback = std::function<void()>;

    /// A default-constructed token can never be cancelled.
    CancellationToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool can_be_cancelled() const noexcept { return state_ != nullptr; }

    /**
     * @brief Register a callback run once on cancellation
     *
     * If the token is already cancelled the callback runs immediately on the
     * calling thread. Returns 0 when nothing was registered.
     */
    std::size_t on_cancel(Callback callback) const {
        if (!state_) {
            return 0;
        }
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->cancelled.load(std::memory_order_acquire)) {
                const auto id = ++state_->next_id;
                state_->callbacks.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove_callback(std::size_t id) const {
        if (!state_ || id == 0) {
            return;
        }
        std::lock_guard lock(state_->mutex);
        state_->callbacks.erase(id);
    }

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::size_t next_id = 0;
        std::unordered_map<std::size_t, Callback> callbacks;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /// Idempotent. Callbacks run on the cancelling thread, outside the lock.
    void cancel() {
        std::vector<CancellationToken::Callback> pending;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            for (auto& [id, callback] : state_->callbacks) {
                pending.push_back(std::move(callback));
            }
            state_->callbacks.clear();
        }
        for (auto& callback : pending) {
            callback();
        }
    }

private:
    std::shared_ptr<CancellationToken::State> state_;
};

} // namespace directup
