#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace relaunch::infra {

/**
 * @brief Tracks the pool tasks an object has queued on an AsioContext.
 *
 * Tasks capture a Token instead of relying on the owner alone. A task that
 * starts after close() sees a closed token and must not touch its owner; the
 * token only refers to shared state, so this is safe even when the owner is
 * gone and the pool is started later. close() waits for the tasks that are
 * already running.
 */
class WorkTracker {
    struct State {
        std::mutex mutex;
        std::condition_variable idle;
        size_t active{0};
        bool closed{false};
    };

public:
    /**
     * @brief Admission of one task. Converts to false when the tracker was closed.
     */
    class Scope {
    public:
        explicit Scope(std::shared_ptr<State> state) : state_(std::move(state)) {
            std::lock_guard lock(state_->mutex);
            if (!state_->closed) {
                ++state_->active;
                entered_ = true;
            }
        }

        ~Scope() {
            if (!entered_) {
                return;
            }
            std::lock_guard lock(state_->mutex);
            --state_->active;
            state_->idle.notify_all();
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        explicit operator bool() const { return entered_; }

    private:
        std::shared_ptr<State> state_;
        bool entered_{false};
    };

    using Token = std::shared_ptr<State>;

    Token token() const { return state_; }

    /**
     * @brief Refuses tasks that have not started yet and waits for running ones.
     *
     * Must not be called from one of the tracked tasks.
     */
    void close() {
        std::unique_lock lock(state_->mutex);
        state_->closed = true;
        state_->idle.wait(lock, [this]() { return state_->active == 0; });
    }

    bool isClosed() const {
        std::lock_guard lock(state_->mutex);
        return state_->closed;
    }

private:
    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace relaunch::infra
