/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <memory>
#include <mutex>

namespace nsd {

/**
 * Lets asynchronous handlers find out whether the object which issued them still exists.
 *
 * The owner keeps a LifetimeGuard as a member and calls invalidate() first thing in its destructor. Handlers capture
 * get_weak() instead of relying on a raw this pointer alone, and start with LifetimeGuard::lock(). A valid Lock holds
 * the mutex of the guard, so the owner can't finish invalidating while the handler runs. The same mutex is meant to
 * guard the state of the owner.
 *
 * Don't call invalidate() (or destroy the owner) while holding a Lock on the same guard.
 */
class LifetimeGuard {
  public:
    struct State {
        std::mutex mutex;
        bool alive {true};
    };

    /**
     * Holds the mutex of a guard for as long as it exists. Evaluates to false when the owner was gone, in which case
     * nothing is held.
     */
    class Lock {
      public:
        Lock() = default;

        explicit Lock(std::shared_ptr<State> state) : state_(std::move(state)), lock_(state_->mutex) {
            if (!state_->alive) {
                lock_.unlock();
                state_.reset();
            }
        }

        explicit operator bool() const {
            return state_ != nullptr;
        }

      private:
        std::shared_ptr<State> state_;
        std::unique_lock<std::mutex> lock_;
    };

    LifetimeGuard() : state_(std::make_shared<State>()) {}

    ~LifetimeGuard() {
        invalidate();
    }

    LifetimeGuard(const LifetimeGuard&) = delete;
    LifetimeGuard& operator=(const LifetimeGuard&) = delete;

    LifetimeGuard(LifetimeGuard&&) = delete;
    LifetimeGuard& operator=(LifetimeGuard&&) = delete;

    /**
     * Marks the owner as gone. Waits for handlers which currently hold a Lock. Afterwards no Lock will be valid.
     */
    void invalidate() {
        std::lock_guard guard(state_->mutex);
        state_->alive = false;
    }

    /**
     * @return The mutex shared with the handlers, for guarding the state of the owner.
     */
    [[nodiscard]] std::mutex& mutex() const {
        return state_->mutex;
    }

    /**
     * @return A weak reference for handlers to capture.
     */
    [[nodiscard]] std::weak_ptr<State> get_weak() const {
        return state_;
    }

    /**
     * Locks the guard referenced by given weak reference.
     * @param weak The weak reference, obtained through get_weak().
     * @return A valid Lock if the owner is still alive, an invalid Lock otherwise.
     */
    [[nodiscard]] static Lock lock(const std::weak_ptr<State>& weak) {
        auto state = weak.lock();
        if (!state) {
            return {};
        }
        return Lock(std::move(state));
    }

    /**
     * Checks whether the owner is still alive, without keeping the mutex locked.
     * @param weak The weak reference, obtained through get_weak().
     * @return True if the owner is alive.
     */
    [[nodiscard]] static bool is_alive(const std::weak_ptr<State>& weak) {
        return static_cast<bool>(lock(weak));
    }

  private:
    std::shared_ptr<State> state_;
};

}  // namespace nsd
