// context.hpp - Cancellation and deadline scope for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace NetGauge {
    enum class ContextError : uint8_t {
        NONE = 0,
        CANCELLED,
        DEADLINE_EXCEEDED,
    };

    // A Context is shared by everything running on behalf of one scope (the server, one session, one transfer).
    // Cancelling a context cancels all of its children. A child's deadline is never later than its parent's.
    class Context : public std::enable_shared_from_this<Context> {
        public:
            using pointer = std::shared_ptr<Context>;
            using clock = std::chrono::steady_clock;

            // RAII registration of a cancellation callback. Destroying it waits for a running callback to finish.
            class Subscription {
                public:
                    Subscription() = default;
                    Subscription(pointer ctx, uint64_t id) : mCtx(std::move(ctx)), mID(id) {}
                    ~Subscription() { reset(); }
                    Subscription(Subscription&& other) noexcept : mCtx(std::move(other.mCtx)), mID(other.mID) {}
                    Subscription& operator=(Subscription&& other) noexcept;
                    Subscription(const Subscription&) = delete;
                    Subscription& operator=(const Subscription&) = delete;

                    void reset();

                private:
                    pointer mCtx;
                    uint64_t mID = 0;
            };

            // Root context, never cancelled by itself and without a deadline
            static pointer background();
            static pointer withCancel(const pointer& parent);
            static pointer withDeadline(const pointer& parent, clock::time_point deadline);
            static pointer withTimeout(const pointer& parent, clock::duration timeout);

            ~Context();

            // Cancel this context and every live child
            void cancel();

            // NONE while the context is live
            ContextError err() const;
            bool done() const { return err() != ContextError::NONE; }
            std::optional<clock::time_point> deadline() const { return mDeadline; }

            // Block until the context is done
            void wait() const;

            // Register a callback invoked once on cancellation (not on deadline; waiters use deadline() for that).
            // If already cancelled the callback runs immediately.
            [[nodiscard]] Subscription onCancel(std::function<void()> callback);

            // Wait on cv until pred() holds or the context is done. Returns pred().
            // The caller must also wake cv from an onCancel() callback that takes the same mutex.
            template <typename Predicate>
            bool waitUntil(std::unique_lock<std::mutex>& lock, std::condition_variable& cv, Predicate pred) const {
                while (!pred()) {
                    if (done()) {
                        return false;
                    }
                    if (mDeadline) {
                        cv.wait_until(lock, *mDeadline);
                    } else {
                        cv.wait(lock);
                    }
                }
                return true;
            }

        private:
            Context() = default;

            void mCancel(ContextError reason);
            void mUnsubscribe(uint64_t id);

            static pointer mMakeChild(const pointer& parent, std::optional<clock::time_point> deadline);

            mutable std::mutex mMutex;
            mutable std::condition_variable mDoneCv;
            ContextError mErr = ContextError::NONE;
            std::optional<clock::time_point> mDeadline;
            std::vector<std::weak_ptr<Context>> mChildren;

            std::mutex mCallbackMutex; // Held while callbacks run
            std::map<uint64_t, std::function<void()>> mCallbacks;
            uint64_t mNextID = 1;
    };
}
