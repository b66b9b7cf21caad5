// channel.hpp - Bounded hand-off channel for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <netgauge/common/context.hpp>

namespace NetGauge {
    // A fixed-capacity queue between one producer thread and its consumers.
    // Both ends race their wait against the governing context: whichever happens first wins.
    template <typename T>
    class Channel {
        public:
            Channel(Context::pointer ctx, size_t capacity = 1)
                : mCtx(std::move(ctx)), mCapacity(capacity == 0 ? 1 : capacity)
            {
                mCancelSub = mCtx->onCancel([this]() {
                    std::lock_guard<std::mutex> lock(mMutex);
                    mCv.notify_all();
                });
            }

            Channel(const Channel&) = delete;
            Channel& operator=(const Channel&) = delete;

            // Blocks while full. Returns false if the context finished first.
            bool push(T value) {
                std::unique_lock<std::mutex> lock(mMutex);
                if (!mCtx->waitUntil(lock, mCv, [this]() { return mQueue.size() < mCapacity; })) {
                    return false;
                }
                mQueue.push_back(std::move(value));
                mCv.notify_all();
                return true;
            }

            // Blocks while empty. Returns nullopt if the context finished first.
            std::optional<T> pop() {
                std::unique_lock<std::mutex> lock(mMutex);
                if (!mCtx->waitUntil(lock, mCv, [this]() { return !mQueue.empty(); })) {
                    return std::nullopt;
                }
                // Data prepared before the deadline is not handed out after it
                if (mCtx->done()) {
                    return std::nullopt;
                }
                T value = std::move(mQueue.front());
                mQueue.pop_front();
                mCv.notify_all();
                return value;
            }

            const Context::pointer& context() const { return mCtx; }

        private:
            Context::pointer mCtx;
            size_t mCapacity;
            std::mutex mMutex;
            std::condition_variable mCv;
            std::deque<T> mQueue;
            Context::Subscription mCancelSub; // Declared last so it is released first
    };
}
