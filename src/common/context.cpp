// context.cpp - Cancellation and deadline scope for NetGauge
// Copyright (C) 2025 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <netgauge/common/context.hpp>

#include <algorithm>

namespace NetGauge {
    Context::Subscription& Context::Subscription::operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            mCtx = std::move(other.mCtx);
            mID = other.mID;
        }
        return *this;
    }

    void Context::Subscription::reset() {
        if (mCtx) {
            mCtx->mUnsubscribe(mID);
            mCtx.reset();
        }
    }

    Context::pointer Context::background() {
        return pointer(new Context());
    }

    Context::pointer Context::withCancel(const pointer& parent) {
        return mMakeChild(parent, std::nullopt);
    }

    Context::pointer Context::withDeadline(const pointer& parent, clock::time_point deadline) {
        return mMakeChild(parent, deadline);
    }

    Context::pointer Context::withTimeout(const pointer& parent, clock::duration timeout) {
        return mMakeChild(parent, clock::now() + timeout);
    }

    Context::pointer Context::mMakeChild(const pointer& parent, std::optional<clock::time_point> deadline) {
        pointer child(new Context());

        if (!parent) {
            child->mDeadline = deadline;
            return child;
        }

        auto parentDeadline = parent->deadline();
        if (parentDeadline && (!deadline || *parentDeadline < *deadline)) {
            deadline = parentDeadline;
        }
        child->mDeadline = deadline;

        ContextError parentErr = ContextError::NONE;
        {
            std::lock_guard<std::mutex> lock(parent->mMutex);
            parentErr = parent->mErr;
            if (parentErr == ContextError::NONE) {
                auto& children = parent->mChildren;
                children.erase(std::remove_if(children.begin(), children.end(),
                    [](const std::weak_ptr<Context>& c) { return c.expired(); }), children.end());
                children.push_back(child);
            }
        }

        if (parentErr == ContextError::CANCELLED) {
            child->mCancel(ContextError::CANCELLED);
        }

        return child;
    }

    Context::~Context() = default;

    void Context::cancel() {
        mCancel(ContextError::CANCELLED);
    }

    void Context::mCancel(ContextError reason) {
        std::vector<std::weak_ptr<Context>> children;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mErr != ContextError::NONE) {
                return;
            }
            // A deadline that already passed stays the reported cause
            if (mDeadline && clock::now() >= *mDeadline) {
                reason = ContextError::DEADLINE_EXCEEDED;
            }
            mErr = reason;
            children.swap(mChildren);
        }
        mDoneCv.notify_all();

        {
            std::lock_guard<std::mutex> lock(mCallbackMutex);
            for (auto& [id, callback] : mCallbacks) {
                if (callback) {
                    callback();
                }
            }
            mCallbacks.clear();
        }

        for (auto& weak : children) {
            if (auto child = weak.lock()) {
                child->mCancel(ContextError::CANCELLED);
            }
        }
    }

    ContextError Context::err() const {
        std::lock_guard<std::mutex> lock(mMutex);
        if (mErr != ContextError::NONE) {
            return mErr;
        }
        if (mDeadline && clock::now() >= *mDeadline) {
            return ContextError::DEADLINE_EXCEEDED;
        }
        return ContextError::NONE;
    }

    void Context::wait() const {
        std::unique_lock<std::mutex> lock(mMutex);
        while (mErr == ContextError::NONE) {
            if (mDeadline) {
                if (clock::now() >= *mDeadline) {
                    return;
                }
                mDoneCv.wait_until(lock, *mDeadline);
            } else {
                mDoneCv.wait(lock);
            }
        }
    }

    Context::Subscription Context::onCancel(std::function<void()> callback) {
        std::unique_lock<std::mutex> callbackLock(mCallbackMutex);

        bool cancelled = false;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            cancelled = mErr != ContextError::NONE;
        }

        if (cancelled) {
            callbackLock.unlock();
            if (callback) {
                callback();
            }
            return Subscription();
        }

        uint64_t id = mNextID++;
        mCallbacks.emplace(id, std::move(callback));
        return Subscription(shared_from_this(), id);
    }

    void Context::mUnsubscribe(uint64_t id) {
        std::lock_guard<std::mutex> lock(mCallbackMutex);
        mCallbacks.erase(id);
    }
}
